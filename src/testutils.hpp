/*
    Standard RGB contract interfaces
    Copyright (C) 2025  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef RGBIF_TESTUTILS_HPP
#define RGBIF_TESTUTILS_HPP

#include <json/json.h>

#include <string>

namespace rgbif
{

/**
 * Parses a string into JSON.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Compares two JSON values for equality.  In contrast to the operator
 * of Json::Value, integers compare equal if their values match, even if
 * one is signed and the other unsigned (as happens with values parsed
 * from golden data).  Differences are logged.
 */
bool JsonEqual (const Json::Value& actual, const Json::Value& expected);

} // namespace rgbif

#endif // RGBIF_TESTUTILS_HPP
