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

#ifndef RGBIF_STLJSON_HPP
#define RGBIF_STLJSON_HPP

#include "proto/typelib.hpp"

#include <json/json.h>

#include <string>
#include <vector>

namespace rgbif
{

/**
 * Utility class that converts the standard type library registry
 * (or parts of it) to JSON.
 */
class StlJson
{

private:

  /** The registry to read from.  */
  const TypeLib& lib;

public:

  explicit StlJson (const TypeLib& l)
    : lib(l)
  {}

  StlJson () = delete;
  StlJson (const StlJson&) = delete;
  void operator= (const StlJson&) = delete;

  /**
   * Converts a single state definition of an interface.
   */
  static Json::Value Convert (const proto::StateData& state);

  /**
   * Returns the JSON form of the library with the given name.  The
   * library must exist.
   */
  Json::Value Library (const std::string& name) const;

  /**
   * Returns the JSON form of the given standard interface.
   */
  Json::Value Interface (IfaceStandard s) const;

  /**
   * Returns a JSON object with the given libraries and optionally all
   * standard interfaces.  The format is
   *
   *  {
   *    "libraries": {"name": ...},
   *    "interfaces": {"RGB20": ...}
   *  }
   *
   * The "interfaces" member is only present if requested.
   */
  Json::Value Export (const std::vector<std::string>& libs,
                      bool withInterfaces) const;

};

} // namespace rgbif

#endif // RGBIF_STLJSON_HPP
