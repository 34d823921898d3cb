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

/* Template implementation code for jsonutils.hpp.  */

#include <glog/logging.h>

namespace rgbif
{

template <typename Rules>
  Json::Value
  NameToJson (const ConfinedString<Rules>& s)
{
  return s.GetString ();
}

template <typename Rules>
  bool
  NameFromJson (const Json::Value& val, ConfinedString<Rules>& s)
{
  if (!val.isString ())
    {
      VLOG (1)
          << "Invalid " << Rules::TYPE_NAME << ": " << val
          << " is not a string";
      return false;
    }

  return ConfinedString<Rules>::FromString (val.asString (), s);
}

} // namespace rgbif
