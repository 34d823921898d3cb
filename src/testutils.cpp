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

#include "testutils.hpp"

#include <glog/logging.h>

#include <sstream>

namespace rgbif
{

Json::Value
ParseJson (const std::string& str)
{
  Json::Value val;
  std::istringstream in(str);
  in >> val;
  return val;
}

bool
JsonEqual (const Json::Value& actual, const Json::Value& expected)
{
  if (expected.isArray ())
    {
      if (!actual.isArray () || actual.size () != expected.size ())
        {
          LOG (ERROR)
              << "Actual value:\n" << actual
              << "\ndoes not match expected array:\n" << expected;
          return false;
        }

      for (unsigned i = 0; i < expected.size (); ++i)
        if (!JsonEqual (actual[i], expected[i]))
          return false;

      return true;
    }

  if (expected.isObject ())
    {
      if (!actual.isObject ()
            || actual.getMemberNames () != expected.getMemberNames ())
        {
          LOG (ERROR)
              << "Actual value:\n" << actual
              << "\ndoes not match expected object:\n" << expected;
          return false;
        }

      for (const auto& key : expected.getMemberNames ())
        if (!JsonEqual (actual[key], expected[key]))
          return false;

      return true;
    }

  if (expected.isIntegral () && actual.isIntegral ())
    {
      if (expected.isUInt64 () && actual.isUInt64 ()
            && expected.asUInt64 () == actual.asUInt64 ())
        return true;
      if (expected.isInt64 () && actual.isInt64 ()
            && expected.asInt64 () == actual.asInt64 ())
        return true;
    }
  else if (actual == expected)
    return true;

  LOG (ERROR)
      << "Actual value:\n" << actual
      << "\nis not equal to expected:\n" << expected;
  return false;
}

} // namespace rgbif
