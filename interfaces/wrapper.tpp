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

/* Template implementation code for wrapper.hpp.  */

#include <glog/logging.h>

#include <utility>

namespace rgbif
{

template <typename T>
  bool
  InterfaceWrapper::DecodeAllGlobal (const std::string& name,
                                     const bool required,
                                     std::vector<T>& out) const
{
  CheckStateName (name, proto::GLOBAL);

  std::vector<std::string> values;
  if (!state.GetGlobal (name, values))
    {
      if (required)
        {
          LOG (WARNING)
              << standard << " contract has no global state " << name;
          return false;
        }

      out.clear ();
      return true;
    }

  std::vector<T> res;
  for (const auto& v : values)
    {
      T decoded;
      if (!StrictDeserialise (v, decoded))
        {
          LOG (WARNING)
              << standard << " contract has invalid value for " << name;
          return false;
        }
      res.push_back (std::move (decoded));
    }

  out = std::move (res);
  return true;
}

template <typename T>
  bool
  InterfaceWrapper::DecodeSingleGlobal (const std::string& name,
                                        T& out) const
{
  std::vector<T> values;
  if (!DecodeAllGlobal (name, true, values))
    return false;

  if (values.empty ())
    {
      LOG (WARNING)
          << standard << " contract has no value for global state " << name;
      return false;
    }

  out = std::move (values.front ());
  return true;
}

template <typename T>
  bool
  InterfaceWrapper::DecodeOptionalGlobal (const std::string& name,
                                          std::optional<T>& out) const
{
  std::vector<T> values;
  if (!DecodeAllGlobal (name, false, values))
    return false;

  if (values.empty ())
    out.reset ();
  else
    out = std::move (values.front ());

  return true;
}

} // namespace rgbif
