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

#include "features.hpp"

#include "proto/typelib.hpp"

#include <glog/logging.h>

namespace rgbif
{

namespace
{

/** All inflation variants, for parsing.  */
constexpr Inflation ALL_INFLATIONS[] =
  {
    Inflation::FIXED,
    Inflation::BURNABLE,
    Inflation::INFLATABLE,
    Inflation::INFLATABLE_BURNABLE,
    Inflation::REPLACEABLE,
  };

/**
 * Adds all transitions of the named feature of the fungible interface
 * to the set.
 */
void
AddFeatureTransitions (const proto::InterfaceData& iface,
                       const std::string& feature,
                       std::set<std::string>& out)
{
  const auto mit = iface.features ().find (feature);
  CHECK (mit != iface.features ().end ())
      << "Fungible interface has no feature " << feature;

  for (const auto& t : mit->second.transitions ())
    out.insert (t);
}

} // anonymous namespace

bool
IsFixed (const Inflation i)
{
  return i == Inflation::FIXED;
}

bool
IsInflatable (const Inflation i)
{
  return i == Inflation::INFLATABLE
            || i == Inflation::INFLATABLE_BURNABLE
            || i == Inflation::REPLACEABLE;
}

/* INFLATABLE_BURNABLE is burnable as well as inflatable.  */
bool
IsBurnable (const Inflation i)
{
  return i == Inflation::BURNABLE
            || i == Inflation::INFLATABLE_BURNABLE
            || i == Inflation::REPLACEABLE;
}

bool
IsReplaceable (const Inflation i)
{
  return i == Inflation::REPLACEABLE;
}

std::string
InflationToString (const Inflation i)
{
  switch (i)
    {
    case Inflation::FIXED:
      return "fixed";
    case Inflation::BURNABLE:
      return "burnable";
    case Inflation::INFLATABLE:
      return "inflatable";
    case Inflation::INFLATABLE_BURNABLE:
      return "inflatableBurnable";
    case Inflation::REPLACEABLE:
      return "replaceable";
    default:
      LOG (FATAL) << "Invalid Inflation: " << static_cast<int> (i);
    }
}

bool
InflationFromString (const std::string& str, Inflation& out)
{
  for (const auto i : ALL_INFLATIONS)
    if (InflationToString (i) == str)
      {
        out = i;
        return true;
      }

  VLOG (1) << "Invalid inflation: " << str;
  return false;
}

std::ostream&
operator<< (std::ostream& out, const Inflation i)
{
  out << InflationToString (i);
  return out;
}

/* ************************************************************************** */

Features
Features::None ()
{
  return Features ();
}

Features
Features::All ()
{
  Features res;
  res.renaming = true;
  res.inflation = Inflation::REPLACEABLE;
  return res;
}

bool
operator== (const Features& a, const Features& b)
{
  return a.renaming == b.renaming && a.inflation == b.inflation;
}

bool
operator!= (const Features& a, const Features& b)
{
  return !(a == b);
}

std::ostream&
operator<< (std::ostream& out, const Features& f)
{
  out << "renaming " << (f.renaming ? "yes" : "no")
      << ", inflation " << f.inflation;
  return out;
}

bool
FeaturesFromTransitions (const std::set<std::string>& transitions,
                         Features& out)
{
  const bool renaming = transitions.count ("rename") > 0;
  const bool inflatable = transitions.count ("issue") > 0;
  const bool burnable = transitions.count ("burn") > 0;
  const bool replaceable = transitions.count ("replace") > 0;

  if (replaceable && !burnable)
    {
      LOG (WARNING) << "Replaceable asset with no burn enabled";
      return false;
    }
  if (replaceable && !inflatable)
    {
      LOG (WARNING) << "Replaceable asset that is not inflatable";
      return false;
    }

  Features res;
  res.renaming = renaming;
  if (replaceable)
    res.inflation = Inflation::REPLACEABLE;
  else if (inflatable && burnable)
    res.inflation = Inflation::INFLATABLE_BURNABLE;
  else if (inflatable)
    res.inflation = Inflation::INFLATABLE;
  else if (burnable)
    res.inflation = Inflation::BURNABLE;
  else
    res.inflation = Inflation::FIXED;

  out = res;
  return true;
}

std::set<std::string>
FungibleTransitions (const Features& f)
{
  const TypeLib lib;
  const auto& iface = lib.Interface (IfaceStandard::RGB20);

  std::set<std::string> res(iface.transitions ().begin (),
                            iface.transitions ().end ());

  if (f.renaming)
    AddFeatureTransitions (iface, "renameable", res);
  if (IsInflatable (f.inflation))
    AddFeatureTransitions (iface, "inflatable", res);
  if (IsBurnable (f.inflation))
    AddFeatureTransitions (iface, "burnable", res);
  if (IsReplaceable (f.inflation))
    AddFeatureTransitions (iface, "replaceable", res);

  return res;
}

} // namespace rgbif
