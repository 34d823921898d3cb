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

#ifndef INTERFACES_FEATURES_HPP
#define INTERFACES_FEATURES_HPP

#include <cstdint>
#include <iostream>
#include <set>
#include <string>

namespace rgbif
{

/**
 * Ways in which the supply of a fungible asset may change after
 * its genesis.
 */
enum class Inflation : uint8_t
{
  FIXED,
  BURNABLE,
  INFLATABLE,
  INFLATABLE_BURNABLE,
  /** Inflatable and burnable, with burned supply being replaceable.  */
  REPLACEABLE,
};

bool IsFixed (Inflation i);
bool IsInflatable (Inflation i);
bool IsBurnable (Inflation i);
bool IsReplaceable (Inflation i);

/**
 * Returns the camel-case name of an inflation variant, e.g.
 * "inflatableBurnable".
 */
std::string InflationToString (Inflation i);

/**
 * Parses an inflation variant from its name.
 */
bool InflationFromString (const std::string& str, Inflation& out);

std::ostream& operator<< (std::ostream& out, Inflation i);

/**
 * The optional features of a fungible asset.  This is the explicit
 * composition of the feature set an asset's interface is built from.
 */
struct Features
{

  /** Whether the spec can be changed later.  */
  bool renaming = false;

  Inflation inflation = Inflation::FIXED;

  /**
   * Returns the feature set with nothing enabled.
   */
  static Features None ();

  /**
   * Returns the feature set with everything enabled.
   */
  static Features All ();

};

bool operator== (const Features& a, const Features& b);
bool operator!= (const Features& a, const Features& b);
std::ostream& operator<< (std::ostream& out, const Features& f);

/**
 * Derives the features of a fungible asset from the names of the state
 * transitions its contract supports.  Returns false if the combination
 * is invalid, namely replacement without burning or without inflation.
 */
bool FeaturesFromTransitions (const std::set<std::string>& transitions,
                              Features& out);

/**
 * Returns the names of all transitions of the fungible-asset interface
 * with the given features enabled, according to the standard registry.
 */
std::set<std::string> FungibleTransitions (const Features& f);

} // namespace rgbif

#endif // INTERFACES_FEATURES_HPP
