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

#ifndef CONTRACT_PRECISION_HPP
#define CONTRACT_PRECISION_HPP

#include "encoding/strict.hpp"

#include <array>
#include <cstdint>
#include <iostream>
#include <string>

namespace rgbif
{

/**
 * The number of fractional decimal digits of an asset, i.e. how many
 * minor units make up one whole unit.  The numeric value of each entry
 * is its number of decimals, and that is also what is used on the wire.
 * The declaration order matches increasing number of decimals, so that
 * precisions can be compared directly.
 */
enum class Precision : uint8_t
{
  INDIVISIBLE = 0,
  DECI = 1,
  CENTI = 2,
  MILLI = 3,
  DECI_MILLI = 4,
  CENTI_MILLI = 5,
  MICRO = 6,
  DECI_MICRO = 7,
  CENTI_MICRO = 8,
  NANO = 9,
  DECI_NANO = 10,
  CENTI_NANO = 11,
  PICO = 12,
  DECI_PICO = 13,
  CENTI_PICO = 14,
  FEMTO = 15,
  DECI_FEMTO = 16,
  CENTI_FEMTO = 17,
  ATTO = 18,
};

/** The precision assumed if none is specified (as for Bitcoin).  */
constexpr Precision DEFAULT_PRECISION = Precision::CENTI_MICRO;

/** The largest number of decimals supported.  */
constexpr uint8_t MAX_DECIMALS = 18;

/** All precision values, ordered by increasing number of decimals.  */
extern const std::array<Precision, MAX_DECIMALS + 1> ALL_PRECISIONS;

/**
 * Returns the number of fractional digits of a precision.
 */
constexpr uint8_t
PrecisionDecimals (const Precision p)
{
  return static_cast<uint8_t> (p);
}

/**
 * Returns the number of minor units in one whole unit, i.e. ten to the
 * power of the number of decimals.  This is looked up from a fixed table.
 */
uint64_t PrecisionMultiplier (Precision p);

/**
 * Converts a number of decimals to the precision.  Returns false if the
 * value is out of range.
 */
bool PrecisionFromDecimals (uint8_t decimals, Precision& p);

/**
 * Returns the name of a precision value (e.g. "centiMicro").
 */
std::string PrecisionToString (Precision p);

/**
 * Parses a precision from its name.  Returns false if the name is
 * not known.
 */
bool PrecisionFromString (const std::string& str, Precision& p);

std::ostream& operator<< (std::ostream& out, Precision p);

/**
 * Encodes a precision as single byte with its number of decimals.
 */
void StrictEncode (StrictWriter& out, Precision p);

/**
 * Decodes a precision, verifying that the byte value is a valid
 * number of decimals.
 */
bool StrictDecode (StrictReader& in, Precision& p);

} // namespace rgbif

#endif // CONTRACT_PRECISION_HPP
