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

#include "precision.hpp"

#include <glog/logging.h>

namespace rgbif
{

const std::array<Precision, MAX_DECIMALS + 1> ALL_PRECISIONS =
  {
    Precision::INDIVISIBLE,
    Precision::DECI,
    Precision::CENTI,
    Precision::MILLI,
    Precision::DECI_MILLI,
    Precision::CENTI_MILLI,
    Precision::MICRO,
    Precision::DECI_MICRO,
    Precision::CENTI_MICRO,
    Precision::NANO,
    Precision::DECI_NANO,
    Precision::CENTI_NANO,
    Precision::PICO,
    Precision::DECI_PICO,
    Precision::CENTI_PICO,
    Precision::FEMTO,
    Precision::DECI_FEMTO,
    Precision::CENTI_FEMTO,
    Precision::ATTO,
  };

namespace
{

/** Multipliers indexed by the number of decimals.  */
constexpr std::array<uint64_t, MAX_DECIMALS + 1> MULTIPLIERS =
  {
    1,
    10,
    100,
    1'000,
    10'000,
    100'000,
    1'000'000,
    10'000'000,
    100'000'000,
    1'000'000'000,
    10'000'000'000,
    100'000'000'000,
    1'000'000'000'000,
    10'000'000'000'000,
    100'000'000'000'000,
    1'000'000'000'000'000,
    10'000'000'000'000'000,
    100'000'000'000'000'000,
    1'000'000'000'000'000'000,
  };

/** Names of the precisions, indexed by the number of decimals.  */
const std::array<std::string, MAX_DECIMALS + 1> NAMES =
  {
    "indivisible",
    "deci",
    "centi",
    "milli",
    "deciMilli",
    "centiMilli",
    "micro",
    "deciMicro",
    "centiMicro",
    "nano",
    "deciNano",
    "centiNano",
    "pico",
    "deciPico",
    "centiPico",
    "femto",
    "deciFemto",
    "centiFemto",
    "atto",
  };

/**
 * Returns the table index for a precision value, verifying that it is
 * a valid enum value.
 */
size_t
TableIndex (const Precision p)
{
  const uint8_t decimals = PrecisionDecimals (p);
  CHECK_LE (decimals, MAX_DECIMALS)
      << "Invalid precision value: " << static_cast<int> (decimals);
  return decimals;
}

} // anonymous namespace

uint64_t
PrecisionMultiplier (const Precision p)
{
  return MULTIPLIERS[TableIndex (p)];
}

bool
PrecisionFromDecimals (const uint8_t decimals, Precision& p)
{
  if (decimals > MAX_DECIMALS)
    {
      VLOG (1) << "Invalid number of decimals: " << static_cast<int> (decimals);
      return false;
    }

  p = static_cast<Precision> (decimals);
  return true;
}

std::string
PrecisionToString (const Precision p)
{
  return NAMES[TableIndex (p)];
}

bool
PrecisionFromString (const std::string& str, Precision& p)
{
  for (size_t i = 0; i < NAMES.size (); ++i)
    if (NAMES[i] == str)
      {
        p = ALL_PRECISIONS[i];
        return true;
      }

  VLOG (1) << "Unknown precision name: " << str;
  return false;
}

std::ostream&
operator<< (std::ostream& out, const Precision p)
{
  out << PrecisionToString (p);
  return out;
}

void
StrictEncode (StrictWriter& out, const Precision p)
{
  out.WriteU8 (PrecisionDecimals (p));
}

bool
StrictDecode (StrictReader& in, Precision& p)
{
  uint8_t decimals;
  if (!in.ReadU8 (decimals))
    return false;

  return PrecisionFromDecimals (decimals, p);
}

} // namespace rgbif
