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

#include "amount.hpp"

#include <glog/logging.h>

#include <limits>
#include <sstream>

namespace rgbif
{

namespace
{

constexpr uint64_t MAX_VALUE = std::numeric_limits<uint64_t>::max ();

/**
 * Multiplies two numbers, returning false if the result overflows.
 */
bool
MultiplyChecked (const uint64_t a, const uint64_t b, uint64_t& res)
{
  if (b != 0 && a > MAX_VALUE / b)
    return false;

  res = a * b;
  return true;
}

/**
 * Parses a non-empty string of ASCII digits into an integer.  Returns false
 * for any other character and on overflow.
 */
bool
ParseDigits (const std::string& str, uint64_t& res)
{
  if (str.empty ())
    return false;

  uint64_t val = 0;
  for (const char c : str)
    {
      if (c < '0' || c > '9')
        return false;

      const uint64_t digit = c - '0';
      if (!MultiplyChecked (val, 10, val) || val > MAX_VALUE - digit)
        return false;
      val += digit;
    }

  res = val;
  return true;
}

} // anonymous namespace

/* ************************************************************************** */

Amount
Amount::WithPrecision (const uint64_t whole, const Precision p)
{
  return Amount (whole * PrecisionMultiplier (p));
}

bool
Amount::WithPrecisionChecked (const uint64_t whole, const Precision p,
                              Amount& out)
{
  uint64_t res;
  if (!MultiplyChecked (whole, PrecisionMultiplier (p), res))
    return false;

  out = Amount (res);
  return true;
}

bool
Amount::FromString (const std::string& str, Amount& out)
{
  uint64_t val;
  if (!ParseDigits (str, val))
    {
      VLOG (1) << "Invalid amount string: " << str;
      return false;
    }

  out = Amount (val);
  return true;
}

bool
Amount::FromDecimalString (const std::string& str, const Precision p,
                           Amount& out)
{
  const auto point = str.find ('.');

  std::string wholeStr, fractStr;
  if (point == std::string::npos)
    wholeStr = str;
  else
    {
      wholeStr = str.substr (0, point);
      fractStr = str.substr (point + 1);
      if (fractStr.empty ())
        {
          VLOG (1) << "Empty fractional part in decimal amount: " << str;
          return false;
        }
    }

  uint64_t whole;
  if (!ParseDigits (wholeStr, whole))
    {
      VLOG (1) << "Invalid whole part in decimal amount: " << str;
      return false;
    }

  const unsigned decimals = PrecisionDecimals (p);
  if (fractStr.size () > decimals)
    {
      VLOG (1)
          << "Decimal amount " << str << " has more than " << decimals
          << " fractional digits";
      return false;
    }

  uint64_t fract = 0;
  if (!fractStr.empty ())
    {
      if (!ParseDigits (fractStr, fract))
        {
          VLOG (1) << "Invalid fractional part in decimal amount: " << str;
          return false;
        }

      /* Scale the fractional digits up to the full number of decimals.
         This cannot overflow, as the result is below the multiplier.  */
      for (size_t i = fractStr.size (); i < decimals; ++i)
        fract *= 10;
    }

  Amount res;
  if (!WithPrecisionChecked (whole, p, res)
        || !res.CheckedAddAssign (Amount (fract)))
    {
      VLOG (1) << "Decimal amount out of range: " << str;
      return false;
    }

  out = res;
  return true;
}

/* ************************************************************************** */

void
Amount::Split (const Precision p, uint64_t& whole, uint64_t& fract) const
{
  const uint64_t mul = PrecisionMultiplier (p);
  whole = value / mul;
  fract = value % mul;
}

uint64_t
Amount::Rem (const Precision p) const
{
  return value % PrecisionMultiplier (p);
}

uint64_t
Amount::Round (const Precision p) const
{
  if (value == 0)
    return 0;

  /* The remainder is below the multiplier, which is at most 10^18.
     Thus doubling it does not overflow.  */
  const uint64_t mul = PrecisionMultiplier (p);
  return value / mul + (2 * (value % mul)) / mul;
}

uint64_t
Amount::Ceil (const Precision p) const
{
  if (value == 0)
    return 0;

  const uint64_t mul = PrecisionMultiplier (p);
  return value / mul + (value % mul > 0 ? 1 : 0);
}

uint64_t
Amount::Floor (const Precision p) const
{
  if (value == 0)
    return 0;

  return value / PrecisionMultiplier (p);
}

std::string
Amount::ToDecimalString (const Precision p) const
{
  uint64_t whole, fract;
  Split (p, whole, fract);

  std::ostringstream out;
  out << whole;

  const unsigned decimals = PrecisionDecimals (p);
  if (decimals > 0)
    {
      std::string digits = std::to_string (fract);
      CHECK_LE (digits.size (), decimals);
      out << '.' << std::string (decimals - digits.size (), '0') << digits;
    }

  return out.str ();
}

/* ************************************************************************** */

Amount
Amount::SaturatingAdd (const Amount other) const
{
  if (other.value > MAX_VALUE - value)
    return Amount (MAX_VALUE);
  return Amount (value + other.value);
}

Amount
Amount::SaturatingSub (const Amount other) const
{
  if (other.value > value)
    return Zero ();
  return Amount (value - other.value);
}

bool
Amount::CheckedAdd (const Amount other, Amount& out) const
{
  if (other.value > MAX_VALUE - value)
    return false;

  out = Amount (value + other.value);
  return true;
}

bool
Amount::CheckedSub (const Amount other, Amount& out) const
{
  if (other.value > value)
    return false;

  out = Amount (value - other.value);
  return true;
}

void
Amount::SaturatingAddAssign (const Amount other)
{
  *this = SaturatingAdd (other);
}

void
Amount::SaturatingSubAssign (const Amount other)
{
  *this = SaturatingSub (other);
}

bool
Amount::CheckedAddAssign (const Amount other)
{
  return CheckedAdd (other, *this);
}

bool
Amount::CheckedSubAssign (const Amount other)
{
  return CheckedSub (other, *this);
}

/* ************************************************************************** */

Amount
UncheckedConvert (const Precision p, const uint64_t whole)
{
  return Amount::WithPrecision (whole, p);
}

bool
CheckedConvert (const Precision p, const uint64_t whole, Amount& out)
{
  return Amount::WithPrecisionChecked (whole, p, out);
}

Amount
SaturatingConvert (const Precision p, const uint64_t whole)
{
  Amount res;
  if (!Amount::WithPrecisionChecked (whole, p, res))
    return Amount (MAX_VALUE);
  return res;
}

void
StrictEncode (StrictWriter& out, const Amount a)
{
  out.WriteU64 (a.GetValue ());
}

bool
StrictDecode (StrictReader& in, Amount& a)
{
  uint64_t val;
  if (!in.ReadU64 (val))
    return false;

  a = Amount (val);
  return true;
}

} // namespace rgbif
