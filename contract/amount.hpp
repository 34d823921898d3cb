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

#ifndef CONTRACT_AMOUNT_HPP
#define CONTRACT_AMOUNT_HPP

#include "precision.hpp"

#include "encoding/strict.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>

namespace rgbif
{

/**
 * A quantity of some asset, counted in minor units (e.g. Satoshi).  Where
 * the decimal point goes is not part of the amount itself; it is given by
 * a Precision wherever a human-readable form is needed.  Callers have to make
 * sure that amounts they combine refer to the same precision.
 *
 * The plain arithmetic operators must only be used where overflow has
 * already been excluded (e.g. by validation).  They fail a debug assertion
 * on overflow.  Everything else should use the saturating or checked
 * variants explicitly.
 */
class Amount
{

private:

  /** The raw number of minor units.  */
  uint64_t value;

public:

  constexpr Amount ()
    : value(0)
  {}

  explicit constexpr Amount (const uint64_t v)
    : value(v)
  {}

  Amount (const Amount&) = default;
  Amount& operator= (const Amount&) = default;

  /**
   * Returns the zero amount.
   */
  static constexpr Amount
  Zero ()
  {
    return Amount ();
  }

  /**
   * Constructs an amount from a number of whole units under the given
   * precision.  The multiplication wraps around on overflow, so this
   * must only be used where that is impossible.
   */
  static Amount WithPrecision (uint64_t whole, Precision p);

  /**
   * Constructs an amount from whole units, returning false if the
   * result would overflow.
   */
  static bool WithPrecisionChecked (uint64_t whole, Precision p, Amount& out);

  /**
   * Parses a raw minor-unit integer in decimal notation.  Returns false
   * if the string is not a valid number or out of range.
   */
  static bool FromString (const std::string& str, Amount& out);

  /**
   * Parses a decimal number like "12.34" into an amount under the given
   * precision.  The number of fractional digits must not exceed the
   * precision's decimals.  Signs, whitespace, exponents and an empty
   * whole or fractional part are all invalid.
   */
  static bool FromDecimalString (const std::string& str, Precision p,
                                 Amount& out);

  constexpr uint64_t
  GetValue () const
  {
    return value;
  }

  /**
   * Splits the amount into its whole and fractional parts under
   * the given precision.
   */
  void Split (Precision p, uint64_t& whole, uint64_t& fract) const;

  /**
   * Returns the fractional remainder (in minor units) under a precision.
   */
  uint64_t Rem (Precision p) const;

  /**
   * Returns the number of whole units, rounded half up.
   */
  uint64_t Round (Precision p) const;

  /**
   * Returns the number of whole units, rounded up if there is any
   * fractional part.
   */
  uint64_t Ceil (Precision p) const;

  /**
   * Returns the number of whole units, rounded down.
   */
  uint64_t Floor (Precision p) const;

  /**
   * Formats the amount as decimal number with exactly as many fractional
   * digits as the precision has.
   */
  std::string ToDecimalString (Precision p) const;

  Amount SaturatingAdd (Amount other) const;
  Amount SaturatingSub (Amount other) const;

  /**
   * Adds another amount, returning false (and leaving out unchanged)
   * if the result overflows.
   */
  bool CheckedAdd (Amount other, Amount& out) const;

  /**
   * Subtracts another amount, returning false if the result
   * would be negative.
   */
  bool CheckedSub (Amount other, Amount& out) const;

  void SaturatingAddAssign (Amount other);
  void SaturatingSubAssign (Amount other);

  /**
   * Adds another amount to this one.  If that would overflow, false is
   * returned and the value is not changed.
   */
  bool CheckedAddAssign (Amount other);

  /**
   * Subtracts an amount in place.  On underflow, the value stays as it
   * is and false is returned.
   */
  bool CheckedSubAssign (Amount other);

  Amount& operator+= (Amount other);
  Amount& operator-= (Amount other);
  Amount& operator*= (Amount other);
  Amount& operator/= (Amount other);
  Amount& operator%= (Amount other);

  friend constexpr bool operator== (Amount a, Amount b);
  friend constexpr bool operator!= (Amount a, Amount b);
  friend constexpr bool operator< (Amount a, Amount b);
  friend constexpr bool operator<= (Amount a, Amount b);
  friend constexpr bool operator> (Amount a, Amount b);
  friend constexpr bool operator>= (Amount a, Amount b);

  friend std::ostream& operator<< (std::ostream& out, Amount a);

};

Amount operator+ (Amount a, Amount b);
Amount operator- (Amount a, Amount b);
Amount operator* (Amount a, Amount b);
Amount operator/ (Amount a, Amount b);
Amount operator% (Amount a, Amount b);

/**
 * Sums up a range of amounts (or raw uint64_t minor-unit values).  The sum
 * saturates instead of overflowing, so that aggregating many values never
 * fails as a whole.
 */
template <typename It>
  Amount SumAmounts (It begin, It end);

/**
 * Sums up all amounts in a container with saturating addition.
 */
template <typename C>
  Amount SumAmounts (const C& values);

/**
 * Converts a number of whole units to an amount under the precision,
 * wrapping around on overflow.
 */
Amount UncheckedConvert (Precision p, uint64_t whole);

/**
 * Converts whole units to an amount, returning false on overflow.
 */
bool CheckedConvert (Precision p, uint64_t whole, Amount& out);

/**
 * Converts whole units to an amount, saturating at the maximum value
 * on overflow.
 */
Amount SaturatingConvert (Precision p, uint64_t whole);

/**
 * Amounts are encoded as bare little-endian u64.
 */
void StrictEncode (StrictWriter& out, Amount a);
bool StrictDecode (StrictReader& in, Amount& a);

} // namespace rgbif

namespace std
{

/**
 * Specialisation of std::hash for Amount, so that it can be used in
 * unordered containers.
 */
template <>
  struct hash<rgbif::Amount>
{

  size_t
  operator() (const rgbif::Amount& a) const
  {
    return hash<uint64_t> () (a.GetValue ());
  }

};

} // namespace std

#include "amount.tpp"

#endif // CONTRACT_AMOUNT_HPP
