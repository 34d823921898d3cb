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

/* Template implementation code for amount.hpp.  */

#include <glog/logging.h>

#include <limits>

namespace rgbif
{

inline constexpr bool
operator== (const Amount a, const Amount b)
{
  return a.value == b.value;
}

inline constexpr bool
operator!= (const Amount a, const Amount b)
{
  return !(a == b);
}

inline constexpr bool
operator< (const Amount a, const Amount b)
{
  return a.value < b.value;
}

inline constexpr bool
operator<= (const Amount a, const Amount b)
{
  return a.value <= b.value;
}

inline constexpr bool
operator> (const Amount a, const Amount b)
{
  return b < a;
}

inline constexpr bool
operator>= (const Amount a, const Amount b)
{
  return b <= a;
}

inline std::ostream&
operator<< (std::ostream& out, const Amount a)
{
  out << a.value;
  return out;
}

inline Amount&
Amount::operator+= (const Amount other)
{
  DCHECK_LE (other.value, std::numeric_limits<uint64_t>::max () - value)
      << "Amount addition overflows";
  value += other.value;
  return *this;
}

inline Amount&
Amount::operator-= (const Amount other)
{
  DCHECK_LE (other.value, value) << "Amount subtraction underflows";
  value -= other.value;
  return *this;
}

inline Amount&
Amount::operator*= (const Amount other)
{
  DCHECK (other.value == 0
            || value <= std::numeric_limits<uint64_t>::max () / other.value)
      << "Amount multiplication overflows";
  value *= other.value;
  return *this;
}

inline Amount&
Amount::operator/= (const Amount other)
{
  CHECK_NE (other.value, 0) << "Division of amount by zero";
  value /= other.value;
  return *this;
}

inline Amount&
Amount::operator%= (const Amount other)
{
  CHECK_NE (other.value, 0) << "Remainder of amount by zero";
  value %= other.value;
  return *this;
}

inline Amount
operator+ (Amount a, const Amount b)
{
  a += b;
  return a;
}

inline Amount
operator- (Amount a, const Amount b)
{
  a -= b;
  return a;
}

inline Amount
operator* (Amount a, const Amount b)
{
  a *= b;
  return a;
}

inline Amount
operator/ (Amount a, const Amount b)
{
  a /= b;
  return a;
}

inline Amount
operator% (Amount a, const Amount b)
{
  a %= b;
  return a;
}

namespace internal
{

inline Amount
AsAmount (const Amount a)
{
  return a;
}

inline Amount
AsAmount (const uint64_t raw)
{
  return Amount (raw);
}

} // namespace internal

template <typename It>
  Amount
  SumAmounts (It begin, const It end)
{
  Amount res = Amount::Zero ();
  for (; begin != end; ++begin)
    res.SaturatingAddAssign (internal::AsAmount (*begin));
  return res;
}

template <typename C>
  Amount
  SumAmounts (const C& values)
{
  return SumAmounts (values.begin (), values.end ());
}

} // namespace rgbif
