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

#ifndef CONTRACT_ALIGNMENT_HPP
#define CONTRACT_ALIGNMENT_HPP

#include "encoding/strict.hpp"

#include <cstddef>

namespace rgbif
{

/** Size in bytes of a field element that structures are aligned to.  */
constexpr size_t FIELD_ELEMENT_BYTES = 32;

/**
 * Padding block placed right after a field of the given bit width,
 * so that whatever follows starts at the next field-element boundary.
 * The block has no content; all that matters is its size.  It is written
 * as zero bytes, and decoding consumes exactly the same number of bytes
 * without looking at them.
 */
template <unsigned Bits>
  class Fe256Align
{

  static_assert (Bits % 8 == 0 && Bits > 0 && Bits < 8 * FIELD_ELEMENT_BYTES,
                 "Unsupported preceding field width for alignment");

public:

  /** Number of padding bytes.  */
  static constexpr size_t SIZE = FIELD_ELEMENT_BYTES - Bits / 8;

  static_assert (Bits / 8 + SIZE == FIELD_ELEMENT_BYTES,
                 "Padding does not fill up the field element");

  Fe256Align () = default;

  Fe256Align (const Fe256Align&) = default;
  Fe256Align& operator= (const Fe256Align&) = default;

  friend bool
  operator== (const Fe256Align&, const Fe256Align&)
  {
    return true;
  }

  friend bool
  operator!= (const Fe256Align&, const Fe256Align&)
  {
    return false;
  }

  friend bool
  operator< (const Fe256Align&, const Fe256Align&)
  {
    return false;
  }

  friend void
  StrictEncode (StrictWriter& out, const Fe256Align&)
  {
    out.WriteZeros (SIZE);
  }

  friend bool
  StrictDecode (StrictReader& in, Fe256Align&)
  {
    return in.Skip (SIZE);
  }

};

using Fe256Align8 = Fe256Align<8>;
using Fe256Align16 = Fe256Align<16>;
using Fe256Align32 = Fe256Align<32>;
using Fe256Align64 = Fe256Align<64>;
using Fe256Align128 = Fe256Align<128>;

} // namespace rgbif

#endif // CONTRACT_ALIGNMENT_HPP
