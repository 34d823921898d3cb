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

#ifndef ASSETS_RESERVES_HPP
#define ASSETS_RESERVES_HPP

#include "encoding/strict.hpp"

#include <xayautil/uint256.hpp>

#include <cstdint>
#include <iostream>
#include <set>
#include <string>

namespace rgbif
{

/**
 * Reference to a transaction output on the base layer.
 */
struct Outpoint
{

  xaya::uint256 txid;
  uint32_t vout = 0;

  /**
   * Parses the "txid:vout" form.  Returns false if the string is
   * malformed.
   */
  static bool FromString (const std::string& str, Outpoint& out);

  std::string ToString () const;

};

bool operator== (const Outpoint& a, const Outpoint& b);
bool operator!= (const Outpoint& a, const Outpoint& b);
bool operator< (const Outpoint& a, const Outpoint& b);
std::ostream& operator<< (std::ostream& out, const Outpoint& o);

void StrictEncode (StrictWriter& out, const Outpoint& o);
bool StrictDecode (StrictReader& in, Outpoint& o);

/**
 * Proof that some base-layer output backs an asset.  The proof data
 * itself is opaque here.
 */
struct ProofOfReserves
{

  Outpoint utxo;

  /** Proof data, at most 0xFFFF bytes.  */
  std::string proof;

};

bool operator== (const ProofOfReserves& a, const ProofOfReserves& b);
bool operator!= (const ProofOfReserves& a, const ProofOfReserves& b);
bool operator< (const ProofOfReserves& a, const ProofOfReserves& b);
std::ostream& operator<< (std::ostream& out, const ProofOfReserves& p);

void StrictEncode (StrictWriter& out, const ProofOfReserves& p);
bool StrictDecode (StrictReader& in, ProofOfReserves& p);

/** Maximum number of reserve proofs attached to an issue or burn.  */
constexpr size_t MAX_RESERVE_PROOFS = 0xFFFF;

/**
 * Metadata of an issuance, listing the proofs of reserves backing
 * the newly issued supply.
 */
struct IssueMeta
{
  std::set<ProofOfReserves> reserves;
};

/**
 * Metadata of a burn, with proofs that the backing reserves were
 * released.
 */
struct BurnMeta
{
  std::set<ProofOfReserves> burnProofs;
};

bool operator== (const IssueMeta& a, const IssueMeta& b);
bool operator== (const BurnMeta& a, const BurnMeta& b);

void StrictEncode (StrictWriter& out, const IssueMeta& m);
bool StrictDecode (StrictReader& in, IssueMeta& m);
void StrictEncode (StrictWriter& out, const BurnMeta& m);
bool StrictDecode (StrictReader& in, BurnMeta& m);

} // namespace rgbif

#endif // ASSETS_RESERVES_HPP
