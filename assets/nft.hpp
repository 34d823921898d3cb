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

#ifndef ASSETS_NFT_HPP
#define ASSETS_NFT_HPP

#include "media.hpp"
#include "names.hpp"
#include "reserves.hpp"

#include "contract/alignment.hpp"
#include "encoding/strict.hpp"

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>

namespace rgbif
{

/** Index of a token within a unique-asset contract.  */
using TokenIndex = uint32_t;

/**
 * The part of a token someone owns.  This has the same saturating
 * and checked arithmetic as Amount.
 */
class OwnedFraction
{

private:

  uint64_t value;

public:

  constexpr OwnedFraction ()
    : value(0)
  {}

  explicit constexpr OwnedFraction (const uint64_t v)
    : value(v)
  {}

  OwnedFraction (const OwnedFraction&) = default;
  OwnedFraction& operator= (const OwnedFraction&) = default;

  static constexpr OwnedFraction
  Zero ()
  {
    return OwnedFraction ();
  }

  constexpr uint64_t
  GetValue () const
  {
    return value;
  }

  /**
   * Parses a decimal integer.  Returns false if the string is invalid
   * or out of range.
   */
  static bool FromString (const std::string& str, OwnedFraction& out);

  OwnedFraction SaturatingAdd (OwnedFraction other) const;
  OwnedFraction SaturatingSub (OwnedFraction other) const;
  bool CheckedAdd (OwnedFraction other, OwnedFraction& out) const;
  bool CheckedSub (OwnedFraction other, OwnedFraction& out) const;

  void SaturatingAddAssign (OwnedFraction other);
  void SaturatingSubAssign (OwnedFraction other);
  bool CheckedAddAssign (OwnedFraction other);
  bool CheckedSubAssign (OwnedFraction other);

  friend bool
  operator== (const OwnedFraction a, const OwnedFraction b)
  {
    return a.value == b.value;
  }

  friend bool
  operator!= (const OwnedFraction a, const OwnedFraction b)
  {
    return !(a == b);
  }

  friend bool
  operator< (const OwnedFraction a, const OwnedFraction b)
  {
    return a.value < b.value;
  }

};

std::ostream& operator<< (std::ostream& out, OwnedFraction f);

void StrictEncode (StrictWriter& out, OwnedFraction f);
bool StrictDecode (StrictReader& in, OwnedFraction& f);

/**
 * Ways in which parsing an Nft allocation string can fail.
 */
enum class NftParseError : uint8_t
{
  /** The string is not of the form <fraction>@<tokenIndex>.  */
  WRONG_FORMAT,
  /** The token index is not a valid number.  */
  INVALID_INDEX,
  /** The fraction is not a valid number.  */
  INVALID_FRACTION,
};

std::ostream& operator<< (std::ostream& out, NftParseError err);

/**
 * Allocation of (a fraction of) a particular token.  The token index is
 * padded to a full field element, so that index and fraction end up in
 * separate elements.
 */
struct Nft
{

  TokenIndex tokenIndex = 0;
  Fe256Align32 align;
  OwnedFraction fraction;

  Nft () = default;

  Nft (const TokenIndex idx, const OwnedFraction f)
    : tokenIndex(idx), fraction(f)
  {}

  /**
   * Parses the textual form "<fraction>@<tokenIndex>".  On failure,
   * false is returned and err set to the reason.
   */
  static bool FromString (const std::string& str, Nft& out,
                          NftParseError& err);

  std::string ToString () const;

};

bool operator== (const Nft& a, const Nft& b);
bool operator!= (const Nft& a, const Nft& b);
std::ostream& operator<< (std::ostream& out, const Nft& n);

void StrictEncode (StrictWriter& out, const Nft& n);
bool StrictDecode (StrictReader& in, Nft& n);

/**
 * Media content engraved onto an existing token.
 */
struct NftEngraving
{

  TokenIndex appliedTo = 0;
  EmbeddedMedia content;

};

bool operator== (const NftEngraving& a, const NftEngraving& b);
bool operator!= (const NftEngraving& a, const NftEngraving& b);

void StrictEncode (StrictWriter& out, const NftEngraving& e);
bool StrictDecode (StrictReader& in, NftEngraving& e);

/** Maximum number of extra attachments of a single token.  */
constexpr size_t MAX_NFT_ATTACHMENTS = 20;

/**
 * Full description of a single token in a unique-asset contract.
 * The attachments map must hold at most MAX_NFT_ATTACHMENTS entries.
 */
struct NftSpec
{

  TokenIndex index = 0;
  std::optional<Ticker> ticker;
  std::optional<AssetName> name;
  std::optional<Details> details;
  std::optional<EmbeddedMedia> preview;
  std::optional<Attachment> media;
  std::map<uint8_t, Attachment> attachments;
  std::optional<ProofOfReserves> reserves;

};

bool operator== (const NftSpec& a, const NftSpec& b);
bool operator!= (const NftSpec& a, const NftSpec& b);

void StrictEncode (StrictWriter& out, const NftSpec& s);
bool StrictDecode (StrictReader& in, NftSpec& s);

} // namespace rgbif

#endif // ASSETS_NFT_HPP
