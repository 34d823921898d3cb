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

#include "nft.hpp"

#include "contract/amount.hpp"

#include <glog/logging.h>

#include <limits>
#include <sstream>

namespace rgbif
{

/* ************************************************************************** */

bool
OwnedFraction::FromString (const std::string& str, OwnedFraction& out)
{
  Amount parsed;
  if (!Amount::FromString (str, parsed))
    return false;

  out = OwnedFraction (parsed.GetValue ());
  return true;
}

OwnedFraction
OwnedFraction::SaturatingAdd (const OwnedFraction other) const
{
  return OwnedFraction (
      Amount (value).SaturatingAdd (Amount (other.value)).GetValue ());
}

OwnedFraction
OwnedFraction::SaturatingSub (const OwnedFraction other) const
{
  return OwnedFraction (
      Amount (value).SaturatingSub (Amount (other.value)).GetValue ());
}

bool
OwnedFraction::CheckedAdd (const OwnedFraction other,
                           OwnedFraction& out) const
{
  Amount res;
  if (!Amount (value).CheckedAdd (Amount (other.value), res))
    return false;

  out = OwnedFraction (res.GetValue ());
  return true;
}

bool
OwnedFraction::CheckedSub (const OwnedFraction other,
                           OwnedFraction& out) const
{
  Amount res;
  if (!Amount (value).CheckedSub (Amount (other.value), res))
    return false;

  out = OwnedFraction (res.GetValue ());
  return true;
}

void
OwnedFraction::SaturatingAddAssign (const OwnedFraction other)
{
  *this = SaturatingAdd (other);
}

void
OwnedFraction::SaturatingSubAssign (const OwnedFraction other)
{
  *this = SaturatingSub (other);
}

bool
OwnedFraction::CheckedAddAssign (const OwnedFraction other)
{
  return CheckedAdd (other, *this);
}

bool
OwnedFraction::CheckedSubAssign (const OwnedFraction other)
{
  return CheckedSub (other, *this);
}

std::ostream&
operator<< (std::ostream& out, const OwnedFraction f)
{
  out << f.GetValue ();
  return out;
}

void
StrictEncode (StrictWriter& out, const OwnedFraction f)
{
  out.WriteU64 (f.GetValue ());
}

bool
StrictDecode (StrictReader& in, OwnedFraction& f)
{
  uint64_t val;
  if (!in.ReadU64 (val))
    return false;

  f = OwnedFraction (val);
  return true;
}

/* ************************************************************************** */

std::ostream&
operator<< (std::ostream& out, const NftParseError err)
{
  switch (err)
    {
    case NftParseError::WRONG_FORMAT:
      out << "allocation must have format <fraction>@<token_index>";
      break;
    case NftParseError::INVALID_INDEX:
      out << "invalid token index";
      break;
    case NftParseError::INVALID_FRACTION:
      out << "invalid fraction";
      break;
    default:
      LOG (FATAL) << "Invalid NftParseError: " << static_cast<int> (err);
    }

  return out;
}

bool
Nft::FromString (const std::string& str, Nft& out, NftParseError& err)
{
  const auto at = str.find ('@');
  if (at == std::string::npos)
    {
      VLOG (1) << "Nft allocation without separator: " << str;
      err = NftParseError::WRONG_FORMAT;
      return false;
    }

  Amount index;
  if (!Amount::FromString (str.substr (at + 1), index)
        || index.GetValue () > std::numeric_limits<TokenIndex>::max ())
    {
      VLOG (1) << "Invalid token index in Nft allocation: " << str;
      err = NftParseError::INVALID_INDEX;
      return false;
    }

  OwnedFraction fraction;
  if (!OwnedFraction::FromString (str.substr (0, at), fraction))
    {
      VLOG (1) << "Invalid fraction in Nft allocation: " << str;
      err = NftParseError::INVALID_FRACTION;
      return false;
    }

  out = Nft (static_cast<TokenIndex> (index.GetValue ()), fraction);
  return true;
}

std::string
Nft::ToString () const
{
  std::ostringstream out;
  out << fraction << '@' << tokenIndex;
  return out.str ();
}

bool
operator== (const Nft& a, const Nft& b)
{
  return a.tokenIndex == b.tokenIndex && a.fraction == b.fraction;
}

bool
operator!= (const Nft& a, const Nft& b)
{
  return !(a == b);
}

std::ostream&
operator<< (std::ostream& out, const Nft& n)
{
  out << n.ToString ();
  return out;
}

void
StrictEncode (StrictWriter& out, const Nft& n)
{
  out.WriteU32 (n.tokenIndex);
  StrictEncode (out, n.align);
  StrictEncode (out, n.fraction);
}

bool
StrictDecode (StrictReader& in, Nft& n)
{
  return in.ReadU32 (n.tokenIndex)
            && StrictDecode (in, n.align)
            && StrictDecode (in, n.fraction);
}

/* ************************************************************************** */

bool
operator== (const NftEngraving& a, const NftEngraving& b)
{
  return a.appliedTo == b.appliedTo && a.content == b.content;
}

bool
operator!= (const NftEngraving& a, const NftEngraving& b)
{
  return !(a == b);
}

void
StrictEncode (StrictWriter& out, const NftEngraving& e)
{
  out.WriteU32 (e.appliedTo);
  StrictEncode (out, e.content);
}

bool
StrictDecode (StrictReader& in, NftEngraving& e)
{
  return in.ReadU32 (e.appliedTo) && StrictDecode (in, e.content);
}

/* ************************************************************************** */

bool
operator== (const NftSpec& a, const NftSpec& b)
{
  return a.index == b.index
            && a.ticker == b.ticker
            && a.name == b.name
            && a.details == b.details
            && a.preview == b.preview
            && a.media == b.media
            && a.attachments == b.attachments
            && a.reserves == b.reserves;
}

bool
operator!= (const NftSpec& a, const NftSpec& b)
{
  return !(a == b);
}

void
StrictEncode (StrictWriter& out, const NftSpec& s)
{
  out.WriteU32 (s.index);
  StrictEncode (out, s.ticker);
  StrictEncode (out, s.name);
  StrictEncode (out, s.details);
  StrictEncode (out, s.preview);
  StrictEncode (out, s.media);
  StrictEncodeMap (out, s.attachments, MAX_NFT_ATTACHMENTS);
  StrictEncode (out, s.reserves);
}

bool
StrictDecode (StrictReader& in, NftSpec& s)
{
  return in.ReadU32 (s.index)
            && StrictDecode (in, s.ticker)
            && StrictDecode (in, s.name)
            && StrictDecode (in, s.details)
            && StrictDecode (in, s.preview)
            && StrictDecode (in, s.media)
            && StrictDecodeMap (in, MAX_NFT_ATTACHMENTS, s.attachments)
            && StrictDecode (in, s.reserves);
}

} // namespace rgbif
