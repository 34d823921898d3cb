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

#include "jsonutils.hpp"

#include <xayautil/base64.hpp>
#include <xayautil/jsonutils.hpp>

#include <glog/logging.h>

#include <initializer_list>
#include <optional>
#include <utility>

namespace rgbif
{

namespace
{

/**
 * Verifies that the JSON value is an object, has all the required members
 * and no members other than the required and optional ones.
 */
bool
HasMembers (const Json::Value& val, const char* what,
            const std::initializer_list<const char*> required,
            const std::initializer_list<const char*> optional)
{
  if (!val.isObject ())
    {
      VLOG (1)
          << "Invalid " << what << ": JSON value " << val
          << " is not an object";
      return false;
    }

  for (const char* key : required)
    if (!val.isMember (key))
      {
        VLOG (1)
            << "Invalid " << what << ": JSON value " << val
            << " has no member '" << key << "'";
        return false;
      }

  for (const auto& key : val.getMemberNames ())
    {
      bool found = false;
      for (const auto lst : {required, optional})
        for (const char* k : lst)
          if (key == k)
            found = true;

      if (!found)
        {
          VLOG (1)
              << "Invalid " << what << ": JSON value " << val
              << " has extra member '" << key << "'";
          return false;
        }
    }

  return true;
}

/**
 * Parses an optional member of a JSON object.  If it is missing, the
 * output is reset.  Returns false if the member is there but invalid.
 */
template <typename T, typename Fcn>
  bool
  OptionalFromJson (const Json::Value& obj, const char* key,
                    std::optional<T>& out, const Fcn& parse)
{
  if (!obj.isMember (key))
    {
      out.reset ();
      return true;
    }

  T val;
  if (!parse (obj[key], val))
    return false;

  out = std::move (val);
  return true;
}

/**
 * Parses a base64 encoded blob.
 */
bool
BlobFromJson (const Json::Value& val, std::string& out)
{
  if (!val.isString ())
    return false;

  if (!xaya::DecodeBase64 (val.asString (), out))
    {
      VLOG (1) << "Invalid base64 data: " << val;
      return false;
    }

  return true;
}

/**
 * Parses a 32-byte hash from its hex string.
 */
bool
Uint256FromJson (const Json::Value& val, xaya::uint256& out)
{
  if (!val.isString ())
    return false;

  if (!out.FromHex (val.asString ()))
    {
      VLOG (1) << "Invalid uint256 hex: " << val;
      return false;
    }

  return true;
}

} // anonymous namespace

/* ************************************************************************** */

template <>
  Json::Value
  IntToJson<uint32_t> (const uint32_t val)
{
  return static_cast<Json::UInt> (val);
}

template <>
  Json::Value
  IntToJson<uint64_t> (const uint64_t val)
{
  return static_cast<Json::UInt64> (val);
}

/* ************************************************************************** */

Json::Value
AmountToJson (const Amount a)
{
  return IntToJson (a.GetValue ());
}

bool
AmountFromJson (const Json::Value& val, Amount& a)
{
  if (!val.isUInt64 () || !xaya::IsIntegerValue (val))
    {
      VLOG (1) << "Invalid amount: " << val;
      return false;
    }

  a = Amount (val.asUInt64 ());
  return true;
}

Json::Value
PrecisionToJson (const Precision p)
{
  return PrecisionToString (p);
}

bool
PrecisionFromJson (const Json::Value& val, Precision& p)
{
  if (!val.isString ())
    {
      VLOG (1) << "Invalid precision: " << val << " is not a string";
      return false;
    }

  return PrecisionFromString (val.asString (), p);
}

/* ************************************************************************** */

Json::Value
MediaTypeToJson (const MediaType& t)
{
  Json::Value res(Json::objectValue);
  res["type"] = NameToJson (t.type);
  if (t.subtype.has_value ())
    res["subtype"] = NameToJson (*t.subtype);
  if (t.charset.has_value ())
    res["charset"] = NameToJson (*t.charset);

  return res;
}

bool
MediaTypeFromJson (const Json::Value& val, MediaType& t)
{
  if (!HasMembers (val, "media type", {"type"}, {"subtype", "charset"}))
    return false;

  MediaType res;
  if (!NameFromJson (val["type"], res.type))
    return false;

  const auto parseName = [] (const Json::Value& v, MediaRegName& out)
    {
      return NameFromJson (v, out);
    };
  if (!OptionalFromJson (val, "subtype", res.subtype, parseName)
        || !OptionalFromJson (val, "charset", res.charset, parseName))
    return false;

  t = std::move (res);
  return true;
}

Json::Value
AttachmentToJson (const Attachment& a)
{
  Json::Value res(Json::objectValue);
  res["type"] = MediaTypeToJson (a.type);
  res["digest"] = a.digest.ToHex ();

  return res;
}

bool
AttachmentFromJson (const Json::Value& val, Attachment& a)
{
  if (!HasMembers (val, "attachment", {"type", "digest"}, {}))
    return false;

  Attachment res;
  if (!MediaTypeFromJson (val["type"], res.type)
        || !Uint256FromJson (val["digest"], res.digest))
    return false;

  a = std::move (res);
  return true;
}

Json::Value
EmbeddedMediaToJson (const EmbeddedMedia& m)
{
  Json::Value res(Json::objectValue);
  res["type"] = MediaTypeToJson (m.type);
  res["data"] = xaya::EncodeBase64 (m.data);

  return res;
}

bool
EmbeddedMediaFromJson (const Json::Value& val, EmbeddedMedia& m)
{
  if (!HasMembers (val, "embedded media", {"type", "data"}, {}))
    return false;

  EmbeddedMedia res;
  if (!MediaTypeFromJson (val["type"], res.type)
        || !BlobFromJson (val["data"], res.data))
    return false;

  if (res.data.size () > MAX_SMALL_BLOB)
    {
      VLOG (1) << "Embedded media data is too large: " << res.data.size ();
      return false;
    }

  m = std::move (res);
  return true;
}

/* ************************************************************************** */

Json::Value
OutpointToJson (const Outpoint& o)
{
  return o.ToString ();
}

bool
OutpointFromJson (const Json::Value& val, Outpoint& o)
{
  if (!val.isString ())
    {
      VLOG (1) << "Invalid outpoint: " << val << " is not a string";
      return false;
    }

  return Outpoint::FromString (val.asString (), o);
}

Json::Value
ProofOfReservesToJson (const ProofOfReserves& p)
{
  Json::Value res(Json::objectValue);
  res["utxo"] = OutpointToJson (p.utxo);
  res["proof"] = xaya::EncodeBase64 (p.proof);

  return res;
}

bool
ProofOfReservesFromJson (const Json::Value& val, ProofOfReserves& p)
{
  if (!HasMembers (val, "proof of reserves", {"utxo", "proof"}, {}))
    return false;

  ProofOfReserves res;
  if (!OutpointFromJson (val["utxo"], res.utxo)
        || !BlobFromJson (val["proof"], res.proof))
    return false;

  if (res.proof.size () > MAX_SMALL_BLOB)
    {
      VLOG (1) << "Reserves proof is too large: " << res.proof.size ();
      return false;
    }

  p = std::move (res);
  return true;
}

/* ************************************************************************** */

Json::Value
AssetSpecToJson (const AssetSpec& s)
{
  Json::Value res(Json::objectValue);
  res["ticker"] = NameToJson (s.ticker);
  res["name"] = NameToJson (s.name);
  if (s.details.has_value ())
    res["details"] = NameToJson (*s.details);
  res["precision"] = PrecisionToJson (s.precision);

  return res;
}

bool
AssetSpecFromJson (const Json::Value& val, AssetSpec& s)
{
  if (!HasMembers (val, "asset spec", {"ticker", "name", "precision"},
                   {"details"}))
    return false;

  AssetSpec res;
  if (!NameFromJson (val["ticker"], res.ticker)
        || !NameFromJson (val["name"], res.name)
        || !PrecisionFromJson (val["precision"], res.precision))
    return false;

  const auto parseDetails = [] (const Json::Value& v, Details& out)
    {
      return NameFromJson (v, out);
    };
  if (!OptionalFromJson (val, "details", res.details, parseDetails))
    return false;

  s = std::move (res);
  return true;
}

Json::Value
ContractSpecToJson (const ContractSpec& s)
{
  Json::Value res(Json::objectValue);
  if (s.article.has_value ())
    res["article"] = NameToJson (*s.article);
  res["name"] = NameToJson (s.name);
  if (s.details.has_value ())
    res["details"] = NameToJson (*s.details);
  res["precision"] = PrecisionToJson (s.precision);

  return res;
}

bool
ContractSpecFromJson (const Json::Value& val, ContractSpec& s)
{
  if (!HasMembers (val, "contract spec", {"name", "precision"},
                   {"article", "details"}))
    return false;

  ContractSpec res;
  if (!NameFromJson (val["name"], res.name)
        || !PrecisionFromJson (val["precision"], res.precision))
    return false;

  const auto parseArticle = [] (const Json::Value& v, Article& out)
    {
      return NameFromJson (v, out);
    };
  const auto parseDetails = [] (const Json::Value& v, Details& out)
    {
      return NameFromJson (v, out);
    };
  if (!OptionalFromJson (val, "article", res.article, parseArticle)
        || !OptionalFromJson (val, "details", res.details, parseDetails))
    return false;

  s = std::move (res);
  return true;
}

Json::Value
ContractTermsToJson (const ContractTerms& t)
{
  Json::Value res(Json::objectValue);
  res["text"] = t.text.GetString ();
  if (t.media.has_value ())
    res["media"] = AttachmentToJson (*t.media);

  return res;
}

bool
ContractTermsFromJson (const Json::Value& val, ContractTerms& t)
{
  if (!HasMembers (val, "contract terms", {"text"}, {"media"}))
    return false;

  const Json::Value& text = val["text"];
  if (!text.isString ())
    {
      VLOG (1) << "Invalid contract terms text: " << text;
      return false;
    }

  ContractTerms res;
  if (!RicardianContract::FromString (text.asString (), res.text))
    return false;
  if (!OptionalFromJson (val, "media", res.media, AttachmentFromJson))
    return false;

  t = std::move (res);
  return true;
}

/* ************************************************************************** */

Json::Value
NftToJson (const Nft& n)
{
  Json::Value res(Json::objectValue);
  res["tokenIndex"] = IntToJson (n.tokenIndex);
  res["fraction"] = IntToJson (n.fraction.GetValue ());

  return res;
}

Json::Value
NftEngravingToJson (const NftEngraving& e)
{
  Json::Value res(Json::objectValue);
  res["appliedTo"] = IntToJson (e.appliedTo);
  res["content"] = EmbeddedMediaToJson (e.content);

  return res;
}

Json::Value
NftSpecToJson (const NftSpec& s)
{
  Json::Value res(Json::objectValue);
  res["index"] = IntToJson (s.index);
  if (s.ticker.has_value ())
    res["ticker"] = NameToJson (*s.ticker);
  if (s.name.has_value ())
    res["name"] = NameToJson (*s.name);
  if (s.details.has_value ())
    res["details"] = NameToJson (*s.details);
  if (s.preview.has_value ())
    res["preview"] = EmbeddedMediaToJson (*s.preview);
  if (s.media.has_value ())
    res["media"] = AttachmentToJson (*s.media);

  Json::Value attachments(Json::objectValue);
  for (const auto& entry : s.attachments)
    attachments[std::to_string (entry.first)]
        = AttachmentToJson (entry.second);
  res["attachments"] = attachments;

  if (s.reserves.has_value ())
    res["reserves"] = ProofOfReservesToJson (*s.reserves);

  return res;
}

Json::Value
FeaturesToJson (const Features& f)
{
  Json::Value res(Json::objectValue);
  res["renaming"] = f.renaming;
  res["inflation"] = InflationToString (f.inflation);

  return res;
}

} // namespace rgbif
