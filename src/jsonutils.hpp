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

#ifndef RGBIF_JSONUTILS_HPP
#define RGBIF_JSONUTILS_HPP

#include "assets/assetspec.hpp"
#include "assets/media.hpp"
#include "assets/names.hpp"
#include "assets/nft.hpp"
#include "assets/reserves.hpp"
#include "contract/amount.hpp"
#include "contract/precision.hpp"
#include "interfaces/features.hpp"

#include <json/json.h>

#include <string>

namespace rgbif
{

/**
 * Encodes an Amount as JSON.  The value is the raw number of minor units
 * as an unsigned integer.
 */
Json::Value AmountToJson (Amount a);

/**
 * Parses an Amount from JSON.  It must be a non-negative integer that
 * fits into 64 bits.
 */
bool AmountFromJson (const Json::Value& val, Amount& a);

/**
 * Encodes a Precision as its name string (e.g. "centiMicro").
 */
Json::Value PrecisionToJson (Precision p);
bool PrecisionFromJson (const Json::Value& val, Precision& p);

/**
 * Encodes a confined string (ticker, name and so on) as JSON string.
 */
template <typename Rules>
  Json::Value NameToJson (const ConfinedString<Rules>& s);

/**
 * Parses a confined string from JSON, validating it against the
 * type's restrictions.
 */
template <typename Rules>
  bool NameFromJson (const Json::Value& val, ConfinedString<Rules>& s);

/**
 * Encodes a media type as JSON.  The format is
 *
 *  {"type": "text", "subtype": "plain", "charset": "utf-8"}
 *
 * where subtype and charset are only present if set.
 */
Json::Value MediaTypeToJson (const MediaType& t);
bool MediaTypeFromJson (const Json::Value& val, MediaType& t);

/**
 * Encodes an attachment as JSON object with "type" (a media type) and
 * "digest" (hex string) members.
 */
Json::Value AttachmentToJson (const Attachment& a);
bool AttachmentFromJson (const Json::Value& val, Attachment& a);

/**
 * Encodes embedded media as JSON object with "type" and "data", the latter
 * being base64 encoded.
 */
Json::Value EmbeddedMediaToJson (const EmbeddedMedia& m);
bool EmbeddedMediaFromJson (const Json::Value& val, EmbeddedMedia& m);

/**
 * Encodes an outpoint as string in the form "txid:vout".
 */
Json::Value OutpointToJson (const Outpoint& o);
bool OutpointFromJson (const Json::Value& val, Outpoint& o);

Json::Value ProofOfReservesToJson (const ProofOfReserves& p);
bool ProofOfReservesFromJson (const Json::Value& val, ProofOfReserves& p);

Json::Value AssetSpecToJson (const AssetSpec& s);
bool AssetSpecFromJson (const Json::Value& val, AssetSpec& s);

Json::Value ContractSpecToJson (const ContractSpec& s);
bool ContractSpecFromJson (const Json::Value& val, ContractSpec& s);

Json::Value ContractTermsToJson (const ContractTerms& t);
bool ContractTermsFromJson (const Json::Value& val, ContractTerms& t);

/**
 * Encodes an NFT allocation state as JSON object with "tokenIndex"
 * and "fraction" members.  The padding is not part of the JSON form.
 */
Json::Value NftToJson (const Nft& n);

Json::Value NftEngravingToJson (const NftEngraving& e);

/**
 * Encodes the full description of a token.  Attachments are returned
 * as object keyed by the attachment type id (as string).
 */
Json::Value NftSpecToJson (const NftSpec& s);

Json::Value FeaturesToJson (const Features& f);

/**
 * Converts an integer value to the proper JSON representation.
 */
template <typename T>
  Json::Value IntToJson (T val);

} // namespace rgbif

#include "jsonutils.tpp"

#endif // RGBIF_JSONUTILS_HPP
