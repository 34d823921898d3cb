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

#ifndef ASSETS_MEDIA_HPP
#define ASSETS_MEDIA_HPP

#include "names.hpp"

#include "encoding/strict.hpp"

#include <xayautil/uint256.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace rgbif
{

/**
 * A MIME media type like "text/plain".  A missing subtype stands
 * for the wildcard "*".
 */
struct MediaType
{

  MediaRegName type;
  std::optional<MediaRegName> subtype;
  std::optional<MediaRegName> charset;

  /**
   * Parses a "type/subtype" string, where the subtype may be "*".
   * Returns false if the string is not of that form or any of the
   * names is invalid.
   */
  static bool FromString (const std::string& str, MediaType& out);

  /**
   * Constructs a media type from a hard-coded string, asserting that
   * it is valid.
   */
  static MediaType With (const std::string& str);

  /**
   * Returns the "type/subtype" form.
   */
  std::string ToString () const;

};

bool operator== (const MediaType& a, const MediaType& b);
bool operator!= (const MediaType& a, const MediaType& b);
bool operator< (const MediaType& a, const MediaType& b);
std::ostream& operator<< (std::ostream& out, const MediaType& t);

void StrictEncode (StrictWriter& out, const MediaType& t);
bool StrictDecode (StrictReader& in, MediaType& t);

/**
 * A reference to some media file outside of the contract, given by
 * its type and SHA-256 digest.
 */
struct Attachment
{

  MediaType type;
  xaya::uint256 digest;

};

bool operator== (const Attachment& a, const Attachment& b);
bool operator!= (const Attachment& a, const Attachment& b);
bool operator< (const Attachment& a, const Attachment& b);
std::ostream& operator<< (std::ostream& out, const Attachment& a);

void StrictEncode (StrictWriter& out, const Attachment& a);
bool StrictDecode (StrictReader& in, Attachment& a);

/**
 * Media data stored directly in the contract (e.g. a small preview).
 */
struct EmbeddedMedia
{

  MediaType type;

  /** The raw data, at most MAX_SMALL_BLOB bytes.  */
  std::string data;

};

bool operator== (const EmbeddedMedia& a, const EmbeddedMedia& b);
bool operator!= (const EmbeddedMedia& a, const EmbeddedMedia& b);

void StrictEncode (StrictWriter& out, const EmbeddedMedia& m);
bool StrictDecode (StrictReader& in, EmbeddedMedia& m);

/**
 * A custom attachment category of a collection, identified by its
 * numeric id and described by a name.
 */
struct AttachmentType
{

  uint8_t id;
  AttachmentName name;

  /**
   * Constructs an instance with a hard-coded name.
   */
  static AttachmentType With (uint8_t id, const std::string& name);

};

bool operator== (const AttachmentType& a, const AttachmentType& b);
bool operator!= (const AttachmentType& a, const AttachmentType& b);

void StrictEncode (StrictWriter& out, const AttachmentType& t);
bool StrictDecode (StrictReader& in, AttachmentType& t);

} // namespace rgbif

#endif // ASSETS_MEDIA_HPP
