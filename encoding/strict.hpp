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

#ifndef ENCODING_STRICT_HPP
#define ENCODING_STRICT_HPP

#include <xayautil/uint256.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace rgbif
{

/** Maximum size of small binary blobs (with a u16 length prefix).  */
constexpr size_t MAX_SMALL_BLOB = 0xFFFF;

/**
 * Builder for strict-encoded byte data.  All integers are written in
 * little-endian order without any tags, and structures are just the
 * concatenation of their fields.  Length prefixes of confined collections
 * are one byte if the collection's upper bound fits into a byte, and two
 * bytes otherwise.
 */
class StrictWriter
{

private:

  /** The data written so far.  */
  std::string data;

public:

  StrictWriter () = default;

  StrictWriter (const StrictWriter&) = delete;
  void operator= (const StrictWriter&) = delete;

  void WriteU8 (uint8_t val);
  void WriteU16 (uint16_t val);
  void WriteU32 (uint32_t val);
  void WriteU64 (uint64_t val);

  /**
   * Writes raw bytes (e.g. a fixed-size array) without any length prefix.
   */
  void WriteBytes (const std::string& bytes);

  /**
   * Writes the given number of zero bytes.
   */
  void WriteZeros (size_t num);

  /**
   * Writes the length prefix for a confined collection with the given
   * upper bound on its size.
   */
  void WriteLength (size_t len, size_t maxLen);

  /**
   * Writes a confined string or blob, i.e. length prefix followed by
   * the raw bytes.
   */
  void WriteConfined (const std::string& bytes, size_t maxLen);

  /**
   * Writes the tag byte of an optional value.
   */
  void WriteOptionTag (bool present);

  /**
   * Returns the data written so far.
   */
  const std::string&
  GetData () const
  {
    return data;
  }

};

/**
 * Parser for strict-encoded data.  All methods return false if the data
 * is malformed (e.g. truncated).  In that case, the reader's position is
 * unspecified and decoding of the containing structure has to fail.
 *
 * The reader keeps a reference to the underlying data, which must outlive
 * the reader instance.
 */
class StrictReader
{

private:

  /** The data being read.  */
  const std::string& data;

  /** The current read position.  */
  size_t pos = 0;

public:

  explicit StrictReader (const std::string& d)
    : data(d)
  {}

  StrictReader () = delete;
  StrictReader (const StrictReader&) = delete;
  void operator= (const StrictReader&) = delete;

  bool ReadU8 (uint8_t& val);
  bool ReadU16 (uint16_t& val);
  bool ReadU32 (uint32_t& val);
  bool ReadU64 (uint64_t& val);

  /**
   * Reads exactly the given number of raw bytes.
   */
  bool ReadBytes (size_t num, std::string& bytes);

  /**
   * Advances the position by exactly the given number of bytes,
   * ignoring their content.
   */
  bool Skip (size_t num);

  /**
   * Reads a length prefix for a collection with the given upper bound.
   * Fails if the prefix exceeds the bound.
   */
  bool ReadLength (size_t maxLen, size_t& len);

  /**
   * Reads a confined string or blob and verifies its length is within
   * the given bounds.
   */
  bool ReadConfined (size_t minLen, size_t maxLen, std::string& bytes);

  /**
   * Reads the tag byte of an optional value.  Tags other than zero and
   * one are invalid.
   */
  bool ReadOptionTag (bool& present);

  /**
   * Returns the number of bytes not yet consumed.
   */
  size_t
  GetRemaining () const
  {
    return data.size () - pos;
  }

  bool
  AtEnd () const
  {
    return pos == data.size ();
  }

};

/* Encoding and decoding of the basic integer types.  All other types
   provide overloads of StrictEncode and StrictDecode next to their
   definition, so that the templates below find them.  */

void StrictEncode (StrictWriter& out, uint8_t val);
void StrictEncode (StrictWriter& out, uint16_t val);
void StrictEncode (StrictWriter& out, uint32_t val);
void StrictEncode (StrictWriter& out, uint64_t val);

bool StrictDecode (StrictReader& in, uint8_t& val);
bool StrictDecode (StrictReader& in, uint16_t& val);
bool StrictDecode (StrictReader& in, uint32_t& val);
bool StrictDecode (StrictReader& in, uint64_t& val);

/**
 * 32-byte hashes and identifiers are encoded as raw byte arrays.
 */
void StrictEncode (StrictWriter& out, const xaya::uint256& val);
bool StrictDecode (StrictReader& in, xaya::uint256& val);

/**
 * Encodes an optional value:  A zero byte if it is missing, and a one byte
 * followed by the value otherwise.
 */
template <typename T>
  void StrictEncode (StrictWriter& out, const std::optional<T>& val);

template <typename T>
  bool StrictDecode (StrictReader& in, std::optional<T>& val);

/**
 * Encodes a confined map with at most maxLen entries, ordered by key.
 */
template <typename K, typename V>
  void StrictEncodeMap (StrictWriter& out, const std::map<K, V>& m,
                        size_t maxLen);

/**
 * Decodes a confined map.  Keys must be strictly increasing in the data,
 * so that each map has exactly one valid encoding.
 */
template <typename K, typename V>
  bool StrictDecodeMap (StrictReader& in, size_t maxLen, std::map<K, V>& m);

/**
 * Encodes a confined ordered set with at most maxLen elements.
 */
template <typename T>
  void StrictEncodeSet (StrictWriter& out, const std::set<T>& s,
                        size_t maxLen);

template <typename T>
  bool StrictDecodeSet (StrictReader& in, size_t maxLen, std::set<T>& s);

/**
 * Serialises a full value into a byte string.
 */
template <typename T>
  std::string StrictSerialise (const T& val);

/**
 * Deserialises a full value from the given bytes.  Returns false if the
 * data is invalid or if there are extra bytes after the value.
 */
template <typename T>
  bool StrictDeserialise (const std::string& data, T& val);

} // namespace rgbif

#include "strict.tpp"

#endif // ENCODING_STRICT_HPP
