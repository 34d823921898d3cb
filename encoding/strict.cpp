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

#include "strict.hpp"

#include <glog/logging.h>

namespace rgbif
{

namespace
{

/** Largest upper bound for which the length prefix is a single byte.  */
constexpr size_t MAX_U8_LEN = 0xFF;

/** Largest upper bound that we support for length prefixes at all.  */
constexpr size_t MAX_U16_LEN = 0xFFFF;

/** Size of an encoded uint256 in bytes.  */
constexpr size_t UINT256_BYTES = 32;

/**
 * Writes an unsigned integer of the given number of bytes in
 * little-endian order.
 */
void
WriteLittleEndian (std::string& out, uint64_t val, const unsigned bytes)
{
  for (unsigned i = 0; i < bytes; ++i)
    {
      out.push_back (static_cast<char> (val & 0xFF));
      val >>= 8;
    }
  CHECK_EQ (val, 0) << "Integer too large for " << bytes << " bytes";
}

} // anonymous namespace

/* ************************************************************************** */

void
StrictWriter::WriteU8 (const uint8_t val)
{
  WriteLittleEndian (data, val, 1);
}

void
StrictWriter::WriteU16 (const uint16_t val)
{
  WriteLittleEndian (data, val, 2);
}

void
StrictWriter::WriteU32 (const uint32_t val)
{
  WriteLittleEndian (data, val, 4);
}

void
StrictWriter::WriteU64 (const uint64_t val)
{
  WriteLittleEndian (data, val, 8);
}

void
StrictWriter::WriteBytes (const std::string& bytes)
{
  data.append (bytes);
}

void
StrictWriter::WriteZeros (const size_t num)
{
  data.append (num, '\0');
}

void
StrictWriter::WriteLength (const size_t len, const size_t maxLen)
{
  CHECK_LE (maxLen, MAX_U16_LEN) << "Unsupported collection bound";
  CHECK_LE (len, maxLen) << "Collection exceeds its confinement";

  if (maxLen <= MAX_U8_LEN)
    WriteU8 (static_cast<uint8_t> (len));
  else
    WriteU16 (static_cast<uint16_t> (len));
}

void
StrictWriter::WriteConfined (const std::string& bytes, const size_t maxLen)
{
  WriteLength (bytes.size (), maxLen);
  WriteBytes (bytes);
}

void
StrictWriter::WriteOptionTag (const bool present)
{
  WriteU8 (present ? 1 : 0);
}

/* ************************************************************************** */

bool
StrictReader::ReadU8 (uint8_t& val)
{
  if (GetRemaining () < 1)
    {
      VLOG (1) << "Unexpected end of strict data reading u8 at " << pos;
      return false;
    }

  val = static_cast<uint8_t> (data[pos]);
  ++pos;
  return true;
}

bool
StrictReader::ReadU16 (uint16_t& val)
{
  uint8_t lo, hi;
  if (!ReadU8 (lo) || !ReadU8 (hi))
    return false;

  val = lo | (static_cast<uint16_t> (hi) << 8);
  return true;
}

bool
StrictReader::ReadU32 (uint32_t& val)
{
  uint16_t lo, hi;
  if (!ReadU16 (lo) || !ReadU16 (hi))
    return false;

  val = lo | (static_cast<uint32_t> (hi) << 16);
  return true;
}

bool
StrictReader::ReadU64 (uint64_t& val)
{
  uint32_t lo, hi;
  if (!ReadU32 (lo) || !ReadU32 (hi))
    return false;

  val = lo | (static_cast<uint64_t> (hi) << 32);
  return true;
}

bool
StrictReader::ReadBytes (const size_t num, std::string& bytes)
{
  if (GetRemaining () < num)
    {
      VLOG (1)
          << "Unexpected end of strict data reading " << num
          << " bytes at " << pos << " (" << GetRemaining () << " left)";
      return false;
    }

  bytes = data.substr (pos, num);
  pos += num;
  return true;
}

bool
StrictReader::Skip (const size_t num)
{
  if (GetRemaining () < num)
    {
      VLOG (1)
          << "Unexpected end of strict data skipping " << num
          << " bytes at " << pos << " (" << GetRemaining () << " left)";
      return false;
    }

  pos += num;
  return true;
}

bool
StrictReader::ReadLength (const size_t maxLen, size_t& len)
{
  CHECK_LE (maxLen, MAX_U16_LEN) << "Unsupported collection bound";

  if (maxLen <= MAX_U8_LEN)
    {
      uint8_t val;
      if (!ReadU8 (val))
        return false;
      len = val;
    }
  else
    {
      uint16_t val;
      if (!ReadU16 (val))
        return false;
      len = val;
    }

  if (len > maxLen)
    {
      VLOG (1)
          << "Collection length " << len << " exceeds the bound " << maxLen;
      return false;
    }

  return true;
}

bool
StrictReader::ReadConfined (const size_t minLen, const size_t maxLen,
                            std::string& bytes)
{
  size_t len;
  if (!ReadLength (maxLen, len))
    return false;

  if (len < minLen)
    {
      VLOG (1)
          << "Collection length " << len << " is below the minimum " << minLen;
      return false;
    }

  return ReadBytes (len, bytes);
}

bool
StrictReader::ReadOptionTag (bool& present)
{
  uint8_t tag;
  if (!ReadU8 (tag))
    return false;

  switch (tag)
    {
    case 0:
      present = false;
      return true;
    case 1:
      present = true;
      return true;
    default:
      VLOG (1) << "Invalid option tag: " << static_cast<int> (tag);
      return false;
    }
}

/* ************************************************************************** */

void
StrictEncode (StrictWriter& out, const uint8_t val)
{
  out.WriteU8 (val);
}

void
StrictEncode (StrictWriter& out, const uint16_t val)
{
  out.WriteU16 (val);
}

void
StrictEncode (StrictWriter& out, const uint32_t val)
{
  out.WriteU32 (val);
}

void
StrictEncode (StrictWriter& out, const uint64_t val)
{
  out.WriteU64 (val);
}

bool
StrictDecode (StrictReader& in, uint8_t& val)
{
  return in.ReadU8 (val);
}

bool
StrictDecode (StrictReader& in, uint16_t& val)
{
  return in.ReadU16 (val);
}

bool
StrictDecode (StrictReader& in, uint32_t& val)
{
  return in.ReadU32 (val);
}

bool
StrictDecode (StrictReader& in, uint64_t& val)
{
  return in.ReadU64 (val);
}

void
StrictEncode (StrictWriter& out, const xaya::uint256& val)
{
  const auto* blob = val.GetBlob ();
  out.WriteBytes (std::string (reinterpret_cast<const char*> (blob),
                               UINT256_BYTES));
}

bool
StrictDecode (StrictReader& in, xaya::uint256& val)
{
  std::string bytes;
  if (!in.ReadBytes (UINT256_BYTES, bytes))
    return false;

  val.FromBlob (reinterpret_cast<const unsigned char*> (bytes.data ()));
  return true;
}

} // namespace rgbif
