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

#include "media.hpp"

#include <glog/logging.h>

#include <sstream>
#include <tuple>

namespace rgbif
{

/* ************************************************************************** */

bool
MediaType::FromString (const std::string& str, MediaType& out)
{
  const auto slash = str.find ('/');
  if (slash == std::string::npos)
    {
      VLOG (1) << "Media type has no subtype separator: " << str;
      return false;
    }

  MediaType res;
  if (!MediaRegName::FromString (str.substr (0, slash), res.type))
    return false;

  const std::string sub = str.substr (slash + 1);
  if (sub != "*")
    {
      MediaRegName subtype;
      if (!MediaRegName::FromString (sub, subtype))
        return false;
      res.subtype = subtype;
    }

  out = res;
  return true;
}

MediaType
MediaType::With (const std::string& str)
{
  MediaType res;
  CHECK (FromString (str, res)) << "Invalid hard-coded media type: " << str;
  return res;
}

std::string
MediaType::ToString () const
{
  std::ostringstream out;
  out << type.GetString () << '/';
  if (subtype.has_value ())
    out << subtype->GetString ();
  else
    out << '*';
  return out.str ();
}

bool
operator== (const MediaType& a, const MediaType& b)
{
  return a.type == b.type && a.subtype == b.subtype && a.charset == b.charset;
}

bool
operator!= (const MediaType& a, const MediaType& b)
{
  return !(a == b);
}

bool
operator< (const MediaType& a, const MediaType& b)
{
  return std::tie (a.type, a.subtype, a.charset)
            < std::tie (b.type, b.subtype, b.charset);
}

std::ostream&
operator<< (std::ostream& out, const MediaType& t)
{
  out << t.ToString ();
  return out;
}

void
StrictEncode (StrictWriter& out, const MediaType& t)
{
  StrictEncode (out, t.type);
  StrictEncode (out, t.subtype);
  StrictEncode (out, t.charset);
}

bool
StrictDecode (StrictReader& in, MediaType& t)
{
  return StrictDecode (in, t.type)
            && StrictDecode (in, t.subtype)
            && StrictDecode (in, t.charset);
}

/* ************************************************************************** */

bool
operator== (const Attachment& a, const Attachment& b)
{
  return a.type == b.type && a.digest == b.digest;
}

bool
operator!= (const Attachment& a, const Attachment& b)
{
  return !(a == b);
}

bool
operator< (const Attachment& a, const Attachment& b)
{
  if (a.type != b.type)
    return a.type < b.type;
  return a.digest < b.digest;
}

std::ostream&
operator<< (std::ostream& out, const Attachment& a)
{
  out << "type " << a.type << ", digest 0x" << a.digest.ToHex ();
  return out;
}

void
StrictEncode (StrictWriter& out, const Attachment& a)
{
  StrictEncode (out, a.type);
  StrictEncode (out, a.digest);
}

bool
StrictDecode (StrictReader& in, Attachment& a)
{
  return StrictDecode (in, a.type) && StrictDecode (in, a.digest);
}

/* ************************************************************************** */

bool
operator== (const EmbeddedMedia& a, const EmbeddedMedia& b)
{
  return a.type == b.type && a.data == b.data;
}

bool
operator!= (const EmbeddedMedia& a, const EmbeddedMedia& b)
{
  return !(a == b);
}

void
StrictEncode (StrictWriter& out, const EmbeddedMedia& m)
{
  StrictEncode (out, m.type);
  out.WriteConfined (m.data, MAX_SMALL_BLOB);
}

bool
StrictDecode (StrictReader& in, EmbeddedMedia& m)
{
  return StrictDecode (in, m.type)
            && in.ReadConfined (0, MAX_SMALL_BLOB, m.data);
}

/* ************************************************************************** */

AttachmentType
AttachmentType::With (const uint8_t id, const std::string& name)
{
  AttachmentType res;
  res.id = id;
  res.name = AttachmentName::FromLiteral (name);
  return res;
}

bool
operator== (const AttachmentType& a, const AttachmentType& b)
{
  return a.id == b.id && a.name == b.name;
}

bool
operator!= (const AttachmentType& a, const AttachmentType& b)
{
  return !(a == b);
}

void
StrictEncode (StrictWriter& out, const AttachmentType& t)
{
  out.WriteU8 (t.id);
  StrictEncode (out, t.name);
}

bool
StrictDecode (StrictReader& in, AttachmentType& t)
{
  return in.ReadU8 (t.id) && StrictDecode (in, t.name);
}

} // namespace rgbif
