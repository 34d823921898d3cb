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

/* Template implementation code for strict.hpp.  */

#include <glog/logging.h>

#include <utility>

namespace rgbif
{

template <typename T>
  void
  StrictEncode (StrictWriter& out, const std::optional<T>& val)
{
  out.WriteOptionTag (val.has_value ());
  if (val.has_value ())
    StrictEncode (out, *val);
}

template <typename T>
  bool
  StrictDecode (StrictReader& in, std::optional<T>& val)
{
  bool present;
  if (!in.ReadOptionTag (present))
    return false;

  if (!present)
    {
      val.reset ();
      return true;
    }

  T inner;
  if (!StrictDecode (in, inner))
    return false;

  val = std::move (inner);
  return true;
}

template <typename K, typename V>
  void
  StrictEncodeMap (StrictWriter& out, const std::map<K, V>& m,
                   const size_t maxLen)
{
  out.WriteLength (m.size (), maxLen);
  for (const auto& entry : m)
    {
      StrictEncode (out, entry.first);
      StrictEncode (out, entry.second);
    }
}

template <typename K, typename V>
  bool
  StrictDecodeMap (StrictReader& in, const size_t maxLen, std::map<K, V>& m)
{
  size_t len;
  if (!in.ReadLength (maxLen, len))
    return false;

  m.clear ();
  for (size_t i = 0; i < len; ++i)
    {
      K key;
      V value;
      if (!StrictDecode (in, key) || !StrictDecode (in, value))
        return false;

      if (!m.empty () && !(m.rbegin ()->first < key))
        {
          VLOG (1) << "Map keys are not strictly increasing at entry " << i;
          return false;
        }

      m.emplace_hint (m.end (), std::move (key), std::move (value));
    }

  return true;
}

template <typename T>
  void
  StrictEncodeSet (StrictWriter& out, const std::set<T>& s,
                   const size_t maxLen)
{
  out.WriteLength (s.size (), maxLen);
  for (const auto& entry : s)
    StrictEncode (out, entry);
}

template <typename T>
  bool
  StrictDecodeSet (StrictReader& in, const size_t maxLen, std::set<T>& s)
{
  size_t len;
  if (!in.ReadLength (maxLen, len))
    return false;

  s.clear ();
  for (size_t i = 0; i < len; ++i)
    {
      T entry;
      if (!StrictDecode (in, entry))
        return false;

      if (!s.empty () && !(*s.rbegin () < entry))
        {
          VLOG (1) << "Set elements are not strictly increasing at " << i;
          return false;
        }

      s.emplace_hint (s.end (), std::move (entry));
    }

  return true;
}

template <typename T>
  std::string
  StrictSerialise (const T& val)
{
  StrictWriter out;
  StrictEncode (out, val);
  return out.GetData ();
}

template <typename T>
  bool
  StrictDeserialise (const std::string& data, T& val)
{
  StrictReader in(data);
  if (!StrictDecode (in, val))
    return false;

  if (!in.AtEnd ())
    {
      VLOG (1)
          << "Strict data has " << in.GetRemaining ()
          << " extra bytes after the value";
      return false;
    }

  return true;
}

} // namespace rgbif
