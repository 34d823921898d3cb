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

/* Template implementation code for names.hpp.  */

#include <glog/logging.h>

#include <cctype>

namespace rgbif
{

template <typename Rules>
  bool
  ConfinedString<Rules>::IsValid (const std::string& str)
{
  if (str.size () < Rules::MIN_LEN || str.size () > Rules::MAX_LEN)
    {
      VLOG (1)
          << Rules::TYPE_NAME << " has invalid length " << str.size ()
          << ": " << str;
      return false;
    }

  for (size_t i = 0; i < str.size (); ++i)
    {
      const bool ok = (i == 0 ? Rules::IsValidFirst (str[i])
                              : Rules::IsValidRest (str[i]));
      if (!ok)
        {
          VLOG (1)
              << Rules::TYPE_NAME << " has invalid character at position "
              << i << ": " << str;
          return false;
        }
    }

  return true;
}

template <typename Rules>
  bool
  ConfinedString<Rules>::FromString (const std::string& str,
                                     ConfinedString& out)
{
  if (!IsValid (str))
    return false;

  out = ConfinedString (str);
  return true;
}

template <typename Rules>
  ConfinedString<Rules>
  ConfinedString<Rules>::FromLiteral (const std::string& str)
{
  ConfinedString res;
  CHECK (FromString (str, res))
      << "Invalid hard-coded " << Rules::TYPE_NAME << ": " << str;
  return res;
}

template <typename Rules>
  std::string
  ConfinedString<Rules>::GetNormalised () const
{
  if (!Rules::CASE_INSENSITIVE)
    return value;

  std::string res = value;
  for (auto& c : res)
    c = std::toupper (static_cast<unsigned char> (c));
  return res;
}

template <typename Rules>
  bool
  operator== (const ConfinedString<Rules>& a, const ConfinedString<Rules>& b)
{
  return a.GetNormalised () == b.GetNormalised ();
}

template <typename Rules>
  bool
  operator!= (const ConfinedString<Rules>& a, const ConfinedString<Rules>& b)
{
  return !(a == b);
}

template <typename Rules>
  bool
  operator< (const ConfinedString<Rules>& a, const ConfinedString<Rules>& b)
{
  return a.GetNormalised () < b.GetNormalised ();
}

template <typename Rules>
  std::ostream&
  operator<< (std::ostream& out, const ConfinedString<Rules>& s)
{
  out << s.GetString ();
  return out;
}

template <typename Rules>
  void
  StrictEncode (StrictWriter& out, const ConfinedString<Rules>& s)
{
  out.WriteConfined (s.GetString (), Rules::MAX_LEN);
}

template <typename Rules>
  bool
  StrictDecode (StrictReader& in, ConfinedString<Rules>& s)
{
  std::string str;
  if (!in.ReadConfined (Rules::MIN_LEN, Rules::MAX_LEN, str))
    return false;

  return ConfinedString<Rules>::FromString (str, s);
}

} // namespace rgbif
