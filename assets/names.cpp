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

#include "names.hpp"

#include <glog/logging.h>

namespace rgbif
{

bool
IsAsciiAlpha (const char c)
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool
IsAsciiAlphaNum (const char c)
{
  return IsAsciiAlpha (c) || (c >= '0' && c <= '9');
}

bool
IsAsciiPrintable (const char c)
{
  return c >= 0x20 && c <= 0x7E;
}

bool
IsAsciiLower (const char c)
{
  return c >= 'a' && c <= 'z';
}

bool
IsMimeChar (const char c)
{
  if (IsAsciiLower (c) || (c >= '0' && c <= '9'))
    return true;

  switch (c)
    {
    case '!':
    case '#':
    case '$':
    case '&':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
      return true;
    default:
      return false;
    }
}

/* ************************************************************************** */

bool
RicardianContract::FromString (const std::string& str, RicardianContract& out)
{
  if (str.size () > MAX_LEN)
    {
      VLOG (1) << "Ricardian contract text is too long: " << str.size ();
      return false;
    }

  out.text = str;
  return true;
}

std::ostream&
operator<< (std::ostream& out, const RicardianContract& c)
{
  out << c.GetString ();
  return out;
}

void
StrictEncode (StrictWriter& out, const RicardianContract& c)
{
  out.WriteConfined (c.GetString (), RicardianContract::MAX_LEN);
}

bool
StrictDecode (StrictReader& in, RicardianContract& c)
{
  std::string str;
  if (!in.ReadConfined (0, RicardianContract::MAX_LEN, str))
    return false;

  return RicardianContract::FromString (str, c);
}

} // namespace rgbif
