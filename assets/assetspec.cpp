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

#include "assetspec.hpp"

namespace rgbif
{

namespace
{

/**
 * Writes an optional value for display, using "~" if it is missing.
 */
template <typename T>
  void
  PrintOptional (std::ostream& out, const std::optional<T>& val)
{
  if (val.has_value ())
    out << *val;
  else
    out << '~';
}

/**
 * Parses optional details, where the empty string means "none".
 */
bool
ParseOptionalDetails (const std::string& str, std::optional<Details>& out)
{
  if (str.empty ())
    {
      out.reset ();
      return true;
    }

  Details details;
  if (!Details::FromString (str, details))
    return false;

  out = details;
  return true;
}

} // anonymous namespace

/* ************************************************************************** */

AssetSpec
AssetSpec::Create (const std::string& ticker, const std::string& name,
                   const Precision precision)
{
  AssetSpec res;
  res.ticker = Ticker::FromLiteral (ticker);
  res.name = AssetName::FromLiteral (name);
  res.precision = precision;
  return res;
}

bool
AssetSpec::FromStrings (const std::string& ticker, const std::string& name,
                        const Precision precision, const std::string& details,
                        AssetSpec& out)
{
  AssetSpec res;
  if (!Ticker::FromString (ticker, res.ticker)
        || !AssetName::FromString (name, res.name)
        || !ParseOptionalDetails (details, res.details))
    return false;

  res.precision = precision;
  out = res;
  return true;
}

bool
operator== (const AssetSpec& a, const AssetSpec& b)
{
  return a.ticker == b.ticker && a.name == b.name
            && a.details == b.details && a.precision == b.precision;
}

bool
operator!= (const AssetSpec& a, const AssetSpec& b)
{
  return !(a == b);
}

std::ostream&
operator<< (std::ostream& out, const AssetSpec& s)
{
  out << "ticker " << s.ticker << ", name " << s.name << ", details ";
  PrintOptional (out, s.details);
  out << ", precision " << s.precision;
  return out;
}

void
StrictEncode (StrictWriter& out, const AssetSpec& s)
{
  StrictEncode (out, s.ticker);
  StrictEncode (out, s.name);
  StrictEncode (out, s.details);
  StrictEncode (out, s.precision);
}

bool
StrictDecode (StrictReader& in, AssetSpec& s)
{
  return StrictDecode (in, s.ticker)
            && StrictDecode (in, s.name)
            && StrictDecode (in, s.details)
            && StrictDecode (in, s.precision);
}

/* ************************************************************************** */

ContractSpec
ContractSpec::Create (const std::string& name, const Precision precision)
{
  ContractSpec res;
  res.name = AssetName::FromLiteral (name);
  res.precision = precision;
  return res;
}

bool
ContractSpec::FromStrings (const std::string& article, const std::string& name,
                           const Precision precision,
                           const std::string& details, ContractSpec& out)
{
  ContractSpec res;

  Article parsedArticle;
  if (!Article::FromString (article, parsedArticle))
    return false;
  res.article = parsedArticle;

  if (!AssetName::FromString (name, res.name)
        || !ParseOptionalDetails (details, res.details))
    return false;

  res.precision = precision;
  out = res;
  return true;
}

bool
operator== (const ContractSpec& a, const ContractSpec& b)
{
  return a.article == b.article && a.name == b.name
            && a.details == b.details && a.precision == b.precision;
}

bool
operator!= (const ContractSpec& a, const ContractSpec& b)
{
  return !(a == b);
}

std::ostream&
operator<< (std::ostream& out, const ContractSpec& s)
{
  out << "article ";
  PrintOptional (out, s.article);
  out << ", name " << s.name << ", details ";
  PrintOptional (out, s.details);
  out << ", precision " << s.precision;
  return out;
}

void
StrictEncode (StrictWriter& out, const ContractSpec& s)
{
  StrictEncode (out, s.article);
  StrictEncode (out, s.name);
  StrictEncode (out, s.details);
  StrictEncode (out, s.precision);
}

bool
StrictDecode (StrictReader& in, ContractSpec& s)
{
  return StrictDecode (in, s.article)
            && StrictDecode (in, s.name)
            && StrictDecode (in, s.details)
            && StrictDecode (in, s.precision);
}

/* ************************************************************************** */

bool
operator== (const ContractTerms& a, const ContractTerms& b)
{
  return a.text == b.text && a.media == b.media;
}

bool
operator!= (const ContractTerms& a, const ContractTerms& b)
{
  return !(a == b);
}

std::ostream&
operator<< (std::ostream& out, const ContractTerms& t)
{
  out << "text " << t.text << ", media ";
  PrintOptional (out, t.media);
  return out;
}

void
StrictEncode (StrictWriter& out, const ContractTerms& t)
{
  StrictEncode (out, t.text);
  StrictEncode (out, t.media);
}

bool
StrictDecode (StrictReader& in, ContractTerms& t)
{
  return StrictDecode (in, t.text) && StrictDecode (in, t.media);
}

} // namespace rgbif
