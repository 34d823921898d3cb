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

#ifndef ASSETS_NAMES_HPP
#define ASSETS_NAMES_HPP

#include "encoding/strict.hpp"

#include <cstddef>
#include <functional>
#include <iostream>
#include <string>

namespace rgbif
{

/**
 * A string with restricted length and character set.  The restrictions
 * are given by the Rules class, which provides:
 *
 *  - MIN_LEN and MAX_LEN, the bounds on the length in bytes,
 *  - IsValidFirst and IsValidRest, to check individual characters,
 *  - CASE_INSENSITIVE, whether comparison ignores ASCII case,
 *  - TYPE_NAME, the name used in log messages.
 *
 * Instances can only be constructed through FromString (or FromLiteral),
 * so that the value is always valid.  The default constructor produces
 * an empty placeholder that is only meant to be filled in by FromString
 * or decoding.
 */
template <typename Rules>
  class ConfinedString
{

private:

  /** The actual string value.  */
  std::string value;

  explicit ConfinedString (const std::string& v)
    : value(v)
  {}

public:

  ConfinedString () = default;

  ConfinedString (const ConfinedString&) = default;
  ConfinedString (ConfinedString&&) = default;
  ConfinedString& operator= (const ConfinedString&) = default;
  ConfinedString& operator= (ConfinedString&&) = default;

  /**
   * Returns true if the given string satisfies all restrictions.
   */
  static bool IsValid (const std::string& str);

  /**
   * Constructs an instance from the given string, returning false if it
   * is not valid.
   */
  static bool FromString (const std::string& str, ConfinedString& out);

  /**
   * Constructs an instance from a hard-coded string, which is asserted
   * to be valid.
   */
  static ConfinedString FromLiteral (const std::string& str);

  const std::string&
  GetString () const
  {
    return value;
  }

  /**
   * Returns the value as used for comparisons, i.e. upper-cased if the
   * rules ask for case insensitivity.
   */
  std::string GetNormalised () const;

};

template <typename Rules>
  bool operator== (const ConfinedString<Rules>& a,
                   const ConfinedString<Rules>& b);
template <typename Rules>
  bool operator!= (const ConfinedString<Rules>& a,
                   const ConfinedString<Rules>& b);
template <typename Rules>
  bool operator< (const ConfinedString<Rules>& a,
                  const ConfinedString<Rules>& b);

template <typename Rules>
  std::ostream& operator<< (std::ostream& out, const ConfinedString<Rules>& s);

/**
 * Confined strings are encoded with a length prefix sized according to
 * their maximum length.  Decoding validates the content.
 */
template <typename Rules>
  void StrictEncode (StrictWriter& out, const ConfinedString<Rules>& s);
template <typename Rules>
  bool StrictDecode (StrictReader& in, ConfinedString<Rules>& s);

/* ************************************************************************** */

/** Returns true for ASCII letters.  */
bool IsAsciiAlpha (char c);

/** Returns true for ASCII letters and digits.  */
bool IsAsciiAlphaNum (char c);

/** Returns true for printable ASCII characters (including space).  */
bool IsAsciiPrintable (char c);

/** Returns true for lower-case ASCII letters.  */
bool IsAsciiLower (char c);

/**
 * Returns true for characters allowed in MIME registry names after
 * the first one.
 */
bool IsMimeChar (char c);

/**
 * Rules for identifiers that start with a letter and continue with
 * letters and digits.
 */
template <size_t MinLen, size_t MaxLen>
  struct IdentRules
{
  static constexpr size_t MIN_LEN = MinLen;
  static constexpr size_t MAX_LEN = MaxLen;
  static constexpr bool CASE_INSENSITIVE = false;

  static bool
  IsValidFirst (const char c)
  {
    return IsAsciiAlpha (c);
  }

  static bool
  IsValidRest (const char c)
  {
    return IsAsciiAlphaNum (c);
  }
};

/**
 * Rules for free-form text of printable ASCII characters.
 */
template <size_t MinLen, size_t MaxLen>
  struct PrintableRules
{
  static constexpr size_t MIN_LEN = MinLen;
  static constexpr size_t MAX_LEN = MaxLen;
  static constexpr bool CASE_INSENSITIVE = false;

  static bool
  IsValidFirst (const char c)
  {
    return IsAsciiPrintable (c);
  }

  static bool
  IsValidRest (const char c)
  {
    return IsAsciiPrintable (c);
  }
};

struct TickerRules : public IdentRules<2, 8>
{
  static constexpr bool CASE_INSENSITIVE = true;
  static constexpr const char* TYPE_NAME = "Ticker";
};

struct AssetNameRules : public PrintableRules<1, 40>
{
  static constexpr const char* TYPE_NAME = "AssetName";
};

struct DetailsRules : public PrintableRules<1, 0xFF>
{
  static constexpr const char* TYPE_NAME = "Details";
};

struct ArticleRules : public IdentRules<1, 32>
{
  static constexpr const char* TYPE_NAME = "Article";
};

struct AttachmentNameRules : public PrintableRules<1, 20>
{
  static constexpr const char* TYPE_NAME = "AttachmentName";
};

struct MediaRegNameRules
{
  static constexpr size_t MIN_LEN = 1;
  static constexpr size_t MAX_LEN = 64;
  static constexpr bool CASE_INSENSITIVE = false;
  static constexpr const char* TYPE_NAME = "MediaRegName";

  static bool
  IsValidFirst (const char c)
  {
    return IsAsciiLower (c);
  }

  static bool
  IsValidRest (const char c)
  {
    return IsMimeChar (c);
  }
};

/**
 * Short ticker symbol of an asset (e.g. "BTC").  Tickers compare
 * case-insensitively.
 */
using Ticker = ConfinedString<TickerRules>;

/** Human-readable name of an asset or contract.  */
using AssetName = ConfinedString<AssetNameRules>;

/** Longer free-form description.  */
using Details = ConfinedString<DetailsRules>;

/** Kind of a collectible contract (e.g. "Painting").  */
using Article = ConfinedString<ArticleRules>;

/** Name of a custom attachment type of an NFT.  */
using AttachmentName = ConfinedString<AttachmentNameRules>;

/** Type or subtype name of a MIME media type.  */
using MediaRegName = ConfinedString<MediaRegNameRules>;

/* ************************************************************************** */

/**
 * The text of a Ricardian contract.  This is arbitrary text of up
 * to 0xFFFF bytes, which may also be empty.
 */
class RicardianContract
{

private:

  std::string text;

public:

  /** Maximum length of the text in bytes.  */
  static constexpr size_t MAX_LEN = 0xFFFF;

  RicardianContract () = default;

  RicardianContract (const RicardianContract&) = default;
  RicardianContract& operator= (const RicardianContract&) = default;

  /**
   * Constructs the contract from some text, returning false if it
   * is too long.
   */
  static bool FromString (const std::string& str, RicardianContract& out);

  const std::string&
  GetString () const
  {
    return text;
  }

  friend bool
  operator== (const RicardianContract& a, const RicardianContract& b)
  {
    return a.text == b.text;
  }

  friend bool
  operator!= (const RicardianContract& a, const RicardianContract& b)
  {
    return !(a == b);
  }

};

std::ostream& operator<< (std::ostream& out, const RicardianContract& c);

void StrictEncode (StrictWriter& out, const RicardianContract& c);
bool StrictDecode (StrictReader& in, RicardianContract& c);

} // namespace rgbif

namespace std
{

/**
 * Hashing of confined strings, consistent with their (possibly
 * case-insensitive) equality.
 */
template <typename Rules>
  struct hash<rgbif::ConfinedString<Rules>>
{

  size_t
  operator() (const rgbif::ConfinedString<Rules>& s) const
  {
    return hash<std::string> () (s.GetNormalised ());
  }

};

} // namespace std

#include "names.tpp"

#endif // ASSETS_NAMES_HPP
