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

#ifndef ASSETS_ASSETSPEC_HPP
#define ASSETS_ASSETSPEC_HPP

#include "media.hpp"
#include "names.hpp"

#include "contract/precision.hpp"
#include "encoding/strict.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace rgbif
{

/**
 * Basic specification of a fungible asset:  Its ticker, name and the
 * precision in which amounts should be displayed.
 */
struct AssetSpec
{

  Ticker ticker;
  AssetName name;
  std::optional<Details> details;
  Precision precision = DEFAULT_PRECISION;

  /**
   * Constructs a spec from hard-coded values, asserting that they
   * are valid.
   */
  static AssetSpec Create (const std::string& ticker, const std::string& name,
                           Precision precision);

  /**
   * Constructs a spec from user-supplied values.  Returns false if any
   * of them is invalid.  An empty details string means no details.
   */
  static bool FromStrings (const std::string& ticker, const std::string& name,
                           Precision precision, const std::string& details,
                           AssetSpec& out);

};

bool operator== (const AssetSpec& a, const AssetSpec& b);
bool operator!= (const AssetSpec& a, const AssetSpec& b);
std::ostream& operator<< (std::ostream& out, const AssetSpec& s);

void StrictEncode (StrictWriter& out, const AssetSpec& s);
bool StrictDecode (StrictReader& in, AssetSpec& s);

/**
 * Specification of a collectible contract, which has an optional
 * article instead of a ticker.
 */
struct ContractSpec
{

  std::optional<Article> article;
  AssetName name;
  std::optional<Details> details;
  Precision precision = DEFAULT_PRECISION;

  static ContractSpec Create (const std::string& name, Precision precision);

  /**
   * Constructs a spec with article from user-supplied values.  Returns
   * false if any of them is invalid.  An empty details string means
   * no details.
   */
  static bool FromStrings (const std::string& article, const std::string& name,
                           Precision precision, const std::string& details,
                           ContractSpec& out);

};

bool operator== (const ContractSpec& a, const ContractSpec& b);
bool operator!= (const ContractSpec& a, const ContractSpec& b);
std::ostream& operator<< (std::ostream& out, const ContractSpec& s);

void StrictEncode (StrictWriter& out, const ContractSpec& s);
bool StrictDecode (StrictReader& in, ContractSpec& s);

/**
 * Legal terms of a contract, with an optional media file
 * containing the full text.
 */
struct ContractTerms
{

  RicardianContract text;
  std::optional<Attachment> media;

};

bool operator== (const ContractTerms& a, const ContractTerms& b);
bool operator!= (const ContractTerms& a, const ContractTerms& b);
std::ostream& operator<< (std::ostream& out, const ContractTerms& t);

void StrictEncode (StrictWriter& out, const ContractTerms& t);
bool StrictDecode (StrictReader& in, ContractTerms& t);

} // namespace rgbif

#endif // ASSETS_ASSETSPEC_HPP
