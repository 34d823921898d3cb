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

#include <gtest/gtest.h>

#include <set>
#include <unordered_set>

namespace rgbif
{
namespace
{

/* ************************************************************************** */

using TickerTests = testing::Test;

TEST_F (TickerTests, Valid)
{
  for (const std::string str : {"BTC", "usdt", "A1", "ABCDEFGH", "x9Y8"})
    {
      Ticker t;
      ASSERT_TRUE (Ticker::FromString (str, t)) << str;
      EXPECT_EQ (t.GetString (), str);
    }
}

TEST_F (TickerTests, Invalid)
{
  for (const std::string str : {"", "A", "ABCDEFGHI", "1BTC", "BT C",
                                "BTC!", "_BTC", "BTC\n"})
    {
      Ticker t;
      EXPECT_FALSE (Ticker::FromString (str, t)) << str;
    }
}

TEST_F (TickerTests, CaseInsensitive)
{
  const auto lower = Ticker::FromLiteral ("usdt");
  const auto upper = Ticker::FromLiteral ("USDT");
  EXPECT_EQ (lower, upper);
  EXPECT_FALSE (lower < upper);
  EXPECT_FALSE (upper < lower);
  EXPECT_EQ (lower.GetString (), "usdt");

  const std::unordered_set<Ticker> tickers = {lower, upper};
  EXPECT_EQ (tickers.size (), 1);

  const std::set<Ticker> ordered = {lower, upper, Ticker::FromLiteral ("BTC")};
  EXPECT_EQ (ordered.size (), 2);
}

TEST_F (TickerTests, FromLiteralAsserts)
{
  EXPECT_DEATH (Ticker::FromLiteral ("1"), "Invalid hard-coded Ticker");
}

/* ************************************************************************** */

using ConfinedNameTests = testing::Test;

TEST_F (ConfinedNameTests, AssetName)
{
  AssetName n;
  EXPECT_TRUE (AssetName::FromString ("Tether USD", n));
  EXPECT_TRUE (AssetName::FromString (" ", n));
  EXPECT_TRUE (AssetName::FromString (std::string (40, 'x'), n));
  EXPECT_FALSE (AssetName::FromString (std::string (41, 'x'), n));
  EXPECT_FALSE (AssetName::FromString ("", n));
  EXPECT_FALSE (AssetName::FromString ("tab\there", n));
  EXPECT_FALSE (AssetName::FromString ("caf\xC3\xA9", n));
}

TEST_F (ConfinedNameTests, CaseSensitiveByDefault)
{
  EXPECT_NE (AssetName::FromLiteral ("abc"), AssetName::FromLiteral ("ABC"));
}

TEST_F (ConfinedNameTests, Details)
{
  Details d;
  EXPECT_TRUE (Details::FromString (std::string (255, '~'), d));
  EXPECT_FALSE (Details::FromString (std::string (256, '~'), d));
  EXPECT_FALSE (Details::FromString ("", d));
}

TEST_F (ConfinedNameTests, Article)
{
  Article a;
  EXPECT_TRUE (Article::FromString ("Painting", a));
  EXPECT_TRUE (Article::FromString ("X", a));
  EXPECT_FALSE (Article::FromString ("2D", a));
  EXPECT_FALSE (Article::FromString ("Oil painting", a));
  EXPECT_FALSE (Article::FromString (std::string (33, 'a'), a));
}

TEST_F (ConfinedNameTests, MediaRegName)
{
  MediaRegName m;
  EXPECT_TRUE (MediaRegName::FromString ("text", m));
  EXPECT_TRUE (MediaRegName::FromString ("vnd.ms-excel", m));
  EXPECT_TRUE (MediaRegName::FromString ("svg+xml", m));
  EXPECT_TRUE (MediaRegName::FromString ("a!#$&^_9", m));
  EXPECT_FALSE (MediaRegName::FromString ("Text", m));
  EXPECT_FALSE (MediaRegName::FromString ("9p", m));
  EXPECT_FALSE (MediaRegName::FromString ("text/plain", m));
  EXPECT_FALSE (MediaRegName::FromString ("image*", m));
  EXPECT_FALSE (MediaRegName::FromString (std::string (65, 'a'), m));
}

TEST_F (ConfinedNameTests, AttachmentName)
{
  AttachmentName n;
  EXPECT_TRUE (AttachmentName::FromString ("High resolution", n));
  EXPECT_FALSE (AttachmentName::FromString (std::string (21, 'a'), n));
}

/* ************************************************************************** */

using ConfinedStringStrictTests = testing::Test;

TEST_F (ConfinedStringStrictTests, Encoding)
{
  EXPECT_EQ (StrictSerialise (Ticker::FromLiteral ("BTC")), "\x03" "BTC");

  Ticker t;
  ASSERT_TRUE (StrictDeserialise ("\x04" "usdt", t));
  EXPECT_EQ (t.GetString (), "usdt");
}

TEST_F (ConfinedStringStrictTests, DecodingValidates)
{
  Ticker t;
  EXPECT_FALSE (StrictDeserialise ("\x01" "A", t));
  EXPECT_FALSE (StrictDeserialise ("\x03" "1AB", t));
  EXPECT_FALSE (StrictDeserialise ("\x09" "ABCDEFGHI", t));
  EXPECT_FALSE (StrictDeserialise ("\x04" "ABC", t));
}

/* ************************************************************************** */

using RicardianContractTests = testing::Test;

TEST_F (RicardianContractTests, Length)
{
  RicardianContract c;
  EXPECT_TRUE (RicardianContract::FromString ("", c));
  EXPECT_TRUE (RicardianContract::FromString ("Terms\nand conditions", c));
  EXPECT_TRUE (RicardianContract::FromString (std::string (0xFFFF, 'x'), c));
  EXPECT_FALSE (RicardianContract::FromString (std::string (0x10000, 'x'), c));
}

TEST_F (RicardianContractTests, Encoding)
{
  RicardianContract c;
  ASSERT_TRUE (RicardianContract::FromString ("abc", c));
  EXPECT_EQ (StrictSerialise (c), std::string ("\x03\x00" "abc", 5));

  EXPECT_EQ (StrictSerialise (RicardianContract ()), std::string (2, '\0'));

  RicardianContract decoded;
  ASSERT_TRUE (StrictDeserialise (std::string ("\x03\x00" "abc", 5), decoded));
  EXPECT_EQ (decoded, c);
}

} // anonymous namespace
} // namespace rgbif
