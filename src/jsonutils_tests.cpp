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

#include "jsonutils.hpp"

#include "testutils.hpp"

#include <gtest/gtest.h>

#include <glog/logging.h>

#include <limits>

namespace rgbif
{
namespace
{

const std::string DIGEST_HEX
    = "9b1f0a3c5d7e2f4a6b8c0d1e2f3a4b5c6d7e8f9a0b1c2d3e4f5a6b7c8d9e0f1a";

xaya::uint256
TestDigest ()
{
  xaya::uint256 res;
  CHECK (res.FromHex (DIGEST_HEX));
  return res;
}

/* ************************************************************************** */

using AmountJsonTests = testing::Test;

TEST_F (AmountJsonTests, ToJson)
{
  EXPECT_TRUE (JsonEqual (AmountToJson (Amount (42)), ParseJson ("42")));
  EXPECT_TRUE (JsonEqual (
      AmountToJson (Amount (std::numeric_limits<uint64_t>::max ())),
      ParseJson ("18446744073709551615")));
}

TEST_F (AmountJsonTests, Valid)
{
  Amount a;
  ASSERT_TRUE (AmountFromJson (ParseJson ("0"), a));
  EXPECT_EQ (a, Amount::Zero ());
  ASSERT_TRUE (AmountFromJson (ParseJson ("18446744073709551615"), a));
  EXPECT_EQ (a, Amount (std::numeric_limits<uint64_t>::max ()));
}

TEST_F (AmountJsonTests, Invalid)
{
  for (const auto& str : {"-1", "1.5", "1.0", "2e2", R"("42")", "null",
                          "[]", "18446744073709551616"})
    {
      Amount a;
      EXPECT_FALSE (AmountFromJson (ParseJson (str), a)) << str;
    }
}

/* ************************************************************************** */

using PrecisionJsonTests = testing::Test;

TEST_F (PrecisionJsonTests, Names)
{
  EXPECT_TRUE (JsonEqual (PrecisionToJson (Precision::CENTI_MICRO),
                          ParseJson (R"("centiMicro")")));

  Precision p;
  ASSERT_TRUE (PrecisionFromJson (ParseJson (R"("deci")"), p));
  EXPECT_EQ (p, Precision::DECI);

  EXPECT_FALSE (PrecisionFromJson (ParseJson ("1"), p));
  EXPECT_FALSE (PrecisionFromJson (ParseJson (R"("Deci")"), p));
  EXPECT_FALSE (PrecisionFromJson (ParseJson (R"("foo")"), p));
}

/* ************************************************************************** */

using NameJsonTests = testing::Test;

TEST_F (NameJsonTests, Confined)
{
  EXPECT_TRUE (JsonEqual (NameToJson (Ticker::FromLiteral ("BTC")),
                          ParseJson (R"("BTC")")));

  Ticker t;
  ASSERT_TRUE (NameFromJson (ParseJson (R"("USDT")"), t));
  EXPECT_EQ (t.GetString (), "USDT");

  EXPECT_FALSE (NameFromJson (ParseJson ("42"), t));
  EXPECT_FALSE (NameFromJson (ParseJson (R"("B")"), t));
  EXPECT_FALSE (NameFromJson (ParseJson (R"("1BTC")"), t));
}

/* ************************************************************************** */

using MediaJsonTests = testing::Test;

TEST_F (MediaJsonTests, MediaType)
{
  EXPECT_TRUE (JsonEqual (MediaTypeToJson (MediaType::With ("image/png")),
                          ParseJson (R"({"type": "image", "subtype": "png"})")));

  MediaType t;
  ASSERT_TRUE (MediaTypeFromJson (ParseJson (R"(
    {"type": "text", "subtype": "plain", "charset": "utf-8"}
  )"), t));
  EXPECT_EQ (t.type.GetString (), "text");
  ASSERT_TRUE (t.charset.has_value ());
  EXPECT_EQ (t.charset->GetString (), "utf-8");

  ASSERT_TRUE (MediaTypeFromJson (ParseJson (R"({"type": "image"})"), t));
  EXPECT_FALSE (t.subtype.has_value ());

  for (const auto& str : {"{}", R"("image/png")", R"({"type": "Image"})",
                          R"({"type": "image", "foo": "bar"})",
                          R"({"type": "image", "subtype": 5})"})
    EXPECT_FALSE (MediaTypeFromJson (ParseJson (str), t)) << str;
}

TEST_F (MediaJsonTests, Attachment)
{
  Attachment a;
  a.type = MediaType::With ("image/jpeg");
  a.digest = TestDigest ();

  const Json::Value val = AttachmentToJson (a);
  EXPECT_TRUE (JsonEqual (val, ParseJson (R"(
    {
      "type": {"type": "image", "subtype": "jpeg"},
      "digest": ")" + DIGEST_HEX + R"("
    }
  )")));

  Attachment parsed;
  ASSERT_TRUE (AttachmentFromJson (val, parsed));
  EXPECT_EQ (parsed, a);

  EXPECT_FALSE (AttachmentFromJson (ParseJson (R"(
    {"type": {"type": "image"}, "digest": "abcd"}
  )"), parsed));
}

TEST_F (MediaJsonTests, EmbeddedMedia)
{
  EmbeddedMedia m;
  m.type = MediaType::With ("text/plain");
  m.data = "hello";

  const Json::Value val = EmbeddedMediaToJson (m);
  EXPECT_TRUE (JsonEqual (val, ParseJson (R"(
    {
      "type": {"type": "text", "subtype": "plain"},
      "data": "aGVsbG8="
    }
  )")));

  EmbeddedMedia parsed;
  ASSERT_TRUE (EmbeddedMediaFromJson (val, parsed));
  EXPECT_EQ (parsed, m);

  EXPECT_FALSE (EmbeddedMediaFromJson (ParseJson (R"(
    {"type": {"type": "text"}, "data": "not base64!"}
  )"), parsed));
}

/* ************************************************************************** */

using ReservesJsonTests = testing::Test;

TEST_F (ReservesJsonTests, Outpoint)
{
  Outpoint o;
  o.txid = TestDigest ();
  o.vout = 7;

  EXPECT_TRUE (JsonEqual (OutpointToJson (o),
                          Json::Value (DIGEST_HEX + ":7")));

  Outpoint parsed;
  ASSERT_TRUE (OutpointFromJson (OutpointToJson (o), parsed));
  EXPECT_EQ (parsed, o);

  EXPECT_FALSE (OutpointFromJson (ParseJson ("7"), parsed));
  EXPECT_FALSE (OutpointFromJson (ParseJson (R"("abc:1")"), parsed));
}

TEST_F (ReservesJsonTests, ProofOfReserves)
{
  ProofOfReserves p;
  p.utxo.txid = TestDigest ();
  p.utxo.vout = 1;
  p.proof = "hello";

  const Json::Value val = ProofOfReservesToJson (p);
  ASSERT_TRUE (val.isObject ());
  EXPECT_EQ (val["proof"].asString (), "aGVsbG8=");

  ProofOfReserves parsed;
  ASSERT_TRUE (ProofOfReservesFromJson (val, parsed));
  EXPECT_EQ (parsed, p);

  EXPECT_FALSE (ProofOfReservesFromJson (ParseJson (R"(
    {"utxo": ")" + DIGEST_HEX + R"(:1"}
  )"), parsed));
}

/* ************************************************************************** */

using SpecJsonTests = testing::Test;

TEST_F (SpecJsonTests, AssetSpec)
{
  const auto spec = AssetSpec::Create ("BTC", "Bitcoin", Precision::CENTI_MICRO);
  const Json::Value val = AssetSpecToJson (spec);
  EXPECT_TRUE (JsonEqual (val, ParseJson (R"(
    {
      "ticker": "BTC",
      "name": "Bitcoin",
      "precision": "centiMicro"
    }
  )")));

  AssetSpec parsed;
  ASSERT_TRUE (AssetSpecFromJson (val, parsed));
  EXPECT_EQ (parsed, spec);

  ASSERT_TRUE (AssetSpecFromJson (ParseJson (R"(
    {
      "ticker": "USDT",
      "name": "Tether",
      "details": "Stable coin",
      "precision": "centi"
    }
  )"), parsed));
  ASSERT_TRUE (parsed.details.has_value ());
  EXPECT_EQ (parsed.details->GetString (), "Stable coin");

  for (const auto& str : {R"({"ticker": "BTC", "name": "Bitcoin"})",
                          R"({"ticker": "BTC", "name": "", "precision": "deci"})",
                          R"({"ticker": "BTC", "name": "Bitcoin",
                              "precision": "deci", "extra": 1})"})
    EXPECT_FALSE (AssetSpecFromJson (ParseJson (str), parsed)) << str;
}

TEST_F (SpecJsonTests, ContractSpec)
{
  ContractSpec spec;
  ASSERT_TRUE (ContractSpec::FromStrings ("Painting", "Mona Lisa",
                                          Precision::INDIVISIBLE, "", spec));

  const Json::Value val = ContractSpecToJson (spec);
  EXPECT_TRUE (JsonEqual (val, ParseJson (R"(
    {
      "article": "Painting",
      "name": "Mona Lisa",
      "precision": "indivisible"
    }
  )")));

  ContractSpec parsed;
  ASSERT_TRUE (ContractSpecFromJson (val, parsed));
  EXPECT_EQ (parsed, spec);

  EXPECT_FALSE (ContractSpecFromJson (ParseJson (R"(
    {"article": "Oil painting", "name": "X", "precision": "deci"}
  )"), parsed));
}

TEST_F (SpecJsonTests, ContractTerms)
{
  ContractTerms terms;
  ASSERT_TRUE (RicardianContract::FromString ("Some terms", terms.text));

  EXPECT_TRUE (JsonEqual (ContractTermsToJson (terms),
                          ParseJson (R"({"text": "Some terms"})")));

  Attachment media;
  media.type = MediaType::With ("application/pdf");
  media.digest = TestDigest ();
  terms.media = media;

  ContractTerms parsed;
  ASSERT_TRUE (ContractTermsFromJson (ContractTermsToJson (terms), parsed));
  EXPECT_EQ (parsed, terms);

  EXPECT_FALSE (ContractTermsFromJson (ParseJson (R"({"text": 5})"), parsed));
  EXPECT_FALSE (ContractTermsFromJson (ParseJson ("{}"), parsed));
}

/* ************************************************************************** */

using NftJsonTests = testing::Test;

TEST_F (NftJsonTests, Allocation)
{
  EXPECT_TRUE (JsonEqual (NftToJson (Nft (5, OwnedFraction (3))),
                          ParseJson (R"({"tokenIndex": 5, "fraction": 3})")));
}

TEST_F (NftJsonTests, Engraving)
{
  NftEngraving e;
  e.appliedTo = 2;
  e.content.type = MediaType::With ("text/plain");
  e.content.data = "hello";

  EXPECT_TRUE (JsonEqual (NftEngravingToJson (e), ParseJson (R"(
    {
      "appliedTo": 2,
      "content":
        {
          "type": {"type": "text", "subtype": "plain"},
          "data": "aGVsbG8="
        }
    }
  )")));
}

TEST_F (NftJsonTests, Spec)
{
  NftSpec spec;
  spec.index = 1;
  spec.name = AssetName::FromLiteral ("Bird");

  Attachment a;
  a.type = MediaType::With ("image/png");
  a.digest = TestDigest ();
  spec.attachments.emplace (3, a);

  EXPECT_TRUE (JsonEqual (NftSpecToJson (spec), ParseJson (R"(
    {
      "index": 1,
      "name": "Bird",
      "attachments":
        {
          "3":
            {
              "type": {"type": "image", "subtype": "png"},
              "digest": ")" + DIGEST_HEX + R"("
            }
        }
    }
  )")));
}

TEST_F (NftJsonTests, Features)
{
  Features f;
  f.renaming = true;
  f.inflation = Inflation::INFLATABLE_BURNABLE;

  EXPECT_TRUE (JsonEqual (FeaturesToJson (f), ParseJson (R"(
    {"renaming": true, "inflation": "inflatableBurnable"}
  )")));
}

} // anonymous namespace
} // namespace rgbif
