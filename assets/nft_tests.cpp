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

#include "nft.hpp"

#include <xayautil/hash.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <sstream>

namespace rgbif
{
namespace
{

/* ************************************************************************** */

using OwnedFractionTests = testing::Test;

TEST_F (OwnedFractionTests, Arithmetic)
{
  constexpr auto max = std::numeric_limits<uint64_t>::max ();

  const OwnedFraction a(10);
  const OwnedFraction b(3);
  EXPECT_EQ (a.SaturatingAdd (b), OwnedFraction (13));
  EXPECT_EQ (b.SaturatingSub (a), OwnedFraction::Zero ());
  EXPECT_EQ (OwnedFraction (max).SaturatingAdd (b), OwnedFraction (max));

  OwnedFraction res;
  ASSERT_TRUE (a.CheckedSub (b, res));
  EXPECT_EQ (res, OwnedFraction (7));
  EXPECT_FALSE (b.CheckedSub (a, res));
  EXPECT_FALSE (OwnedFraction (max).CheckedAdd (b, res));

  OwnedFraction f(5);
  EXPECT_FALSE (f.CheckedSubAssign (OwnedFraction (6)));
  EXPECT_EQ (f, OwnedFraction (5));
  EXPECT_TRUE (f.CheckedAddAssign (OwnedFraction (6)));
  EXPECT_EQ (f, OwnedFraction (11));
  f.SaturatingSubAssign (OwnedFraction (20));
  EXPECT_EQ (f, OwnedFraction::Zero ());
}

TEST_F (OwnedFractionTests, FromString)
{
  OwnedFraction f;
  ASSERT_TRUE (OwnedFraction::FromString ("42", f));
  EXPECT_EQ (f.GetValue (), 42);

  EXPECT_FALSE (OwnedFraction::FromString ("", f));
  EXPECT_FALSE (OwnedFraction::FromString ("-1", f));
  EXPECT_FALSE (OwnedFraction::FromString ("18446744073709551616", f));
}

/* ************************************************************************** */

using NftTests = testing::Test;

TEST_F (NftTests, Parsing)
{
  Nft n;
  NftParseError err;
  ASSERT_TRUE (Nft::FromString ("5@3", n, err));
  EXPECT_EQ (n.tokenIndex, 3);
  EXPECT_EQ (n.fraction, OwnedFraction (5));
  EXPECT_EQ (n.ToString (), "5@3");

  ASSERT_TRUE (Nft::FromString ("1@4294967295", n, err));
  EXPECT_EQ (n.tokenIndex, 4'294'967'295u);
}

TEST_F (NftTests, ParseErrors)
{
  Nft n;
  NftParseError err;

  ASSERT_FALSE (Nft::FromString ("5", n, err));
  EXPECT_EQ (err, NftParseError::WRONG_FORMAT);

  ASSERT_FALSE (Nft::FromString ("5@x", n, err));
  EXPECT_EQ (err, NftParseError::INVALID_INDEX);
  ASSERT_FALSE (Nft::FromString ("5@4294967296", n, err));
  EXPECT_EQ (err, NftParseError::INVALID_INDEX);
  ASSERT_FALSE (Nft::FromString ("5@3@1", n, err));
  EXPECT_EQ (err, NftParseError::INVALID_INDEX);

  ASSERT_FALSE (Nft::FromString ("x@3", n, err));
  EXPECT_EQ (err, NftParseError::INVALID_FRACTION);
  ASSERT_FALSE (Nft::FromString ("@3", n, err));
  EXPECT_EQ (err, NftParseError::INVALID_FRACTION);

  std::ostringstream out;
  out << NftParseError::WRONG_FORMAT;
  EXPECT_EQ (out.str (),
             "allocation must have format <fraction>@<token_index>");
}

TEST_F (NftTests, StrictEncoding)
{
  const Nft n(0x01020304, OwnedFraction (0x05));

  const std::string encoded = StrictSerialise (n);
  ASSERT_EQ (encoded.size (), 4 + 28 + 8);
  EXPECT_EQ (encoded.substr (0, 4), "\x04\x03\x02\x01");
  EXPECT_EQ (encoded.substr (4, 28), std::string (28, '\0'));
  EXPECT_EQ (encoded.substr (32), std::string ("\x05\0\0\0\0\0\0\0", 8));

  Nft decoded;
  ASSERT_TRUE (StrictDeserialise (encoded, decoded));
  EXPECT_EQ (decoded, n);
}

TEST_F (NftTests, PaddingContentIgnored)
{
  std::string encoded = StrictSerialise (Nft (7, OwnedFraction (1)));
  encoded[10] = 'x';

  Nft decoded;
  ASSERT_TRUE (StrictDeserialise (encoded, decoded));
  EXPECT_EQ (decoded, Nft (7, OwnedFraction (1)));
}

/* ************************************************************************** */

using NftEngravingTests = testing::Test;

TEST_F (NftEngravingTests, StrictEncoding)
{
  NftEngraving e;
  e.appliedTo = 2;
  e.content.type = MediaType::With ("text/plain");
  e.content.data = "engraved";

  NftEngraving decoded;
  ASSERT_TRUE (StrictDeserialise (StrictSerialise (e), decoded));
  EXPECT_EQ (decoded, e);
  EXPECT_EQ (StrictSerialise (e).substr (0, 4), std::string ("\x02\0\0\0", 4));
}

/* ************************************************************************** */

class NftSpecTests : public testing::Test
{

protected:

  static Attachment
  TestAttachment (const std::string& data)
  {
    Attachment res;
    res.type = MediaType::With ("image/png");
    res.digest = xaya::SHA256::Hash (data);
    return res;
  }

};

TEST_F (NftSpecTests, MinimalEncoding)
{
  NftSpec spec;
  spec.index = 1;

  EXPECT_EQ (StrictSerialise (spec),
             std::string ("\x01\0\0\0" "\0\0\0\0\0" "\x00" "\0", 11));
}

TEST_F (NftSpecTests, FullRoundTrip)
{
  NftSpec spec;
  spec.index = 5;
  spec.ticker = Ticker::FromLiteral ("DBI");
  spec.name = AssetName::FromLiteral ("Dead Bird");
  spec.details = Details::FromLiteral ("A very dead bird");
  spec.preview = EmbeddedMedia ();
  spec.preview->type = MediaType::With ("image/*");
  spec.preview->data = "preview";
  spec.media = TestAttachment ("full");
  spec.attachments.emplace (0, TestAttachment ("zero"));
  spec.attachments.emplace (3, TestAttachment ("three"));

  ProofOfReserves reserves;
  reserves.utxo.txid = xaya::SHA256::Hash ("tx");
  reserves.utxo.vout = 1;
  spec.reserves = reserves;

  NftSpec decoded;
  ASSERT_TRUE (StrictDeserialise (StrictSerialise (spec), decoded));
  EXPECT_EQ (decoded, spec);

  decoded.attachments.erase (3);
  EXPECT_NE (decoded, spec);
}

TEST_F (NftSpecTests, TooManyAttachments)
{
  /* Hand-craft a spec with one attachment too many, since the writer
     refuses to encode it.  */
  StrictWriter out;
  out.WriteU32 (0);
  for (unsigned i = 0; i < 5; ++i)
    out.WriteOptionTag (false);
  out.WriteU8 (MAX_NFT_ATTACHMENTS + 1);
  for (unsigned i = 0; i <= MAX_NFT_ATTACHMENTS; ++i)
    {
      out.WriteU8 (i);
      StrictEncode (out, TestAttachment ("foo"));
    }
  out.WriteOptionTag (false);

  NftSpec decoded;
  EXPECT_FALSE (StrictDeserialise (out.GetData (), decoded));
}

TEST_F (NftSpecTests, TooManyAttachmentsOnEncode)
{
  NftSpec spec;
  for (unsigned i = 0; i <= MAX_NFT_ATTACHMENTS; ++i)
    spec.attachments.emplace (i, TestAttachment ("foo"));

  EXPECT_DEATH (StrictSerialise (spec), "exceeds its confinement");
}

} // anonymous namespace
} // namespace rgbif
