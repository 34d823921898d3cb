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

#include "amount.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace rgbif
{
namespace
{

constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max ();

/* ************************************************************************** */

using AmountBasicTests = testing::Test;

TEST_F (AmountBasicTests, Zero)
{
  EXPECT_EQ (Amount::Zero ().GetValue (), 0);
  EXPECT_EQ (Amount (), Amount::Zero ());
  EXPECT_EQ (Amount (42).GetValue (), 42);
}

TEST_F (AmountBasicTests, Comparison)
{
  EXPECT_LT (Amount (1), Amount (2));
  EXPECT_LE (Amount (2), Amount (2));
  EXPECT_GT (Amount (3), Amount (2));
  EXPECT_NE (Amount (3), Amount (2));
}

TEST_F (AmountBasicTests, Hash)
{
  std::unordered_set<Amount> amounts = {Amount (1), Amount (2), Amount (1)};
  EXPECT_EQ (amounts.size (), 2);
  EXPECT_EQ (amounts.count (Amount (2)), 1);
}

TEST_F (AmountBasicTests, PlainOperators)
{
  Amount a(10);
  a += Amount (5);
  EXPECT_EQ (a, Amount (15));
  a -= Amount (3);
  EXPECT_EQ (a, Amount (12));

  EXPECT_EQ (Amount (6) * Amount (7), Amount (42));
  EXPECT_EQ (Amount (43) / Amount (7), Amount (6));
  EXPECT_EQ (Amount (43) % Amount (7), Amount (1));
  EXPECT_EQ (Amount (1) + Amount (2) - Amount (3), Amount::Zero ());
}

TEST_F (AmountBasicTests, DivisionByZero)
{
  EXPECT_DEATH (Amount (1) / Amount::Zero (), "by zero");
  EXPECT_DEATH (Amount (1) % Amount::Zero (), "by zero");
}

/* ************************************************************************** */

using AmountPrecisionTests = testing::Test;

TEST_F (AmountPrecisionTests, WithPrecision)
{
  EXPECT_EQ (Amount::WithPrecision (5, Precision::CENTI), Amount (500));
  EXPECT_EQ (Amount::WithPrecision (5, Precision::INDIVISIBLE), Amount (5));
  EXPECT_EQ (Amount::WithPrecision (1, Precision::ATTO),
             Amount (1'000'000'000'000'000'000));
}

TEST_F (AmountPrecisionTests, WithPrecisionChecked)
{
  Amount a;
  ASSERT_TRUE (Amount::WithPrecisionChecked (18, Precision::ATTO, a));
  EXPECT_EQ (a, Amount (18'000'000'000'000'000'000u));

  a = Amount (42);
  EXPECT_FALSE (Amount::WithPrecisionChecked (19, Precision::ATTO, a));
  EXPECT_EQ (a, Amount (42));

  ASSERT_TRUE (Amount::WithPrecisionChecked (MAX, Precision::INDIVISIBLE, a));
  EXPECT_EQ (a, Amount (MAX));
}

TEST_F (AmountPrecisionTests, ConvertVariants)
{
  EXPECT_EQ (UncheckedConvert (Precision::MILLI, 7), Amount (7'000));

  Amount a;
  ASSERT_TRUE (CheckedConvert (Precision::MILLI, 7, a));
  EXPECT_EQ (a, Amount (7'000));
  EXPECT_FALSE (CheckedConvert (Precision::ATTO, 100, a));

  EXPECT_EQ (SaturatingConvert (Precision::ATTO, 100), Amount (MAX));
  EXPECT_EQ (SaturatingConvert (Precision::DECI, 3), Amount (30));
}

TEST_F (AmountPrecisionTests, RoundTrip)
{
  for (const auto p : ALL_PRECISIONS)
    {
      const uint64_t mul = PrecisionMultiplier (p);
      for (const uint64_t whole : {static_cast<uint64_t> (0),
                                   static_cast<uint64_t> (1),
                                   static_cast<uint64_t> (7),
                                   MAX / mul / 2, MAX / mul})
        {
          if (whole > MAX / mul)
            continue;
          EXPECT_EQ (Amount::WithPrecision (whole, p).Floor (p), whole)
              << "whole " << whole << ", precision " << p;
        }
    }
}

TEST_F (AmountPrecisionTests, SplitAndRem)
{
  uint64_t whole, fract;
  Amount (12'345).Split (Precision::CENTI, whole, fract);
  EXPECT_EQ (whole, 123);
  EXPECT_EQ (fract, 45);
  EXPECT_EQ (Amount (12'345).Rem (Precision::CENTI), 45);

  Amount (12'345).Split (Precision::INDIVISIBLE, whole, fract);
  EXPECT_EQ (whole, 12'345);
  EXPECT_EQ (fract, 0);
}

TEST_F (AmountPrecisionTests, SplitRecombines)
{
  for (const uint64_t val : {static_cast<uint64_t> (0),
                             static_cast<uint64_t> (1),
                             static_cast<uint64_t> (999'999'999),
                             MAX})
    for (const auto p : ALL_PRECISIONS)
      {
        uint64_t whole, fract;
        Amount (val).Split (p, whole, fract);
        EXPECT_LT (fract, PrecisionMultiplier (p));
        EXPECT_EQ (whole * PrecisionMultiplier (p) + fract, val);
      }
}

TEST_F (AmountPrecisionTests, Rounding)
{
  EXPECT_EQ (Amount (150).Round (Precision::CENTI), 2);
  EXPECT_EQ (Amount (149).Round (Precision::CENTI), 1);
  EXPECT_EQ (Amount (101).Ceil (Precision::CENTI), 2);
  EXPECT_EQ (Amount (100).Ceil (Precision::CENTI), 1);
  EXPECT_EQ (Amount (199).Floor (Precision::CENTI), 1);

  EXPECT_EQ (Amount (50).Round (Precision::CENTI), 1);
  EXPECT_EQ (Amount (49).Round (Precision::CENTI), 0);
  EXPECT_EQ (Amount (1).Ceil (Precision::ATTO), 1);

  EXPECT_EQ (Amount (150).Floor (Precision::DECI), 15);
  EXPECT_EQ (Amount (150).Round (Precision::DECI), 15);
  EXPECT_EQ (Amount (155).Floor (Precision::DECI), 15);
  EXPECT_EQ (Amount (155).Round (Precision::DECI), 16);
  EXPECT_EQ (Amount (154).Round (Precision::DECI), 15);
}

TEST_F (AmountPrecisionTests, DecimalStringSplit)
{
  Amount a;
  ASSERT_TRUE (Amount::FromDecimalString ("12.34", Precision::CENTI, a));
  EXPECT_EQ (a, Amount (1'234));
  EXPECT_EQ (a.Floor (Precision::CENTI), 12);
  EXPECT_EQ (a.Rem (Precision::CENTI), 34);
  EXPECT_EQ (a.Ceil (Precision::CENTI), 13);
}

TEST_F (AmountPrecisionTests, RoundingZero)
{
  for (const auto p : ALL_PRECISIONS)
    {
      EXPECT_EQ (Amount::Zero ().Round (p), 0);
      EXPECT_EQ (Amount::Zero ().Ceil (p), 0);
      EXPECT_EQ (Amount::Zero ().Floor (p), 0);
    }
}

TEST_F (AmountPrecisionTests, RoundingOrder)
{
  for (const uint64_t val : {static_cast<uint64_t> (1),
                             static_cast<uint64_t> (12'345'678'901),
                             static_cast<uint64_t> (12'300'000'000),
                             static_cast<uint64_t> (1'000'000'000'000'000'000),
                             MAX})
    for (const auto p : ALL_PRECISIONS)
      {
        const Amount a(val);
        EXPECT_LE (a.Floor (p), a.Round (p));
        EXPECT_LE (a.Round (p), a.Ceil (p));
        EXPECT_LE (a.Ceil (p) - a.Floor (p), 1);
        EXPECT_EQ (a.Ceil (p) == a.Floor (p), a.Rem (p) == 0)
            << "value " << val << ", precision " << p;
      }
}

TEST_F (AmountPrecisionTests, Indivisible)
{
  const Amount a(12'345);
  EXPECT_EQ (a.Round (Precision::INDIVISIBLE), 12'345);
  EXPECT_EQ (a.Ceil (Precision::INDIVISIBLE), 12'345);
  EXPECT_EQ (a.Floor (Precision::INDIVISIBLE), 12'345);
  EXPECT_EQ (a.Rem (Precision::INDIVISIBLE), 0);
}

/* ************************************************************************** */

using AmountArithmeticTests = testing::Test;

TEST_F (AmountArithmeticTests, Saturating)
{
  EXPECT_EQ (Amount (MAX).SaturatingAdd (Amount (1)), Amount (MAX));
  EXPECT_EQ (Amount (5).SaturatingAdd (Amount (1)), Amount (6));
  EXPECT_EQ (Amount (0).SaturatingSub (Amount (1)), Amount::Zero ());
  EXPECT_EQ (Amount (5).SaturatingSub (Amount (2)), Amount (3));

  Amount a(MAX - 1);
  a.SaturatingAddAssign (Amount (10));
  EXPECT_EQ (a, Amount (MAX));
  a = Amount (3);
  a.SaturatingSubAssign (Amount (10));
  EXPECT_EQ (a, Amount::Zero ());
}

TEST_F (AmountArithmeticTests, Checked)
{
  Amount res(42);
  EXPECT_FALSE (Amount (MAX).CheckedAdd (Amount (1), res));
  EXPECT_FALSE (Amount (0).CheckedSub (Amount (1), res));
  EXPECT_EQ (res, Amount (42));

  ASSERT_TRUE (Amount (MAX - 1).CheckedAdd (Amount (1), res));
  EXPECT_EQ (res, Amount (MAX));
  ASSERT_TRUE (Amount (5).CheckedSub (Amount (5), res));
  EXPECT_EQ (res, Amount::Zero ());
}

TEST_F (AmountArithmeticTests, CheckedAssign)
{
  Amount a(MAX);
  EXPECT_FALSE (a.CheckedAddAssign (Amount (1)));
  EXPECT_EQ (a, Amount (MAX));
  EXPECT_TRUE (a.CheckedSubAssign (Amount (MAX)));
  EXPECT_EQ (a, Amount::Zero ());
  EXPECT_FALSE (a.CheckedSubAssign (Amount (1)));
  EXPECT_EQ (a, Amount::Zero ());
  EXPECT_TRUE (a.CheckedAddAssign (Amount (7)));
  EXPECT_EQ (a, Amount (7));
}

TEST_F (AmountArithmeticTests, SumSaturates)
{
  EXPECT_EQ (SumAmounts (std::vector<Amount> ()), Amount::Zero ());
  EXPECT_EQ (SumAmounts (std::vector<Amount> ({Amount (1), Amount (2)})),
             Amount (3));
  EXPECT_EQ (SumAmounts (std::vector<Amount> ({Amount (MAX), Amount (1)})),
             Amount (MAX));
  EXPECT_EQ (SumAmounts (std::vector<Amount> (
                 {Amount (MAX), Amount (MAX), Amount (MAX)})),
             Amount (MAX));
}

TEST_F (AmountArithmeticTests, SumRawValues)
{
  const std::vector<uint64_t> raw = {10, 20, 30};
  EXPECT_EQ (SumAmounts (raw), Amount (60));
  EXPECT_EQ (SumAmounts (raw.begin () + 1, raw.end ()), Amount (50));

  const std::vector<uint64_t> huge = {MAX - 5, 10};
  EXPECT_EQ (SumAmounts (huge), Amount (MAX));
}

/* ************************************************************************** */

using AmountStringTests = testing::Test;

TEST_F (AmountStringTests, FromString)
{
  Amount a;
  ASSERT_TRUE (Amount::FromString ("0", a));
  EXPECT_EQ (a, Amount::Zero ());
  ASSERT_TRUE (Amount::FromString ("18446744073709551615", a));
  EXPECT_EQ (a, Amount (MAX));

  for (const std::string str : {"", "-1", "+1", " 1", "1 ", "1.5", "0x10",
                                "18446744073709551616"})
    EXPECT_FALSE (Amount::FromString (str, a)) << str;
}

TEST_F (AmountStringTests, FromDecimalString)
{
  Amount a;
  ASSERT_TRUE (Amount::FromDecimalString ("12.34", Precision::CENTI, a));
  EXPECT_EQ (a, Amount (1'234));
  ASSERT_TRUE (Amount::FromDecimalString ("12.3", Precision::MILLI, a));
  EXPECT_EQ (a, Amount (12'300));
  ASSERT_TRUE (Amount::FromDecimalString ("7", Precision::CENTI_MICRO, a));
  EXPECT_EQ (a, Amount (700'000'000));
  ASSERT_TRUE (Amount::FromDecimalString ("0.00000001",
                                          Precision::CENTI_MICRO, a));
  EXPECT_EQ (a, Amount (1));
  ASSERT_TRUE (Amount::FromDecimalString ("42", Precision::INDIVISIBLE, a));
  EXPECT_EQ (a, Amount (42));
}

TEST_F (AmountStringTests, InvalidDecimalString)
{
  for (const std::string str : {"", ".", "1.", ".5", "1.234", "-1.0", "+1",
                                "1,5", "1.2.3", " 1.0", "1e2"})
    {
      Amount a;
      EXPECT_FALSE (Amount::FromDecimalString (str, Precision::CENTI, a))
          << str;
    }

  Amount a;
  EXPECT_FALSE (Amount::FromDecimalString ("1.0", Precision::INDIVISIBLE, a));
  EXPECT_FALSE (Amount::FromDecimalString ("19", Precision::ATTO, a));
  EXPECT_FALSE (Amount::FromDecimalString ("18446744073709551615.1",
                                           Precision::DECI, a));
}

TEST_F (AmountStringTests, ToDecimalString)
{
  EXPECT_EQ (Amount (1'234).ToDecimalString (Precision::CENTI), "12.34");
  EXPECT_EQ (Amount (5).ToDecimalString (Precision::MILLI), "0.005");
  EXPECT_EQ (Amount (0).ToDecimalString (Precision::CENTI_MICRO),
             "0.00000000");
  EXPECT_EQ (Amount (42).ToDecimalString (Precision::INDIVISIBLE), "42");

  Amount parsed;
  ASSERT_TRUE (Amount::FromDecimalString (
      Amount (MAX).ToDecimalString (Precision::ATTO), Precision::ATTO,
      parsed));
  EXPECT_EQ (parsed, Amount (MAX));
}

TEST_F (AmountStringTests, StreamOutput)
{
  std::ostringstream out;
  out << Amount (123);
  EXPECT_EQ (out.str (), "123");
}

/* ************************************************************************** */

using AmountStrictTests = testing::Test;

TEST_F (AmountStrictTests, LittleEndian)
{
  EXPECT_EQ (StrictSerialise (Amount (0x0102030405060708)),
             "\x08\x07\x06\x05\x04\x03\x02\x01");
  EXPECT_EQ (StrictSerialise (Amount::Zero ()), std::string (8, '\0'));

  Amount a;
  ASSERT_TRUE (StrictDeserialise ("\x08\x07\x06\x05\x04\x03\x02\x01", a));
  EXPECT_EQ (a, Amount (0x0102030405060708));
}

TEST_F (AmountStrictTests, Truncated)
{
  Amount a;
  EXPECT_FALSE (StrictDeserialise (std::string (7, '\0'), a));
  EXPECT_FALSE (StrictDeserialise (std::string (9, '\0'), a));
}

} // anonymous namespace
} // namespace rgbif
