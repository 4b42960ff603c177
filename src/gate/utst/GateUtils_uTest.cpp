/**
 * @file GateUtils_uTest.cpp
 * @brief Unit tests for the text and number helpers in GateUtils.hpp.
 */

#include "src/gate/inc/GateUtils.hpp"

#include <gtest/gtest.h>

using quorum::gate::decimalPrefixLength;
using quorum::gate::parseDouble;
using quorum::gate::parseUnsignedDecimal;
using quorum::gate::parseUnsignedInt;
using quorum::gate::splitLines;
using quorum::gate::trim;

/* ----------------------------- Number Parsing ----------------------------- */

/** @test parseDouble takes anything strtod does, except non-finite results. */
TEST(GateUtilsTest, ParseDoubleRejectsNonFinite) {
  EXPECT_DOUBLE_EQ(*parseDouble(" -2.5 "), -2.5);
  EXPECT_DOUBLE_EQ(*parseDouble("1e3"), 1000.0);
  EXPECT_FALSE(parseDouble("nan").has_value());
  EXPECT_FALSE(parseDouble("-inf").has_value());
  EXPECT_FALSE(parseDouble("1e999").has_value());
  EXPECT_FALSE(parseDouble("12abc").has_value());
}

/** @test Metric decimals are digits with an optional fraction, nothing more. */
TEST(GateUtilsTest, UnsignedDecimalGrammar) {
  EXPECT_DOUBLE_EQ(*parseUnsignedDecimal("1234.56"), 1234.56);
  EXPECT_DOUBLE_EQ(*parseUnsignedDecimal(" 0 "), 0.0);
  EXPECT_DOUBLE_EQ(*parseUnsignedDecimal("87"), 87.0);

  EXPECT_FALSE(parseUnsignedDecimal("").has_value());
  EXPECT_FALSE(parseUnsignedDecimal("nan").has_value());
  EXPECT_FALSE(parseUnsignedDecimal("inf").has_value());
  EXPECT_FALSE(parseUnsignedDecimal("-50").has_value());
  EXPECT_FALSE(parseUnsignedDecimal("+50").has_value());
  EXPECT_FALSE(parseUnsignedDecimal("-1e3").has_value());
  EXPECT_FALSE(parseUnsignedDecimal("1e3").has_value());
  EXPECT_FALSE(parseUnsignedDecimal("0x10").has_value());
  EXPECT_FALSE(parseUnsignedDecimal("1.").has_value());
  EXPECT_FALSE(parseUnsignedDecimal(".5").has_value());
  EXPECT_FALSE(parseUnsignedDecimal("1.2.3").has_value());
}

/** @test Metric integers are plain digit runs. */
TEST(GateUtilsTest, UnsignedIntGrammar) {
  EXPECT_EQ(*parseUnsignedInt("5120"), 5120);
  EXPECT_EQ(*parseUnsignedInt(" 7 "), 7);
  EXPECT_FALSE(parseUnsignedInt("-7").has_value());
  EXPECT_FALSE(parseUnsignedInt("+7").has_value());
  EXPECT_FALSE(parseUnsignedInt("7.0").has_value());
  EXPECT_FALSE(parseUnsignedInt("").has_value());
  EXPECT_FALSE(parseUnsignedInt("99999999999999999999999").has_value());
}

/** @test The prefix scanner stops at the first character outside the grammar. */
TEST(GateUtilsTest, DecimalPrefixLength) {
  EXPECT_EQ(decimalPrefixLength("1.25ms"), 4u);
  EXPECT_EQ(decimalPrefixLength("830us"), 3u);
  EXPECT_EQ(decimalPrefixLength("1.ms"), 0u);
  EXPECT_EQ(decimalPrefixLength("ms"), 0u);
}

/* ----------------------------- Text Helpers ----------------------------- */

/** @test Lines split on '\n' with a trailing '\r' removed. */
TEST(GateUtilsTest, SplitLinesDropsCarriageReturns) {
  const auto LINES = splitLines("a\r\nb\n\nc");
  ASSERT_EQ(LINES.size(), 4u);
  EXPECT_EQ(LINES[0], "a");
  EXPECT_EQ(LINES[2], "");
  EXPECT_EQ(LINES[3], "c");
  EXPECT_EQ(trim("  x \t"), "x");
}
