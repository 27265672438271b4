/***
 * Name: test_parse_int
 * Purpose: Strict integer parsing used for flags and environment values.
 */
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include "agentrun/support/parse.h"

using agentrun::support::ParseIntStrict;

TEST(ParseIntStrict, AcceptsSignsAndSpaces) {
  long long value = 0;
  EXPECT_TRUE(ParseIntStrict("42", value));
  EXPECT_EQ(value, 42);
  EXPECT_TRUE(ParseIntStrict("  -17 ", value));
  EXPECT_EQ(value, -17);
  EXPECT_TRUE(ParseIntStrict("+5", value));
  EXPECT_EQ(value, 5);
}

TEST(ParseIntStrict, RejectsGarbage) {
  long long value = 99;
  std::string err;
  EXPECT_FALSE(ParseIntStrict("", value, &err));
  EXPECT_EQ(err, "invalid integer literal");
  EXPECT_FALSE(ParseIntStrict("12a", value, &err));
  EXPECT_EQ(err, "invalid character in integer literal");
  EXPECT_FALSE(ParseIntStrict("1 2", value, &err));
  EXPECT_FALSE(ParseIntStrict("-", value, &err));
  EXPECT_EQ(value, 99);
}

TEST(ParseIntStrict, DetectsOverflow) {
  long long value = 0;
  std::string err;
  EXPECT_TRUE(ParseIntStrict("9223372036854775807", value, &err));
  EXPECT_FALSE(ParseIntStrict("9223372036854775808", value, &err));
  EXPECT_EQ(err, "integer overflow");
}

TEST(TrimSpaces, BothEnds) {
  std::string_view text = " \t x y \n";
  agentrun::support::TrimSpaces(text);
  EXPECT_EQ(text, "x y");
}
