// SPDX-License-Identifier: MIT

#include "util.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <stdint.h>

TEST(ParseNumber, StopsAtFirstNonDigit) {
	char const *str = "42abc";
	EXPECT_EQ(parseNumber(str), 42u);
	EXPECT_STREQ(str, "abc");

	str = "1fz";
	EXPECT_EQ(parseNumber(str, BASE_16), 0x1Fu);
	EXPECT_STREQ(str, "z");
}

TEST(ParseNumber, NeedsAtLeastOneDigit) {
	char const *str = "x1";
	EXPECT_FALSE(parseNumber(str).has_value());
	EXPECT_STREQ(str, "x1");
}

TEST(ParseNumber, SaturatesOnOverflow) {
	char const *str = "99999999999999999999999";
	EXPECT_EQ(parseNumber(str), UINT64_MAX);
	EXPECT_EQ(str[0], '\0');
}

TEST(ParseWholeNumber, RejectsTrailingCharacters) {
	EXPECT_EQ(parseWholeNumber("9"), 9u);
	EXPECT_FALSE(parseWholeNumber("9 ").has_value());
	EXPECT_FALSE(parseWholeNumber("").has_value());
	EXPECT_FALSE(parseWholeNumber("-1").has_value());
	EXPECT_EQ(parseWholeNumber("c0ffee", BASE_16), 0xC0FFEEu);
}
