// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_UTIL_HPP
#define CHR2PNG_UTIL_HPP

#include <optional>
#include <stdint.h>

enum NumberBase {
	BASE_10 = 10,
	BASE_16 = 16,
};

bool isNewline(int c);
bool isBlankSpace(int c);
bool isWhitespace(int c);
bool isDigit(int c);
bool isHexDigit(int c);

uint8_t parseHexDigit(int c);
std::optional<uint64_t> parseNumber(char const *&str, NumberBase base = BASE_10);
std::optional<uint64_t> parseWholeNumber(char const *str, NumberBase base = BASE_10);

#endif // CHR2PNG_UTIL_HPP
