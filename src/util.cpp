// SPDX-License-Identifier: MIT

#include "util.hpp"

#include <optional>
#include <stdint.h>

#include "helpers.hpp" // assume

bool isNewline(int c) {
	return c == '\r' || c == '\n';
}

bool isBlankSpace(int c) {
	return c == ' ' || c == '\t';
}

bool isWhitespace(int c) {
	return isBlankSpace(c) || isNewline(c);
}

bool isDigit(int c) {
	return c >= '0' && c <= '9';
}

bool isHexDigit(int c) {
	return isDigit(c) || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
}

uint8_t parseHexDigit(int c) {
	if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	} else if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	} else {
		assume(isDigit(c));
		return c - '0';
	}
}

// Parses a number from a string, moving the pointer to skip the parsed characters.
// Does *not* support sign or base prefixes; saturates at UINT64_MAX.
std::optional<uint64_t> parseNumber(char const *&str, NumberBase base) {
	bool (*canParseDigit)(int c) = base == BASE_16 ? isHexDigit : isDigit;
	char const * const startDigits = str;

	uint64_t result = 0;
	for (; canParseDigit(str[0]); ++str) {
		uint8_t digit = parseHexDigit(str[0]);
		if (result > (UINT64_MAX - digit) / base) {
			result = UINT64_MAX;
		} else {
			result = result * base + digit;
		}
	}

	if (str == startDigits) {
		return std::nullopt;
	}
	return result;
}

// Parses a number from an entire string, returning nothing if there are more unparsed characters.
std::optional<uint64_t> parseWholeNumber(char const *str, NumberBase base) {
	std::optional<uint64_t> result = parseNumber(str, base);
	return str[0] == '\0' ? result : std::nullopt;
}
