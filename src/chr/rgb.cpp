// SPDX-License-Identifier: MIT

#include "chr/rgb.hpp"

#include <optional>
#include <stdint.h>
#include <string.h>

#include "util.hpp" // parseWholeNumber

std::optional<Rgb> parseColorCode(char const *str) {
	// `parseNumber` would accept a "0x" prefix, which is not a color digit
	if (strlen(str) != 6 || strspn(str, "0123456789ABCDEFabcdef") != 6) {
		return std::nullopt;
	}

	std::optional<uint64_t> rgb = parseWholeNumber(str, BASE_16);
	if (!rgb) {
		return std::nullopt;
	}
	return Rgb(static_cast<uint32_t>(*rgb));
}
