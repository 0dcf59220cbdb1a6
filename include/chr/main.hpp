// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_CHR_MAIN_HPP
#define CHR2PNG_CHR_MAIN_HPP

#include <stdint.h>
#include <string>

#include "chr/png.hpp"
#include "chr/rgb.hpp"

struct Options {
	Palette palette = defaultPalette;                // -0, -1, -2, -3
	uint8_t compressionLevel = MAX_COMPRESSION_LEVEL; // -z

	std::string input{};  // first positional arg
	std::string output{}; // second positional arg
};

extern Options options;

#endif // CHR2PNG_CHR_MAIN_HPP
