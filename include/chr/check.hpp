// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_CHR_CHECK_HPP
#define CHR2PNG_CHR_CHECK_HPP

#include <optional>
#include <stdint.h>
#include <string>

#include "chr/rgb.hpp"

enum ChrError {
	ERR_INVALID_COLOR_CODE,
	ERR_INPUT_NOT_FOUND,
	ERR_INPUT_UNREADABLE,
	ERR_INVALID_INPUT_SIZE,
	ERR_INPUT_TOO_LARGE,
	ERR_OUTPUT_EXISTS,
	ERR_OUTPUT_DIR_MISSING,
};

char const *chr_ErrorMessage(ChrError err);

// Checks whether two palette entries share a color, and warns about it if so
bool checkPalette(Palette const &palette);

// The size must be a non-zero multiple of `BYTES_PER_STRIP`, and at most `MAX_INPUT_SIZE`
std::optional<ChrError> checkInputSize(uint64_t size);
// On success, `size` is set to the input's size in bytes
std::optional<ChrError> checkInput(std::string const &path, uint64_t &size);
// `-` (standard output) always passes
std::optional<ChrError> checkOutput(std::string const &path);

#endif // CHR2PNG_CHR_CHECK_HPP
