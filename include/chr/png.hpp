// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_CHR_PNG_HPP
#define CHR2PNG_CHR_PNG_HPP

#include <stdint.h>
#include <streambuf>

#include "chr/tiles.hpp"

// zlib's range; the default is the maximum
static constexpr uint8_t MAX_COMPRESSION_LEVEL = 9;

/**
 * Writes `image` to `file` as a 2bpp indexed PNG, pulling its scanlines one at a time.
 * `filename` is only used in diagnostics.
 */
void writePng(
    char const *filename, std::streambuf &file, ImageAssembler &image, uint8_t compressionLevel
);

#endif // CHR2PNG_CHR_PNG_HPP
