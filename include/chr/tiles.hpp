// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_CHR_TILES_HPP
#define CHR2PNG_CHR_TILES_HPP

#include <array>
#include <stddef.h>
#include <stdint.h>
#include <streambuf>

#include "chr/rgb.hpp"

static constexpr uint8_t TILE_WIDTH = 8;     // character width in pixels
static constexpr uint8_t TILE_HEIGHT = 8;    // character height in pixels
static constexpr uint8_t BYTES_PER_CHAR = 16; // two 8-byte bitplanes
static constexpr uint8_t CHARS_PER_ROW = 16;  // characters per row in the output image

static constexpr size_t BYTES_PER_STRIP = CHARS_PER_ROW * BYTES_PER_CHAR;
static constexpr uint32_t IMAGE_WIDTH = CHARS_PER_ROW * TILE_WIDTH;
// PNG caps both dimensions at 2^31 - 1
static constexpr uint32_t MAX_IMAGE_HEIGHT = 0x7FFF'FFFF;
static constexpr uint64_t MAX_INPUT_SIZE =
    static_cast<uint64_t>(MAX_IMAGE_HEIGHT / TILE_HEIGHT) * BYTES_PER_STRIP;

using TileStrip = std::array<uint8_t, BYTES_PER_STRIP>;
using CharSlice = std::array<uint8_t, TILE_WIDTH>; // One pixel row of one character
using Scanline = std::array<uint8_t, IMAGE_WIDTH>; // Palette indices, left to right

/**
 * Reads the CHR data one strip of `CHARS_PER_ROW` characters at a time.
 * `size` must be a non-zero multiple of `BYTES_PER_STRIP`, at most `MAX_INPUT_SIZE`;
 * this is not checked again here.
 */
class TileRowReader {
	std::streambuf &_file;
	size_t _nbStrips;
	size_t _nbRead = 0;
	TileStrip _strip;

public:
	TileRowReader(std::streambuf &file, size_t size);

	// Returns `nullptr` once all strips have been read.
	// The pointed-to strip is overwritten by the next call.
	TileStrip const *next();

	size_t nbStrips() const { return _nbStrips; }
};

/**
 * Decodes pixel row `pixelY` of character `charX` within `strip`, leftmost pixel first.
 */
CharSlice decodeSlice(TileStrip const &strip, uint8_t pixelY, uint8_t charX);

/**
 * Produces the image's scanlines, top to bottom.
 */
class ImageAssembler {
	TileRowReader _reader;
	Palette _palette;
	TileStrip const *_strip = nullptr;
	uint8_t _pixelY = TILE_HEIGHT; // Forces reading a strip on the first call

public:
	ImageAssembler(std::streambuf &file, size_t size, Palette const &palette);

	// Fills `scanline` and returns true, or returns false once the image is complete.
	bool next(Scanline &scanline);

	uint32_t width() const { return IMAGE_WIDTH; }
	// Cannot exceed `MAX_IMAGE_HEIGHT`, since the input size is bounded
	uint32_t height() const { return static_cast<uint32_t>(_reader.nbStrips() * TILE_HEIGHT); }
	Palette const &palette() const { return _palette; }
};

#endif // CHR2PNG_CHR_TILES_HPP
