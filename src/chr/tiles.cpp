// SPDX-License-Identifier: MIT

#include "chr/tiles.hpp"

#include <algorithm>
#include <stddef.h>
#include <stdint.h>
#include <streambuf>
#include <sys/types.h> // ssize_t

#include "helpers.hpp" // assume
#include "verbosity.hpp"

#include "chr/rgb.hpp"
#include "chr/warning.hpp"

TileRowReader::TileRowReader(std::streambuf &file, size_t size)
    : _file(file), _nbStrips(size / BYTES_PER_STRIP) {}

TileStrip const *TileRowReader::next() {
	if (_nbRead == _nbStrips) {
		return nullptr;
	}

	std::streamsize nbBytesRead =
	    _file.sgetn(reinterpret_cast<char *>(_strip.data()), _strip.size());
	if (nbBytesRead != static_cast<std::streamsize>(_strip.size())) {
		fatal(
		    "CHR data is truncated: expected %zu bytes at offset %zu, got %zd",
		    _strip.size(),
		    _nbRead * BYTES_PER_STRIP,
		    static_cast<ssize_t>(nbBytesRead)
		);
	}
	++_nbRead;
	verbosePrint(VERB_TRACE, "Read character row %zu/%zu\n", _nbRead, _nbStrips);
	return &_strip;
}

CharSlice decodeSlice(TileStrip const &strip, uint8_t pixelY, uint8_t charX) {
	assume(pixelY < TILE_HEIGHT);
	assume(charX < CHARS_PER_ROW);

	size_t index = charX * BYTES_PER_CHAR + pixelY;
	uint8_t loByte = strip[index];
	uint8_t hiByte = strip[index + 8];

	// The data is planar; decode the least significant bits (rightmost pixels) first
	CharSlice pixels;
	for (uint8_t &pixel : pixels) {
		pixel = (loByte & 1) | (hiByte & 1) << 1;
		loByte >>= 1;
		hiByte >>= 1;
	}
	std::reverse(RANGE(pixels));
	return pixels;
}

ImageAssembler::ImageAssembler(std::streambuf &file, size_t size, Palette const &palette)
    : _reader(file, size), _palette(palette) {}

bool ImageAssembler::next(Scanline &scanline) {
	if (_pixelY == TILE_HEIGHT) {
		_strip = _reader.next();
		if (!_strip) {
			return false;
		}
		_pixelY = 0;
	}

	for (uint8_t charX = 0; charX < CHARS_PER_ROW; ++charX) {
		CharSlice slice = decodeSlice(*_strip, _pixelY, charX);
		std::copy(RANGE(slice), &scanline[charX * TILE_WIDTH]);
	}
	++_pixelY;
	return true;
}
