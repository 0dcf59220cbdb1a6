// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_CHR_RGB_HPP
#define CHR2PNG_CHR_RGB_HPP

#include <array>
#include <optional>
#include <stdint.h>

struct Rgb {
	uint8_t red;
	uint8_t green;
	uint8_t blue;

	Rgb(uint8_t r, uint8_t g, uint8_t b) : red(r), green(g), blue(b) {}
	/**
	 * Constructs the color from a "packed" RGB representation (0xRRGGBB)
	 */
	explicit Rgb(uint32_t rgb = 0) : red(rgb >> 16), green(rgb >> 8), blue(rgb) {}

	/**
	 * Returns this color as a 24-bit number that can be printed in hex (`%06x`) to yield its CSS
	 * representation
	 */
	uint32_t toCSS() const {
		return static_cast<uint32_t>(red) << 16 | static_cast<uint32_t>(green) << 8 | blue;
	}
	friend bool operator==(Rgb const &lhs, Rgb const &rhs) { return lhs.toCSS() == rhs.toCSS(); }
	friend bool operator!=(Rgb const &lhs, Rgb const &rhs) { return lhs.toCSS() != rhs.toCSS(); }
};

// One color per 2-bit pixel value
using Palette = std::array<Rgb, 4>;

// Gray ramp, from black for pixel value 0 to white for pixel value 3
static Palette const defaultPalette{Rgb(0x000000), Rgb(0x555555), Rgb(0xAAAAAA), Rgb(0xFFFFFF)};

/**
 * Parses an HTML-style color code: exactly 6 hex digits, no `#`, no sign, no blank space.
 * Returns nothing if `str` is anything else.
 */
std::optional<Rgb> parseColorCode(char const *str);

#endif // CHR2PNG_CHR_RGB_HPP
