// SPDX-License-Identifier: MIT

#include "chr/png.hpp"

#include <array>
#include <errno.h>
#include <inttypes.h>
#include <png.h>
#include <stdint.h>
#include <streambuf>
#include <string.h>

#include "diagnostics.hpp" // warnx
#include "helpers.hpp"
#include "verbosity.hpp"

#include "chr/rgb.hpp"
#include "chr/tiles.hpp"
#include "chr/warning.hpp"

struct Output {
	char const *filename;
	std::streambuf &file;

	Output(char const *filename_, std::streambuf &file_) : filename(filename_), file(file_) {}
};

[[noreturn]]
static void handleError(png_structp png, char const *msg) {
	fatal(
	    "libpng error while writing PNG image (\"%s\"): %s",
	    reinterpret_cast<Output *>(png_get_error_ptr(png))->filename,
	    msg
	);
}

static void handleWarning(png_structp png, char const *msg) {
	warnx(
	    "libpng found while writing PNG image (\"%s\"): %s",
	    reinterpret_cast<Output *>(png_get_error_ptr(png))->filename,
	    msg
	);
}

static void writeData(png_structp png, png_bytep data, size_t length) {
	Output &output = *reinterpret_cast<Output *>(png_get_io_ptr(png));
	std::streamsize expectedLen = length;

	if (output.file.sputn(reinterpret_cast<char *>(data), expectedLen) != expectedLen) {
		fatal("Error writing PNG image (\"%s\"): %s", output.filename, strerror(errno));
	}
}

static void flushData(png_structp png) {
	Output &output = *reinterpret_cast<Output *>(png_get_io_ptr(png));

	if (output.file.pubsync() == -1) {
		fatal("Error flushing PNG image (\"%s\"): %s", output.filename, strerror(errno));
	}
}

void writePng(
    char const *filename, std::streambuf &file, ImageAssembler &image, uint8_t compressionLevel
) {
	Output output(filename, file);

	verbosePrint(
	    VERB_NOTICE,
	    "Writing PNG file \"%s\" with libpng %s\n",
	    filename,
	    png_get_libpng_ver(nullptr)
	);

	png_structp png = png_create_write_struct(
	    PNG_LIBPNG_VER_STRING, static_cast<png_voidp>(&output), handleError, handleWarning
	);
	if (!png) {
		fatal("Failed to create PNG write structure: %s", strerror(errno)); // LCOV_EXCL_LINE
	}

	png_infop info = png_create_info_struct(png);
	Defer destroyPng{[&] { png_destroy_write_struct(&png, info ? &info : nullptr); }};
	if (!info) {
		fatal("Failed to create PNG info structure: %s", strerror(errno)); // LCOV_EXCL_LINE
	}

	png_set_write_fn(png, &output, writeData, flushData);
	png_set_compression_level(png, compressionLevel);
	// libpng refuses images taller than a million rows by default
	static_assert(MAX_IMAGE_HEIGHT == PNG_UINT_31_MAX);
	png_set_user_limits(png, IMAGE_WIDTH, MAX_IMAGE_HEIGHT);

	png_set_IHDR(
	    png,
	    info,
	    image.width(),
	    image.height(),
	    2, // 4 colors
	    PNG_COLOR_TYPE_PALETTE,
	    PNG_INTERLACE_NONE,
	    PNG_COMPRESSION_TYPE_DEFAULT,
	    PNG_FILTER_TYPE_DEFAULT
	);

	Palette const &palette = image.palette();
	std::array<png_color, 4> plte;
	for (size_t i = 0; i < plte.size(); ++i) {
		plte[i].red = palette[i].red;
		plte[i].green = palette[i].green;
		plte[i].blue = palette[i].blue;
	}
	png_set_PLTE(png, info, plte.data(), plte.size());

	verbosePrint(
	    VERB_INFO,
	    "PNG image: %" PRIu32 "x%" PRIu32 " pixels, 2bpp palette, compression level %" PRIu8 "\n",
	    image.width(),
	    image.height(),
	    compressionLevel
	);

	png_write_info(png, info);
	// Scanlines hold one palette index per byte; have libpng pack them 4 to a byte
	png_set_packing(png);

	Scanline scanline;
	uint32_t nbRows = 0;
	while (image.next(scanline)) {
		png_write_row(png, scanline.data());
		++nbRows;
	}
	assume(nbRows == image.height());

	png_write_end(png, nullptr);
	verbosePrint(VERB_INFO, "Wrote %" PRIu32 " scanlines\n", nbRows);
}
