// SPDX-License-Identifier: MIT

#include "chr/check.hpp"

#include <errno.h>
#include <inttypes.h>
#include <optional>
#include <stdint.h>
#include <string>

#include "helpers.hpp"
#include "platform.hpp" // stat
#include "verbosity.hpp"

#include "chr/rgb.hpp"
#include "chr/tiles.hpp"
#include "chr/warning.hpp"

static constexpr uint64_t BYTES_PER_BANK = 8192; // One CHR-ROM bank, i.e. 512 characters

char const *chr_ErrorMessage(ChrError err) {
	switch (err) {
	case ERR_INVALID_COLOR_CODE:
		return "Invalid color code (expected exactly 6 hexadecimal digits)";
	case ERR_INPUT_NOT_FOUND:
		return "The input file does not exist";
	case ERR_INPUT_UNREADABLE:
		return "Error getting the input file's size";
	case ERR_INVALID_INPUT_SIZE:
		static_assert(BYTES_PER_STRIP == 256);
		return "Invalid input file size (expected a non-zero multiple of 256 bytes)";
	case ERR_INPUT_TOO_LARGE:
		return "Input file is too large (a PNG image is at most 2147483647 pixels tall)";
	case ERR_OUTPUT_EXISTS:
		return "The output file already exists";
	case ERR_OUTPUT_DIR_MISSING:
		return "The output directory does not exist";
	}
	unreachable_();
}

bool checkPalette(Palette const &palette) {
	bool hasDuplicates = false;
	for (size_t i = 0; i < palette.size(); ++i) {
		for (size_t j = i + 1; j < palette.size(); ++j) {
			if (palette[i] == palette[j]) {
				warning(
				    WARNING_DUPLICATE_COLOR,
				    "Colors %zu and %zu are both #%06" PRIx32 "; their pixels cannot be told apart",
				    i,
				    j,
				    palette[i].toCSS()
				);
				hasDuplicates = true;
			}
		}
	}
	return hasDuplicates;
}

std::optional<ChrError> checkInputSize(uint64_t size) {
	if (size == 0 || size % BYTES_PER_STRIP != 0) {
		return ERR_INVALID_INPUT_SIZE;
	}
	if (size > MAX_INPUT_SIZE) {
		return ERR_INPUT_TOO_LARGE;
	}
	if (size % BYTES_PER_BANK != 0) {
		warning(
		    WARNING_PARTIAL_BANK,
		    "Input size (%" PRIu64 " bytes) is not a whole number of %" PRIu64 "-byte CHR banks",
		    size,
		    BYTES_PER_BANK
		);
	}
	return std::nullopt;
}

std::optional<ChrError> checkInput(std::string const &path, uint64_t &size) {
	struct stat st;
	if (stat(path.c_str(), &st) != 0) {
		return errno == ENOENT || errno == ENOTDIR ? ERR_INPUT_NOT_FOUND : ERR_INPUT_UNREADABLE;
	}
	if (!S_ISREG(st.st_mode)) {
		return ERR_INPUT_UNREADABLE;
	}

	size = st.st_size;
	verbosePrint(VERB_INFO, "Input file \"%s\" is %" PRIu64 " bytes\n", path.c_str(), size);
	return checkInputSize(size);
}

std::optional<ChrError> checkOutput(std::string const &path) {
	if (path == "-") {
		return std::nullopt;
	}

	struct stat st;
	if (stat(path.c_str(), &st) == 0) {
		return ERR_OUTPUT_EXISTS;
	}

	// Only check the directory if the path names one
	size_t slash = path.find_last_of('/');
	if (slash == path.npos) {
		return std::nullopt;
	}
	std::string dir = slash == 0 ? "/" : path.substr(0, slash);
	if (stat(dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
		return ERR_OUTPUT_DIR_MISSING;
	}
	return std::nullopt;
}
