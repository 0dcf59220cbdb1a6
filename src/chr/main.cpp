// SPDX-License-Identifier: MIT

#include "chr/main.hpp"

#include <errno.h>
#include <fstream>
#include <getopt.h>
#include <inttypes.h>
#include <ios>
#include <optional>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>

#include "cli.hpp"
#include "diagnostics.hpp"
#include "file.hpp"
#include "style.hpp"
#include "usage.hpp"
#include "util.hpp"
#include "verbosity.hpp"
#include "version.hpp"

#include "chr/check.hpp"
#include "chr/png.hpp"
#include "chr/rgb.hpp"
#include "chr/tiles.hpp"
#include "chr/warning.hpp"

Options options;

// Short options
static char const *optstring = "0:1:2:3:hVvW:wz:";

// Long-only option variable
static int longOpt; // `--color`

// Equivalent long options
// Please keep in the same order as short opts.
static option const longopts[] = {
    {"color0",      required_argument, nullptr,  '0'},
    {"color1",      required_argument, nullptr,  '1'},
    {"color2",      required_argument, nullptr,  '2'},
    {"color3",      required_argument, nullptr,  '3'},
    {"help",        no_argument,       nullptr,  'h'},
    {"version",     no_argument,       nullptr,  'V'},
    {"verbose",     no_argument,       nullptr,  'v'},
    {"warning",     required_argument, nullptr,  'W'},
    {"compression", required_argument, nullptr,  'z'},
    {"color",       required_argument, &longOpt, 'c'},
    {nullptr,       no_argument,       nullptr,  0  },
};

// clang-format off: nested initializers
static Usage usage = {
    .name = "chr2png",
    .flags = {
        "[-hVvw]", "[-0 <rrggbb>]", "[-1 <rrggbb>]", "[-2 <rrggbb>]", "[-3 <rrggbb>]",
        "[-W <warning>]", "[-z <level>]", "<chr_file>", "<png_file>",
    },
    .options = {
        {{"-0", "--color0 <rrggbb>"}, {"PNG color for CHR color 0 (default 000000)"}},
        {{"-1", "--color1 <rrggbb>"}, {"PNG color for CHR color 1 (default 555555)"}},
        {{"-2", "--color2 <rrggbb>"}, {"PNG color for CHR color 2 (default aaaaaa)"}},
        {{"-3", "--color3 <rrggbb>"}, {"PNG color for CHR color 3 (default ffffff)"}},
        {{"-V", "--version"}, {"print chr2png version and exit"}},
        {{"-W", "--warning <warning>"}, {"enable or disable warnings"}},
        {{"-z", "--compression <level>"}, {"zlib compression level, 0 to 9 (default 9)"}},
    },
};
// clang-format on

static void parseColorArg(uint8_t index, char const *arg) {
	if (std::optional<Rgb> color = parseColorCode(arg); color) {
		options.palette[index] = *color;
	} else {
		error(
		    "%s: \"%s\" for color %" PRIu8, chr_ErrorMessage(ERR_INVALID_COLOR_CODE), arg, index
		);
	}
}

static void parseArg(int ch, char *arg) {
	switch (ch) {
	case '0':
	case '1':
	case '2':
	case '3':
		parseColorArg(ch - '0', arg);
		break;

		// LCOV_EXCL_START
	case 'h':
		usage.printAndExit(0);

	case 'V':
		usage.printVersion();
		exit(0);

	case 'v':
		incrementVerbosity();
		break;
		// LCOV_EXCL_STOP

	case 'W':
		warnings.processWarningFlag(arg);
		break;

	case 'w':
		warnings.state.warningsEnabled = false;
		break;

	case 'z':
		if (std::optional<uint64_t> level = parseWholeNumber(arg); !level) {
			error("Compression level ('-z') must be a valid number, not \"%s\"", arg);
		} else if (*level > MAX_COMPRESSION_LEVEL) {
			error("Compression level ('-z') must not exceed %" PRIu8, MAX_COMPRESSION_LEVEL);
		} else {
			options.compressionLevel = *level;
		}
		break;

	case 0: // Long-only options
		if (longOpt == 'c' && !style_Parse(arg)) {
			fatal("Invalid argument for option '--color'");
		}
		break;

	case 1: // Positional argument
		if (arg[0] == '\0') {
			usage.printAndExit("File paths cannot be empty");
		} else if (options.input.empty()) {
			options.input = arg;
		} else if (options.output.empty()) {
			options.output = arg;
		} else {
			usage.printAndExit(
			    "Too many files specified! (input \"%s\", output \"%s\", then \"%s\")",
			    options.input.c_str(),
			    options.output.c_str(),
			    arg
			);
		}
		break;

		// LCOV_EXCL_START
	default:
		usage.printAndExit(1);
		// LCOV_EXCL_STOP
	}
}

// LCOV_EXCL_START
static void verboseOutputConfig() {
	if (!checkVerbosity(VERB_CONFIG)) {
		return;
	}

	style_Set(stderr, STYLE_MAGENTA, false);

	fprintf(stderr, "%s %s\n", usage.name.c_str(), get_package_version_string());
	fputs("Options:\n", stderr);
	// -0, -1, -2, -3
	fputs("\tPalette: [", stderr);
	for (size_t i = 0; i < options.palette.size(); ++i) {
		fprintf(stderr, "%s#%06" PRIx32, i > 0 ? ", " : "", options.palette[i].toCSS());
	}
	fputs("]\n", stderr);
	// -z/--compression
	fprintf(stderr, "\tCompression level: %" PRIu8 "\n", options.compressionLevel);
	fprintf(stderr, "\tInput CHR data: %s\n", options.input.c_str());
	fprintf(stderr, "\tOutput PNG image: %s\n", options.output.c_str());
	fputs("Ready.\n", stderr);

	style_Reset(stderr);
}
// LCOV_EXCL_STOP

int main(int argc, char *argv[]) {
	cli_ParseArgs(argc, argv, optstring, longopts, parseArg, usage);

	// Invalid colors are reported before touching any file
	requireZeroErrors();

	if (options.input.empty()) {
		usage.printAndExit("No input file specified");
	}
	if (options.output.empty()) {
		usage.printAndExit("No output file specified (pass \"-\" to write to standard output)");
	}

	verboseOutputConfig(); // LCOV_EXCL_LINE

	checkPalette(options.palette);

	uint64_t size = 0;
	if (std::optional<ChrError> err = checkInput(options.input, size); err) {
		fatal("%s: \"%s\"", chr_ErrorMessage(*err), options.input.c_str());
	}
	if (std::optional<ChrError> err = checkOutput(options.output); err) {
		fatal("%s: \"%s\"", chr_ErrorMessage(*err), options.output.c_str());
	}

	// Warnings promoted to errors must also stop us before anything is written
	requireZeroErrors();

	std::filebuf input;
	if (!input.open(options.input, std::ios::in | std::ios::binary)) {
		fatal("Failed to open \"%s\": %s", options.input.c_str(), strerror(errno));
	}
	File output;
	if (!output.open(options.output, std::ios::out | std::ios::binary)) {
		fatal("Failed to create \"%s\": %s", output.c_str(options.output), strerror(errno));
	}

	ImageAssembler image(input, size, options.palette);
	verbosePrint(
	    VERB_NOTICE,
	    "Decoding %zu character rows into a %" PRIu32 "x%" PRIu32 " image\n",
	    static_cast<size_t>(size / BYTES_PER_STRIP),
	    image.width(),
	    image.height()
	);
	writePng(output.c_str(options.output), *output, image, options.compressionLevel);

	requireZeroErrors();
	return 0;
}
