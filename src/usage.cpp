// SPDX-License-Identifier: MIT

#include "usage.hpp"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string>

#include "helpers.hpp"
#include "style.hpp"
#include "version.hpp"

// The historically common 80 columns, minus 1
static constexpr size_t MAX_LINE_LEN = 79;

void Usage::printVersion() const {
	printf("%s %s\n", name.c_str(), get_package_version_string());
}

void Usage::printAndExit(int code) const {
	FILE *file = code ? stderr : stdout;

	// Print "Usage: <program name>", then the flags, wrapped and indented past it
	style_Set(file, STYLE_GREEN, true);
	fputs("Usage: ", file);
	style_Set(file, STYLE_CYAN, true);
	fputs(name.c_str(), file);
	size_t padFlags = literal_strlen("Usage: ") + name.length();

	style_Set(file, STYLE_CYAN, false);
	size_t flagsWidth = padFlags;
	for (std::string const &flag : flags) {
		if (flagsWidth + 1 + flag.length() > MAX_LINE_LEN) {
			fprintf(file, "\n%*c", static_cast<int>(padFlags), ' ');
			flagsWidth = padFlags;
		}
		fprintf(file, " %s", flag.c_str());
		flagsWidth += 1 + flag.length();
	}
	style_Reset(file);
	fputs("\n\n", file);

	// Align all descriptions on the widest option list
	auto optsWidth = [](std::vector<std::string> const &opts) {
		size_t width = 0;
		for (std::string const &opt : opts) {
			width += (width ? literal_strlen(", ") : 0) + opt.length();
		}
		return width;
	};
	size_t padOpts = 0;
	for (auto const &item : options) {
		if (size_t width = optsWidth(item.first); width > padOpts) {
			padOpts = width;
		}
	}

	if (!options.empty()) {
		style_Set(file, STYLE_GREEN, true);
		fputs("Useful options:\n", file);
		style_Reset(file);
	}
	for (auto const &[opts, description] : options) {
		fputs("    ", file);
		for (size_t i = 0; i < opts.size(); ++i) {
			if (i > 0) {
				fputs(", ", file);
			}
			style_Set(file, STYLE_CYAN, false);
			fputs(opts[i].c_str(), file);
			style_Reset(file);
		}
		fprintf(file, "%*s", static_cast<int>(padOpts - optsWidth(opts)), "");

		for (size_t i = 0; i < description.size(); ++i) {
			if (i > 0) {
				fprintf(file, "\n%*s", static_cast<int>(literal_strlen("    ") + padOpts), "");
			}
			fprintf(file, "  %s", description[i].c_str());
		}
		putc('\n', file);
	}

	fputs("\nFor more help, use \"", file);
	style_Set(file, STYLE_CYAN, true);
	fprintf(file, "man %s", name.c_str());
	style_Reset(file);
	fputs("\"\n", file);

	exit(code);
}

void Usage::printAndExit(char const *fmt, ...) const {
	va_list args;
	style_Set(stderr, STYLE_RED, true);
	fputs("FATAL: ", stderr);
	style_Reset(stderr);
	va_start(args, fmt);
	vfprintf(stderr, fmt, args);
	va_end(args);
	putc('\n', stderr);

	printAndExit(1);
}
