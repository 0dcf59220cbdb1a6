// SPDX-License-Identifier: MIT

#include "verbosity.hpp"

#include <stdarg.h>
#include <stdio.h>

#include "style.hpp"

static Verbosity verbosity = VERB_NONE;

bool checkVerbosity(Verbosity level) {
	return verbosity >= level;
}

void incrementVerbosity() {
	if (verbosity < VERB_TRACE) {
		verbosity = static_cast<Verbosity>(verbosity + 1);
	}
}

void printVerbosely(char const *fmt, ...) {
	va_list ap;
	style_Set(stderr, STYLE_MAGENTA, false);
	va_start(ap, fmt);
	vfprintf(stderr, fmt, ap);
	va_end(ap);
	style_Reset(stderr);
}
