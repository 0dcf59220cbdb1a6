// SPDX-License-Identifier: MIT

#include "chr/warning.hpp"

#include <inttypes.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

#include "diagnostics.hpp"
#include "style.hpp"

// clang-format off: nested initializers
Diagnostics<WarningLevel, WarningID> warnings = {
    .metaWarnings = {
        {"all",             LEVEL_ALL       },
        {"everything",      LEVEL_EVERYTHING},
    },
    .warningFlags = {
        {"duplicate-color", LEVEL_ALL       },
        {"partial-bank",    LEVEL_EVERYTHING},
    },
    .state = DiagnosticsState<WarningID>(),
    .nbErrors = 0,
};
// clang-format on

static void printDiagnostic(StyleColor color, char const *prefix, char const *fmt, va_list ap) {
	style_Set(stderr, color, true);
	fputs(prefix, stderr);
	style_Reset(stderr);
	vfprintf(stderr, fmt, ap);
}

[[noreturn]]
void giveUp() {
	style_Set(stderr, STYLE_RED, true);
	fprintf(
	    stderr,
	    "Conversion aborted after %" PRIu64 " error%s\n",
	    warnings.nbErrors,
	    warnings.nbErrors == 1 ? "" : "s"
	);
	style_Reset(stderr);
	exit(1);
}

void requireZeroErrors() {
	if (warnings.nbErrors != 0) {
		giveUp();
	}
}

void error(char const *fmt, ...) {
	va_list ap;
	va_start(ap, fmt);
	printDiagnostic(STYLE_RED, "error: ", fmt, ap);
	va_end(ap);
	putc('\n', stderr);

	warnings.incrementErrors();
}

[[noreturn]]
void fatal(char const *fmt, ...) {
	va_list ap;
	va_start(ap, fmt);
	printDiagnostic(STYLE_RED, "FATAL: ", fmt, ap);
	va_end(ap);
	putc('\n', stderr);

	warnings.incrementErrors();
	giveUp();
}

void warning(WarningID id, char const *fmt, ...) {
	char const *flag = warnings.warningFlags[id].name;
	va_list ap;

	switch (warnings.getWarningBehavior(id)) {
	case WarningBehavior::DISABLED:
		break;

	case WarningBehavior::ENABLED:
		va_start(ap, fmt);
		printDiagnostic(STYLE_YELLOW, "warning: ", fmt, ap);
		va_end(ap);
		style_Set(stderr, STYLE_YELLOW, true);
		fprintf(stderr, " [-W%s]\n", flag);
		style_Reset(stderr);
		break;

	case WarningBehavior::ERROR:
		va_start(ap, fmt);
		printDiagnostic(STYLE_RED, "error: ", fmt, ap);
		va_end(ap);
		style_Set(stderr, STYLE_RED, true);
		fprintf(stderr, " [-Werror=%s]\n", flag);
		style_Reset(stderr);

		warnings.incrementErrors();
		break;
	}
}
