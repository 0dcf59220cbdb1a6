// SPDX-License-Identifier: MIT

#include "style.hpp"

#include <stdio.h>
#include <stdlib.h> // getenv
#include <string.h>

#include "platform.hpp" // isatty, strcasecmp

enum ColorChoice { COLOR_NEVER, COLOR_ALWAYS, COLOR_AUTO };

static ColorChoice argChoice = COLOR_AUTO;

static bool envIsSet(char const *name) {
	char const *value = getenv(name);
	return value && strcmp(value, "") != 0 && strcmp(value, "0") != 0;
}

static bool allowStyle(FILE *file) {
	// `FORCE_COLOR` wins over `NO_COLOR`, and both lose to `--color`
	static ColorChoice const envChoice = envIsSet("FORCE_COLOR") ? COLOR_ALWAYS
	                                     : envIsSet("NO_COLOR")  ? COLOR_NEVER
	                                                             : COLOR_AUTO;

	ColorChoice choice = argChoice != COLOR_AUTO ? argChoice : envChoice;
	if (choice != COLOR_AUTO) {
		return choice == COLOR_ALWAYS;
	}

	static bool const isOutTerminal = isatty(STDOUT_FILENO);
	static bool const isErrTerminal = isatty(STDERR_FILENO);
	return (file == stdout && isOutTerminal) || (file == stderr && isErrTerminal);
}

bool style_Parse(char const *arg) {
	if (!strcasecmp(arg, "always")) {
		argChoice = COLOR_ALWAYS;
	} else if (!strcasecmp(arg, "never")) {
		argChoice = COLOR_NEVER;
	} else if (!strcasecmp(arg, "auto")) {
		argChoice = COLOR_AUTO;
	} else {
		return false;
	}
	return true;
}

void style_Set(FILE *file, StyleColor color, bool bold) {
	if (allowStyle(file)) {
		fprintf(file, "\033[%dm", static_cast<int>(color) + (bold ? 90 : 30));
	}
}

void style_Reset(FILE *file) {
	if (allowStyle(file)) {
		fputs("\033[m", file);
	}
}
