// SPDX-License-Identifier: MIT

#include "diagnostics.hpp"

#include <stdarg.h>
#include <stdio.h>
#include <string>

#include "helpers.hpp"
#include "style.hpp"

void warnx(char const *fmt, ...) {
	va_list ap;
	style_Set(stderr, STYLE_YELLOW, true);
	fputs("warning: ", stderr);
	style_Reset(stderr);
	va_start(ap, fmt);
	vfprintf(stderr, fmt, ap);
	va_end(ap);
	putc('\n', stderr);
}

void WarningState::update(WarningState other) {
	if (other.state != WARNING_DEFAULT) {
		state = other.state;
	}
	if (other.error != WARNING_DEFAULT) {
		error = other.error;
	}
}

WarningState getInitialWarningState(std::string &flag) {
	if (flag.starts_with("error=")) {
		// `-Werror=<flag>` enables the flag as an error
		flag.erase(0, literal_strlen("error="));
		return {.state = WARNING_ENABLED, .error = WARNING_ENABLED};
	} else if (flag.starts_with("no-error=")) {
		// `-Wno-error=<flag>` keeps the flag from being an error, enabled or not
		flag.erase(0, literal_strlen("no-error="));
		return {.state = WARNING_DEFAULT, .error = WARNING_DISABLED};
	} else if (flag.starts_with("no-")) {
		flag.erase(0, literal_strlen("no-"));
		return {.state = WARNING_DISABLED, .error = WARNING_DEFAULT};
	}
	return {.state = WARNING_ENABLED, .error = WARNING_DEFAULT};
}
