// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_STYLE_HPP
#define CHR2PNG_STYLE_HPP

#include <stdio.h>

// Values analogous to ANSI foreground SGR colors
enum StyleColor {
	STYLE_BLACK,
	STYLE_RED,
	STYLE_GREEN,
	STYLE_YELLOW,
	STYLE_BLUE,
	STYLE_MAGENTA,
	STYLE_CYAN,
	STYLE_GRAY,
};

// Accepts "always", "never" or "auto"; returns false for anything else
bool style_Parse(char const *arg);
void style_Set(FILE *file, StyleColor color, bool bold);
void style_Reset(FILE *file);

#endif // CHR2PNG_STYLE_HPP
