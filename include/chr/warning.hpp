// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_CHR_WARNING_HPP
#define CHR2PNG_CHR_WARNING_HPP

#include "diagnostics.hpp"

enum WarningLevel {
	LEVEL_DEFAULT,    // Warnings that are enabled by default
	LEVEL_ALL,        // Warnings that probably indicate an error
	LEVEL_EVERYTHING, // Literally every warning
};

enum WarningID {
	WARNING_DUPLICATE_COLOR, // Two palette entries share the same color
	WARNING_PARTIAL_BANK,    // Input is not a whole number of 8 KiB CHR banks

	NB_WARNINGS,
};

extern Diagnostics<WarningLevel, WarningID> warnings;

// Warns the user about problems that don't prevent a valid conversion
[[gnu::format(printf, 2, 3)]]
void warning(WarningID id, char const *fmt, ...);

// Prints the error count, and exits with failure
[[noreturn]]
void giveUp();

// If any error has been emitted thus far, calls `giveUp()`
void requireZeroErrors();

// Prints an error, and increments the error count
[[gnu::format(printf, 1, 2)]]
void error(char const *fmt, ...);

// Prints a fatal error, increments the error count, and gives up
[[gnu::format(printf, 1, 2), noreturn]]
void fatal(char const *fmt, ...);

#endif // CHR2PNG_CHR_WARNING_HPP
