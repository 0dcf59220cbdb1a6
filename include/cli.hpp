// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_CLI_HPP
#define CHR2PNG_CLI_HPP

#include <getopt.h> // option

#include "usage.hpp"

// Calls `parseArg` for each option, with `ch == 1` for positional arguments.
// A positional argument `@<path>` is replaced by the arguments listed in that file.
void cli_ParseArgs(
    int argc,
    char *argv[],
    char const *shortOpts,
    option const *longOpts,
    void (*parseArg)(int, char *),
    Usage const &usage
);

#endif // CHR2PNG_CLI_HPP
