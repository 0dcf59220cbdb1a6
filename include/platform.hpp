// SPDX-License-Identifier: MIT

// POSIX headers used throughout, gathered in one place

#ifndef CHR2PNG_PLATFORM_HPP
#define CHR2PNG_PLATFORM_HPP

#include <strings.h>   // IWYU pragma: export
#include <sys/stat.h>  // IWYU pragma: export
#include <sys/types.h> // IWYU pragma: export
#include <unistd.h>    // IWYU pragma: export

#endif // CHR2PNG_PLATFORM_HPP
