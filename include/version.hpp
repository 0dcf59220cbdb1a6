// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_VERSION_HPP
#define CHR2PNG_VERSION_HPP

#define PACKAGE_VERSION_MAJOR 1
#define PACKAGE_VERSION_MINOR 0
#define PACKAGE_VERSION_PATCH 0

char const *get_package_version_string();

#endif // CHR2PNG_VERSION_HPP
