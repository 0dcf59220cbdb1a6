// SPDX-License-Identifier: MIT

#include "version.hpp"

#include "helpers.hpp"

// The build may pass a more precise version (e.g. from `git describe`) with `-D`
char const *get_package_version_string() {
#ifdef BUILD_VERSION_STRING
	return BUILD_VERSION_STRING;
#else
	return "v" EXPAND_AND_STR(PACKAGE_VERSION_MAJOR) "." EXPAND_AND_STR(PACKAGE_VERSION_MINOR
	) "." EXPAND_AND_STR(PACKAGE_VERSION_PATCH);
#endif
}
