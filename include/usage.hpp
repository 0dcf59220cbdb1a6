// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_USAGE_HPP
#define CHR2PNG_USAGE_HPP

#include <string>
#include <utility>
#include <vector>

struct Usage {
	std::string name;
	std::vector<std::string> flags;
	std::vector<std::pair<std::vector<std::string>, std::vector<std::string>>> options;

	void printVersion() const;

	[[noreturn]]
	void printAndExit(int code) const;

	[[gnu::format(printf, 2, 3), noreturn]]
	void printAndExit(char const *fmt, ...) const;
};

#endif // CHR2PNG_USAGE_HPP
