// SPDX-License-Identifier: MIT

#include "cli.hpp"

#include <fstream>
#include <getopt.h>
#include <gtest/gtest.h>
#include <ios>
#include <stdio.h>
#include <string>
#include <utility>
#include <vector>

#include "usage.hpp"

namespace {

std::vector<std::pair<int, std::string>> parsed;

void recordArg(int ch, char *arg) {
	parsed.emplace_back(ch, arg ? arg : "");
}

char const *shortOpts = "0:1:v";

option const longOpts[] = {
    {"color0",  required_argument, nullptr, '0'},
    {"color1",  required_argument, nullptr, '1'},
    {"verbose", no_argument,       nullptr, 'v'},
    {nullptr,   no_argument,       nullptr, 0  },
};

Usage const usage = {
    .name = "cli_test",
    .flags = {},
    .options = {},
};

// `getopt` wants mutable strings
std::vector<std::pair<int, std::string>> parse(std::vector<std::string> args) {
	std::vector<char *> argv;
	for (std::string &arg : args) {
		argv.push_back(arg.data());
	}
	argv.push_back(nullptr);

	parsed.clear();
	optind = 0;
	cli_ParseArgs(argv.size() - 1, argv.data(), shortOpts, longOpts, recordArg, usage);
	return parsed;
}

using Parsed = std::vector<std::pair<int, std::string>>;

} // namespace

TEST(CliParseArgs, OptionsAndPositionalsInOrder) {
	EXPECT_EQ(
	    parse({"chr2png", "-0", "ff0000", "in.chr", "--color1", "00ff00", "-v", "out.png"}),
	    (Parsed{{'0', "ff0000"}, {1, "in.chr"}, {'1', "00ff00"}, {'v', ""}, {1, "out.png"}})
	);
}

TEST(CliParseArgs, DoubleDashMakesEverythingPositional) {
	EXPECT_EQ(
	    parse({"chr2png", "-v", "--", "-0", "in.chr"}),
	    (Parsed{{'v', ""}, {1, "-0"}, {1, "in.chr"}})
	);
}

TEST(CliParseArgs, AtFileIsExpandedInPlace) {
	std::string atFile = ::testing::TempDir() + "chr2png_cli_test.args";
	{
		std::ofstream file(atFile, std::ios::out | std::ios::trunc);
		file << "# Colors for the title screen\n"
		     << "-1 00ff00   # green\n"
		     << "\n"
		     << "\tin.chr\n";
	}

	EXPECT_EQ(
	    parse({"chr2png", "-0", "ff0000", "@" + atFile, "out.png"}),
	    (Parsed{{'0', "ff0000"}, {'1', "00ff00"}, {1, "in.chr"}, {1, "out.png"}})
	);
	remove(atFile.c_str());
}

TEST(CliParseArgsDeathTest, MissingAtFile) {
	EXPECT_EXIT(
	    parse({"chr2png", "@" + ::testing::TempDir() + "chr2png_no_such.args"}),
	    ::testing::ExitedWithCode(1),
	    "Error reading at-file"
	);
}
