// SPDX-License-Identifier: MIT

#include "cli.hpp"

#include <errno.h>
#include <fstream>
#include <getopt.h>
#include <stdio.h>
#include <string.h>
#include <string>
#include <vector>

#include "helpers.hpp" // assume
#include "usage.hpp"
#include "util.hpp"    // isBlankSpace

using namespace std::literals;

// Splits an at-file's contents into arguments, appending them to `argPool`.
// Returns each argument's offset into the pool.
static std::vector<size_t>
    readAtFile(std::string const &path, std::vector<char> &argPool, Usage const &usage) {
	std::filebuf file;
	if (!file.open(path, std::ios_base::in)) {
		usage.printAndExit("Error reading at-file \"%s\": %s", path.c_str(), strerror(errno));
	}

	std::vector<size_t> argvOfs;
	for (int c = file.sbumpc(); c != EOF;) {
		if (isWhitespace(c)) {
			c = file.sbumpc();
		} else if (c == '#') {
			// Comments run until the end of the line
			while (c != EOF && !isNewline(c)) {
				c = file.sbumpc();
			}
		} else {
			argvOfs.push_back(argPool.size());
			for (; c != EOF && !isWhitespace(c); c = file.sbumpc()) {
				argPool.push_back(c);
			}
			argPool.push_back('\0');
		}
	}
	return argvOfs;
}

void cli_ParseArgs(
    int argc,
    char *argv[],
    char const *shortOpts,
    option const *longOpts,
    void (*parseArg)(int, char *),
    Usage const &usage
) {
	struct AtFileStackEntry {
		int parentInd;            // Saved offset into parent argv
		std::vector<char *> argv; // This context's arg pointer vec

		AtFileStackEntry(int parentInd_, std::vector<char *> argv_)
		    : parentInd(parentInd_), argv(argv_) {}
	};
	std::vector<AtFileStackEntry> atFileStack;
	// Each at-file gets its own pool, so growing one never moves another's arguments
	std::vector<std::vector<char>> argPools;

	int curArgc = argc;
	char **curArgv = argv;
	std::string optString = "-"s + shortOpts; // Request positional arguments in order

	for (;;) {
		char *atFileName = nullptr;
		for (int ch; (ch = getopt_long_only(curArgc, curArgv, optString.c_str(), longOpts, nullptr))
		             != -1;) {
			if (ch == 1 && optarg[0] == '@') {
				atFileName = &optarg[1];
				break;
			}
			parseArg(ch, optarg);
		}

		if (atFileName) {
			std::vector<char> &argPool = argPools.emplace_back();
			// `argv[0]` is skipped by option parsing, but used in its error messages
			AtFileStackEntry &stackEntry =
			    atFileStack.emplace_back(optind, std::vector<char *>{atFileName});

			std::vector<size_t> offsets = readAtFile(atFileName, argPool, usage);
			for (size_t ofs : offsets) {
				stackEntry.argv.push_back(&argPool.data()[ofs]);
			}
			stackEntry.argv.push_back(nullptr);

			curArgc = stackEntry.argv.size() - 1;
			curArgv = stackEntry.argv.data();
			optind = 0; // Fully reinitialize `getopt` for the new argv
			continue;
		}

		// This happens if `--` is passed; process the remaining arg(s) as positional
		for (int i = optind; i < curArgc; ++i) {
			parseArg(1, curArgv[i]);
		}

		if (atFileStack.empty()) {
			break;
		}

		// Resume parsing the parent's arguments where the at-file interrupted them
		optind = atFileStack.back().parentInd;
		atFileStack.pop_back();
		if (atFileStack.empty()) {
			curArgc = argc;
			curArgv = argv;
		} else {
			std::vector<char *> &vec = atFileStack.back().argv;
			curArgc = vec.size() - 1;
			curArgv = vec.data();
		}
	}
}
