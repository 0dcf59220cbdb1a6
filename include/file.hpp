// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_FILE_HPP
#define CHR2PNG_FILE_HPP

#include <fstream>
#include <ios>
#include <iostream>
#include <streambuf>
#include <string>
#include <variant>

#include "helpers.hpp" // assume

// Either a file on disk, or standard output if its path is `-`
class File {
	std::variant<std::streambuf *, std::filebuf> _file;

public:
	File() : _file(nullptr) {}

	// This should only be called once, and before doing any `->` operations.
	// Returns `nullptr` on error, and a non-null pointer otherwise.
	File *open(std::string const &path, std::ios_base::openmode mode) {
		if (path != "-") {
			return _file.emplace<std::filebuf>().open(path, mode) ? this : nullptr;
		}
		assume(mode & std::ios_base::out);
		_file.emplace<std::streambuf *>(std::cout.rdbuf());
		return this;
	}
	std::streambuf &operator*() {
		return std::holds_alternative<std::filebuf>(_file) ? std::get<std::filebuf>(_file)
		                                                   : *std::get<std::streambuf *>(_file);
	}
	std::streambuf *operator->() { return &**this; }

	char const *c_str(std::string const &path) const {
		return std::holds_alternative<std::filebuf>(_file) ? path.c_str() : "<stdout>";
	}
};

#endif // CHR2PNG_FILE_HPP
