// SPDX-License-Identifier: MIT

#include "chr/check.hpp"

#include <fstream>
#include <gtest/gtest.h>
#include <ios>
#include <optional>
#include <stdint.h>
#include <stdio.h>
#include <string>

#include "chr/rgb.hpp"
#include "chr/tiles.hpp"

namespace {

std::string tempPath(char const *name) {
	return ::testing::TempDir() + name;
}

std::string makeFile(char const *name, size_t size) {
	std::string path = tempPath(name);
	std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
	file << std::string(size, '\0');
	return path;
}

} // namespace

TEST(CheckInputSize, RejectsEmptyAndPartialStrips) {
	EXPECT_EQ(checkInputSize(0), ERR_INVALID_INPUT_SIZE);
	EXPECT_EQ(checkInputSize(16), ERR_INVALID_INPUT_SIZE);
	EXPECT_EQ(checkInputSize(255), ERR_INVALID_INPUT_SIZE);
	EXPECT_EQ(checkInputSize(257), ERR_INVALID_INPUT_SIZE);
	EXPECT_EQ(checkInputSize(8192 + 128), ERR_INVALID_INPUT_SIZE);
}

TEST(CheckInputSize, AcceptsWholeStrips) {
	EXPECT_EQ(checkInputSize(256), std::nullopt);
	EXPECT_EQ(checkInputSize(512), std::nullopt);
	EXPECT_EQ(checkInputSize(8192), std::nullopt);
	EXPECT_EQ(checkInputSize(256 * 1024), std::nullopt);
}

TEST(CheckInputSize, RejectsImagesTooTallForPng) {
	// The tallest image PNG allows, rounded down to whole strips
	EXPECT_EQ(MAX_INPUT_SIZE / BYTES_PER_STRIP * TILE_HEIGHT, 0x7FFF'FFF8u);
	EXPECT_EQ(checkInputSize(MAX_INPUT_SIZE), std::nullopt);
	EXPECT_EQ(checkInputSize(MAX_INPUT_SIZE + BYTES_PER_STRIP), ERR_INPUT_TOO_LARGE);
	EXPECT_EQ(checkInputSize(UINT64_MAX - UINT64_MAX % BYTES_PER_STRIP), ERR_INPUT_TOO_LARGE);
	// Still well within that limit, but past libpng's default of a million rows
	EXPECT_EQ(checkInputSize(125'001 * BYTES_PER_STRIP), std::nullopt);
}

TEST(CheckInput, MissingFile) {
	uint64_t size = 0;
	EXPECT_EQ(checkInput(tempPath("chr2png_no_such_input.chr"), size), ERR_INPUT_NOT_FOUND);
	EXPECT_EQ(
	    checkInput(tempPath("chr2png_no_such_dir/input.chr"), size), ERR_INPUT_NOT_FOUND
	);
}

TEST(CheckInput, DirectoryIsNotReadable) {
	uint64_t size = 0;
	EXPECT_EQ(checkInput(::testing::TempDir(), size), ERR_INPUT_UNREADABLE);
}

TEST(CheckInput, ReportsSize) {
	uint64_t size = 0;
	std::string path = makeFile("chr2png_one_strip.chr", 256);
	EXPECT_EQ(checkInput(path, size), std::nullopt);
	EXPECT_EQ(size, 256u);
	remove(path.c_str());
}

TEST(CheckInput, BadSize) {
	uint64_t size = 0;
	std::string path = makeFile("chr2png_short.chr", 255);
	EXPECT_EQ(checkInput(path, size), ERR_INVALID_INPUT_SIZE);
	remove(path.c_str());

	path = makeFile("chr2png_empty.chr", 0);
	EXPECT_EQ(checkInput(path, size), ERR_INVALID_INPUT_SIZE);
	remove(path.c_str());
}

TEST(CheckOutput, ExistingFile) {
	std::string path = makeFile("chr2png_existing.png", 1);
	EXPECT_EQ(checkOutput(path), ERR_OUTPUT_EXISTS);
	remove(path.c_str());
}

TEST(CheckOutput, MissingDirectory) {
	EXPECT_EQ(checkOutput(tempPath("chr2png_no_such_dir/out.png")), ERR_OUTPUT_DIR_MISSING);

	// A file is not a directory
	std::string file = makeFile("chr2png_not_a_dir", 1);
	EXPECT_EQ(checkOutput(file + "/out.png"), ERR_OUTPUT_DIR_MISSING);
	remove(file.c_str());
}

TEST(CheckOutput, NewFile) {
	std::string path = tempPath("chr2png_new.png");
	remove(path.c_str());
	EXPECT_EQ(checkOutput(path), std::nullopt);
	EXPECT_EQ(checkOutput("chr2png_no_such_file_in_cwd.png"), std::nullopt);
	EXPECT_EQ(checkOutput("/chr2png_no_such_file_in_root.png"), std::nullopt);
}

TEST(CheckOutput, StandardOutput) {
	EXPECT_EQ(checkOutput("-"), std::nullopt);
}

TEST(CheckPalette, DetectsDuplicates) {
	EXPECT_FALSE(checkPalette(defaultPalette));

	Palette palette = defaultPalette;
	palette[3] = palette[1];
	EXPECT_TRUE(checkPalette(palette));
}

TEST(ChrErrorMessage, EveryErrorHasAMessage) {
	for (ChrError err : {
	         ERR_INVALID_COLOR_CODE,
	         ERR_INPUT_NOT_FOUND,
	         ERR_INPUT_UNREADABLE,
	         ERR_INVALID_INPUT_SIZE,
	         ERR_INPUT_TOO_LARGE,
	         ERR_OUTPUT_EXISTS,
	         ERR_OUTPUT_DIR_MISSING,
	     }) {
		EXPECT_NE(chr_ErrorMessage(err)[0], '\0');
	}
}
