// SPDX-License-Identifier: MIT

#include "chr/warning.hpp"

#include <gtest/gtest.h>
#include <stdint.h>

#include "diagnostics.hpp"

#include "chr/check.hpp"
#include "chr/rgb.hpp"

namespace {

// Each test works on its own copy, so the global state stays pristine
Diagnostics<WarningLevel, WarningID> freshWarnings() {
	Diagnostics<WarningLevel, WarningID> diags = warnings;
	diags.state = DiagnosticsState<WarningID>();
	diags.nbErrors = 0;
	return diags;
}

Palette paletteWithDuplicate() {
	return {Rgb(0x123456), Rgb(0x123456), Rgb(0x000000), Rgb(0xFFFFFF)};
}

} // namespace

TEST(Diagnostics, DefaultLevels) {
	auto diags = freshWarnings();
	EXPECT_EQ(diags.getWarningBehavior(WARNING_DUPLICATE_COLOR), WarningBehavior::DISABLED);
	EXPECT_EQ(diags.getWarningBehavior(WARNING_PARTIAL_BANK), WarningBehavior::DISABLED);
}

TEST(Diagnostics, MetaFlagsEnableTheirLevel) {
	auto diags = freshWarnings();
	EXPECT_TRUE(diags.processWarningFlag("all"));
	EXPECT_EQ(diags.getWarningBehavior(WARNING_DUPLICATE_COLOR), WarningBehavior::ENABLED);
	EXPECT_EQ(diags.getWarningBehavior(WARNING_PARTIAL_BANK), WarningBehavior::DISABLED);

	EXPECT_TRUE(diags.processWarningFlag("everything"));
	EXPECT_EQ(diags.getWarningBehavior(WARNING_PARTIAL_BANK), WarningBehavior::ENABLED);
}

TEST(Diagnostics, SpecificFlagBeatsMetaFlag) {
	auto diags = freshWarnings();
	EXPECT_TRUE(diags.processWarningFlag("everything"));
	EXPECT_TRUE(diags.processWarningFlag("no-partial-bank"));
	EXPECT_EQ(diags.getWarningBehavior(WARNING_PARTIAL_BANK), WarningBehavior::DISABLED);
	EXPECT_EQ(diags.getWarningBehavior(WARNING_DUPLICATE_COLOR), WarningBehavior::ENABLED);
}

TEST(Diagnostics, ErrorPromotion) {
	auto diags = freshWarnings();
	EXPECT_TRUE(diags.processWarningFlag("error=duplicate-color"));
	EXPECT_EQ(diags.getWarningBehavior(WARNING_DUPLICATE_COLOR), WarningBehavior::ERROR);

	diags = freshWarnings();
	EXPECT_TRUE(diags.processWarningFlag("error"));
	EXPECT_TRUE(diags.processWarningFlag("all"));
	EXPECT_EQ(diags.getWarningBehavior(WARNING_DUPLICATE_COLOR), WarningBehavior::ERROR);
	EXPECT_TRUE(diags.processWarningFlag("no-error=duplicate-color"));
	EXPECT_EQ(diags.getWarningBehavior(WARNING_DUPLICATE_COLOR), WarningBehavior::ENABLED);
}

TEST(Diagnostics, NoErrorUndoesGlobalPromotion) {
	auto diags = freshWarnings();
	EXPECT_TRUE(diags.processWarningFlag("everything"));
	EXPECT_TRUE(diags.processWarningFlag("error"));
	EXPECT_EQ(diags.getWarningBehavior(WARNING_PARTIAL_BANK), WarningBehavior::ERROR);
	EXPECT_TRUE(diags.processWarningFlag("no-error"));
	EXPECT_EQ(diags.getWarningBehavior(WARNING_PARTIAL_BANK), WarningBehavior::ENABLED);
}

TEST(Diagnostics, GlobalSwitchSilencesEverything) {
	auto diags = freshWarnings();
	EXPECT_TRUE(diags.processWarningFlag("error=duplicate-color"));
	diags.state.warningsEnabled = false;
	EXPECT_EQ(diags.getWarningBehavior(WARNING_DUPLICATE_COLOR), WarningBehavior::DISABLED);
}

TEST(Diagnostics, UnknownFlag) {
	auto diags = freshWarnings();
	EXPECT_FALSE(diags.processWarningFlag("no-such-warning"));
	EXPECT_FALSE(diags.processWarningFlag("error=no-such-warning"));
}

TEST(Diagnostics, ErrorCountSaturates) {
	auto diags = freshWarnings();
	diags.nbErrors = UINT64_MAX;
	diags.incrementErrors();
	EXPECT_EQ(diags.nbErrors, UINT64_MAX);
}

TEST(WarningDeathTest, PromotedWarningFailsConversion) {
	EXPECT_EXIT(
	    {
		    warnings.processWarningFlag("error=duplicate-color");
		    checkPalette(paletteWithDuplicate());
		    requireZeroErrors();
	    },
	    ::testing::ExitedWithCode(1),
	    "\\[-Werror=duplicate-color\\]"
	);
}
