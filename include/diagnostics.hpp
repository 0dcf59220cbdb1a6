// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_DIAGNOSTICS_HPP
#define CHR2PNG_DIAGNOSTICS_HPP

#include <initializer_list>
#include <stdint.h>
#include <string>
#include <vector>

#include "helpers.hpp"

[[gnu::format(printf, 1, 2)]]
void warnx(char const *fmt, ...);

enum WarningAbled { WARNING_DEFAULT, WARNING_ENABLED, WARNING_DISABLED };

struct WarningState {
	WarningAbled state;
	WarningAbled error;

	void update(WarningState other);
};

// Strips the `no-`, `error=` or `no-error=` prefix off `flag`, returning what it asks for
WarningState getInitialWarningState(std::string &flag);

template<typename LevelEnumT>
struct WarningFlag {
	char const *name;
	LevelEnumT level;
};

enum WarningBehavior { DISABLED, ENABLED, ERROR };

template<typename WarningEnumT>
struct DiagnosticsState {
	WarningState flagStates[WarningEnumT::NB_WARNINGS];
	WarningState metaStates[WarningEnumT::NB_WARNINGS];
	bool warningsEnabled = true;
	bool warningsAreErrors = false;
};

template<typename LevelEnumT, typename WarningEnumT>
struct Diagnostics {
	std::vector<WarningFlag<LevelEnumT>> metaWarnings;
	std::vector<WarningFlag<LevelEnumT>> warningFlags;
	DiagnosticsState<WarningEnumT> state;
	uint64_t nbErrors;

	void incrementErrors() {
		if (nbErrors != UINT64_MAX) {
			++nbErrors;
		}
	}

	WarningBehavior getWarningBehavior(WarningEnumT id) const;
	// Returns false if the flag is not known
	bool processWarningFlag(char const *flag);
};

template<typename LevelEnumT, typename WarningEnumT>
WarningBehavior Diagnostics<LevelEnumT, WarningEnumT>::getWarningBehavior(WarningEnumT id) const {
	if (!state.warningsEnabled) {
		return WarningBehavior::DISABLED;
	}

	WarningState const &flagState = state.flagStates[id];
	WarningState const &metaState = state.metaStates[id];

	// `-Werror` applies unless `-Wno-error=<flag>` or `-Wno-error=<meta>` opted out
	bool warningIsError = state.warningsAreErrors && flagState.error != WARNING_DISABLED
	                      && metaState.error != WARNING_DISABLED;
	WarningBehavior enabledBehavior =
	    warningIsError ? WarningBehavior::ERROR : WarningBehavior::ENABLED;

	// The specific flag takes precedence over any meta flag
	for (WarningState const *ws : {&flagState, &metaState}) {
		if (ws->state == WARNING_DISABLED) {
			return WarningBehavior::DISABLED;
		}
		if (ws->error == WARNING_ENABLED) {
			return WarningBehavior::ERROR;
		}
		if (ws->state == WARNING_ENABLED) {
			return enabledBehavior;
		}
	}

	return warningFlags[id].level == LevelEnumT::LEVEL_DEFAULT ? enabledBehavior
	                                                           : WarningBehavior::DISABLED;
}

template<typename LevelEnumT, typename WarningEnumT>
bool Diagnostics<LevelEnumT, WarningEnumT>::processWarningFlag(char const *flag) {
	std::string rootFlag = flag;

	if (rootFlag == "error") {
		state.warningsAreErrors = true;
		return true;
	} else if (rootFlag == "no-error") {
		state.warningsAreErrors = false;
		return true;
	}

	WarningState flagState = getInitialWarningState(rootFlag);

	for (WarningFlag<LevelEnumT> const &metaWarning : metaWarnings) {
		if (rootFlag != metaWarning.name) {
			continue;
		}
		// A meta flag affects every flag at or below its level
		for (int id = 0; id < WarningEnumT::NB_WARNINGS; ++id) {
			if (metaWarning.level >= warningFlags[id].level) {
				state.metaStates[id].update(flagState);
			}
		}
		return true;
	}

	for (int id = 0; id < WarningEnumT::NB_WARNINGS; ++id) {
		if (rootFlag == warningFlags[id].name) {
			state.flagStates[id].update(flagState);
			return true;
		}
	}

	warnx("Unknown warning flag \"%s\"", rootFlag.c_str());
	return false;
}

#endif // CHR2PNG_DIAGNOSTICS_HPP
