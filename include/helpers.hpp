// SPDX-License-Identifier: MIT

#ifndef CHR2PNG_HELPERS_HPP
#define CHR2PNG_HELPERS_HPP

// Traps in debug builds, tells the optimizer the path is dead in release builds
#ifdef NDEBUG
	#define unreachable_ __builtin_unreachable
#else
	#define unreachable_ __builtin_trap
#endif

// `assert` in debug builds, an optimizer hint in release builds
#ifdef NDEBUG
	#define assume(x) \
		do { \
			if (!(x)) \
				unreachable_(); \
		} while (0)
#else
	#include <assert.h>
	#define assume assert
#endif

// Macros for stringification
#define STR(x)            #x
#define EXPAND_AND_STR(x) STR(x)

// For lack of <ranges>, this adds some more brevity
#define RANGE(s) std::begin(s), std::end(s)

// The length of a string literal, computed at compile time
#define literal_strlen(s) (sizeof(s) - 1)

// For ad-hoc RAII in place of a `defer` statement
template<typename T>
struct Defer {
	T deferred;
	Defer(T func) : deferred(func) {}
	~Defer() { deferred(); }
};

#endif // CHR2PNG_HELPERS_HPP
