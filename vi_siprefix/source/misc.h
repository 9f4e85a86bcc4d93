#ifndef VI_SIPREFIX_SOURCE_MISC_H
#	define VI_SIPREFIX_SOURCE_MISC_H
#	pragma once

#include "../vi_siprefix_c.h"
#include "build_number_maker.h"

#include <cassert>
#include <string>
#include <string_view>

#ifdef NDEBUG
#	define VI_SI_DEBUG 0
#else
#	define VI_SI_DEBUG 1
#endif

#define verify(v) [](bool b) noexcept { assert(b); return b; }(v) // Define for displaying the __FILE__ and __LINE__ during debugging.

namespace misc
{
	constexpr auto GROUP_SIZE = 3;

	// Returns the non-negative remainder of v divided by GROUP_SIZE.
	// This is a "floor modulus" operation, ensuring the result is always in [0, GROUP_SIZE).
	constexpr int group_mod(int v) noexcept
	{	const auto m = v % GROUP_SIZE;
		return m < 0 ? m + GROUP_SIZE : m;
	}
	static_assert
		(	group_mod(3) == 0 && group_mod(2) == 2 && group_mod(1) == 1 && group_mod(0) == 0 &&
			group_mod(-1) == 2 && group_mod(-2) == 1 && group_mod(-3) == 0
		);

	struct prefix_t
	{	int exp_;
		const char *symbol_;
		const char *name_;
	};

	// Exact-match lookup by exponent of ten. Returns nullptr if there is no such prefix.
	[[nodiscard]] const prefix_t *find_prefix(int exp) noexcept;
	// Exact-match lookup by symbol. "" and " " select the zero-exponent entry; all micro spellings select micro.
	[[nodiscard]] const prefix_t *find_prefix(std::string_view symbol) noexcept;

	[[nodiscard]] std::string format(double value, unsigned char precision, std::string_view tmpl, std::string_view exp_tmpl);
	[[nodiscard]] int parse(std::string_view text, double &result);
}

#endif // #ifndef VI_SIPREFIX_SOURCE_MISC_H
