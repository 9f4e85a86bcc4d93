// This is an independent project of an individual developer. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++, C#, and Java: http://www.viva64.com

/********************************************************************\
'vi_siprefix' is a compact library for converting numbers to and from
SI-prefixed notation ("4.78 k", "47.8 m") in C and C++.

Copyright (C) 2025 A.Prograamar

This library was created for experimental and educational use.
Please keep expectations reasonable. If you find bugs or have suggestions for
improvement, contact programmer.amateur@proton.me.

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program.
If not, see <https://www.gnu.org/licenses/gpl-3.0.html#license-text>.
\********************************************************************/

#include "misc.h"

#include <cassert>
#include <cstdio>
#include <iterator>
#include <string_view>

namespace
{
#ifdef VI_SI_ASCII_MICRO
	constexpr char MICRO[] = "u";
#else
	constexpr char MICRO[] = "\xC2\xB5"; // U+00B5 MICRO SIGN
#endif

	constexpr misc::prefix_t prefixes[]
	{	{ -24, "y", "yocto" },
		{ -21, "z", "zepto" },
		{ -18, "a", "atto" },
		{ -15, "f", "femto" },
		{ -12, "p", "pico" },
		{ -9, "n", "nano" },
		{ -6, MICRO, "micro" },
		{ -3, "m", "milli" },
		{ 0, "", "" },
		{ 3, "k", "kilo" },
		{ 6, "M", "mega" },
		{ 9, "G", "giga" },
		{ 12, "T", "tera" },
		{ 15, "P", "peta" },
		{ 18, "E", "exa" },
		{ 21, "Z", "zetta" },
		{ 24, "Y", "yotta" },
	};
	static_assert(std::size(prefixes) == 17);
	static_assert(VI_SI_EXP_MIN == prefixes[0].exp_ && VI_SI_EXP_MAX == prefixes[std::size(prefixes) - 1].exp_);
	static_assert(0 == prefixes[std::size(prefixes) / 2].exp_); // The middle prefix must be zero.
	static_assert
	(	[]
		{	for (std::size_t n = 1; n < std::size(prefixes); ++n)
			{	if (prefixes[n].exp_ != prefixes[n - 1].exp_ + misc::GROUP_SIZE)
				{	return false;
				}
			}
			return true;
		}(),
		"Exponents must be sorted and contiguous in steps of GROUP_SIZE."
	);

	// Other spellings of the micro prefix accepted on input.
	constexpr std::string_view micro_aliases[]
	{	"\xC2\xB5", // U+00B5 MICRO SIGN
		"\xCE\xBC", // U+03BC GREEK SMALL LETTER MU
		"u",
	};
	constexpr int MICRO_EXP = -6;
} // namespace

const misc::prefix_t* misc::find_prefix(int exp) noexcept
{	if (0 != group_mod(exp) || exp < VI_SI_EXP_MIN || exp > VI_SI_EXP_MAX)
	{	return nullptr;
	}

	const auto &result = prefixes[(exp - prefixes[0].exp_) / GROUP_SIZE];
	assert(result.exp_ == exp);
	return &result;
}

const misc::prefix_t* misc::find_prefix(std::string_view symbol) noexcept
{	if (" " == symbol)
	{	symbol = std::string_view{};
	}

	for (auto &p : prefixes)
	{	if (symbol == p.symbol_)
		{	return &p;
		}
	}

	for (auto alias : micro_aliases)
	{	if (symbol == alias)
		{	return find_prefix(MICRO_EXP);
		}
	}
	return nullptr;
}

const char* VI_SI_CALL vi_siSymbolFor(int exponent) noexcept
{	const auto prefix = misc::find_prefix(exponent);
	return prefix ? prefix->symbol_ : nullptr;
}

const char* VI_SI_CALL vi_siNameFor(int exponent) noexcept
{	const auto prefix = misc::find_prefix(exponent);
	return prefix ? prefix->name_ : nullptr;
}

int VI_SI_CALL vi_siExponentFor(const char *symbol, int *exponent) noexcept
{	if (!verify(nullptr != symbol && nullptr != exponent))
	{	return VI_SI_ERR_FAILURE;
	}

	const auto prefix = misc::find_prefix(std::string_view{ symbol });
	if (nullptr == prefix)
	{	return VI_SI_ERR_RANGE;
	}

	*exponent = prefix->exp_;
	return VI_SI_OK;
}

int VI_SI_CALL vi_siReport(vi_siReportCb_t fn, void *data)
{	assert(!data || !!fn); // If data is not null, then fn must be valid.
	if (nullptr == fn)
	{	fn = vi_siReportCb; // Default callback function.
	}

	int result = fn("Exp.  Name   Symbol\n", data);
	if (result < 0)
	{	return result;
	}

	for (auto &p : prefixes)
	{	char line[32];
		const auto len = std::snprintf(line, std::size(line), "%+4d  %-6s %s\n", p.exp_, p.name_, p.symbol_);
		if (!verify(len > 0 && static_cast<std::size_t>(len) < std::size(line)))
		{	return VI_EXIT_FAILURE;
		}

		const auto ret = fn(line, data);
		if (ret < 0)
		{	return ret;
		}
		result += ret;
	}
	return result;
}

#if VI_SI_DEBUG
namespace
{	// nanotest to array consistency prefixes and the lookups in both directions.
	const auto nanotest_prefixes = []
	{	for (auto &p : prefixes)
		{	assert(misc::find_prefix(p.exp_) == &p);
			assert(misc::find_prefix(std::string_view{ p.symbol_ }) == &p);
		}
		assert(nullptr == misc::find_prefix(27));
		assert(nullptr == misc::find_prefix(-27));
		assert(nullptr == misc::find_prefix(1));
		assert(nullptr == misc::find_prefix(std::string_view{ "x" }));
		assert(MICRO_EXP == misc::find_prefix(std::string_view{ "u" })->exp_);
		assert(0 == misc::find_prefix(std::string_view{ " " })->exp_);
		return 0;
	}();
}
#endif // #if VI_SI_DEBUG
