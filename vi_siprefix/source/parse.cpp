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
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <new>
#include <string>
#include <string_view>

namespace
{
	[[nodiscard]] constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
	[[nodiscard]] constexpr bool is_sign(char c) noexcept { return '+' == c || '-' == c; }
	[[nodiscard]] bool is_space(char c) noexcept { return 0 != std::isspace(static_cast<unsigned char>(c)); }

	[[nodiscard]] std::string_view trim(std::string_view s) noexcept
	{	while (!s.empty() && is_space(s.front()))
		{	s.remove_prefix(1U);
		}
		while (!s.empty() && is_space(s.back()))
		{	s.remove_suffix(1U);
		}
		return s;
	}

	struct number_t
	{	std::size_t len_; // Length of "[+-]digits[.digits]".
		bool digits_; // At least one digit in the integer or the fractional part.
	};

	[[nodiscard]] number_t scan_number(std::string_view s) noexcept
	{	number_t result{ 0U, false };
		auto &pos = result.len_;

		if (pos < s.size() && is_sign(s[pos]))
		{	++pos;
		}
		for (; pos < s.size() && is_digit(s[pos]); ++pos)
		{	result.digits_ = true;
		}
		if (pos < s.size() && '.' == s[pos])
		{	for (++pos; pos < s.size() && is_digit(s[pos]); ++pos)
			{	result.digits_ = true;
			}
		}
		return result;
	}

	// Length of the exponent "[eE][+-]digits" at the beginning of 's', or 0 if there is none.
	// A lone 'E' is not an exponent: it is the exa prefix.
	[[nodiscard]] std::size_t scan_exponent(std::string_view s) noexcept
	{	std::size_t pos = 0U;
		if (pos >= s.size() || ('e' != s[pos] && 'E' != s[pos]))
		{	return 0U;
		}
		if (++pos < s.size() && is_sign(s[pos]))
		{	++pos;
		}

		const auto digits = pos;
		while (pos < s.size() && is_digit(s[pos]))
		{	++pos;
		}
		return pos > digits ? pos : 0U;
	}

	// Drops the single space the formatter puts between the number and the prefix.
	[[nodiscard]] std::string_view skip_separator(std::string_view s) noexcept
	{	if (!s.empty() && ' ' == s.front())
		{	s.remove_prefix(1U);
		}
		return s;
	}

	[[nodiscard]] int to_double(const std::string &str, double &result)
	{	const auto errno_prev = errno;
		errno = 0;
		char *end = nullptr;
		const auto val = std::strtod(str.c_str(), &end);
		const auto overflow = (ERANGE == errno && std::isinf(val));
		errno = errno_prev;

		if (end != str.c_str() + str.size() || overflow) // A locale with a decimal comma stops strtod at '.'.
		{	return VI_SI_ERR_INVALID;
		}
		result = val;
		return VI_SI_OK;
	}
} // namespace

int misc::parse(std::string_view text, double &result)
{	text = trim(text);

	const auto number = scan_number(text);
	if (!number.digits_)
	{	return VI_SI_ERR_NO_NUMBER;
	}

	std::string str{ text.substr(0U, number.len_) };
	auto tail = text.substr(number.len_);

	if (const auto exp_len = scan_exponent(tail); 0U != exp_len)
	{	// Plain exponential notation: "1.0e-27".
		if (const auto rest = tail.substr(exp_len); !rest.empty())
		{	return find_prefix(skip_separator(rest)) ? VI_SI_ERR_AMBIGUOUS : VI_SI_ERR_INVALID;
		}
		str.append(tail.substr(0U, exp_len));
		return to_double(str, result);
	}

	// SI-prefixed notation: "47.8 m". No symbol at all means 10^0, like " ".
	int exp = 0;
	if (!tail.empty())
	{	const auto prefix = find_prefix(skip_separator(tail));
		if (nullptr == prefix)
		{	return VI_SI_ERR_INVALID;
		}
		exp = prefix->exp_;
	}

	// The symbol is replaced with the equivalent exponent, so strtod rounds correctly.
	str += 'e';
	str += std::to_string(exp);
	return to_double(str, result);
}

int VI_SI_CALL vi_siParse(const char *text, double *result) noexcept
{	if (!verify(nullptr != text && nullptr != result))
	{	return VI_SI_ERR_FAILURE;
	}

	try
	{	return misc::parse(text, *result);
	}
	catch (const std::bad_alloc &)
	{	return VI_SI_ERR_FAILURE;
	}
}

#if VI_SI_DEBUG
namespace
{
	const auto nanotest_parse = []
	{	// nanotest for scan_number and scan_exponent
		assert(4U == scan_number("4.78 k").len_ && scan_number("4.78 k").digits_);
		assert(3U == scan_number("-.5").len_ && scan_number("-.5").digits_);
		assert(!scan_number("-.e3").digits_);
		assert(!scan_number("not a number").digits_);
		assert(3U == scan_exponent("e-3") && 2U == scan_exponent("E5"));
		assert(0U == scan_exponent("E") && 0U == scan_exponent("e+") && 0U == scan_exponent("k"));
		assert("4.78 k" == trim(" \t4.78 k\n"));
		return 0;
	}();
}
#endif // #if VI_SI_DEBUG
