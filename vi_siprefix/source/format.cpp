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

#include <algorithm>
#include <cassert>
#include <climits>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace
{
	constexpr std::string_view VALUE = "{value}";
	constexpr std::string_view PREFIX = "{prefix}";
	constexpr std::string_view EXPONENT = "{exponent}";
	constexpr std::string_view SPACES = " \t\n\v\f\r";

	using args_t = std::initializer_list<std::pair<std::string_view, std::string_view>>;

	// Literal, single pass replacement of the placeholders listed in 'args'. Unknown placeholders are left untouched.
	[[nodiscard]] std::string substitute(std::string_view tmpl, args_t args)
	{	std::string result;
		result.reserve(tmpl.size() + 16U);

		for (std::size_t pos = 0U; pos < tmpl.size();)
		{	const auto it = ('{' != tmpl[pos]) ?
				args.end() :
				std::find_if(args.begin(), args.end(), [tail = tmpl.substr(pos)](const auto &a) { return 0 == tail.compare(0, a.first.size(), a.first); });

			if (it != args.end())
			{	result += it->second;
				pos += it->first.size();
			}
			else
			{	result += tmpl[pos++];
			}
		}
		return result;
	}

	[[nodiscard]] std::string to_fixed(double val, unsigned char precision)
	{	const auto len = std::snprintf(nullptr, 0U, "%.*f", static_cast<int>(precision), val);
		if (!verify(len > 0))
		{	return "ERR";
		}

		std::string result(static_cast<std::size_t>(len) + 1U, '\0');
		if (!verify(len == std::snprintf(result.data(), result.size(), "%.*f", static_cast<int>(precision), val)))
		{	return "ERR";
		}
		result.resize(static_cast<std::size_t>(len));
		return result;
	}

	// The exponent with an explicit '+' for positive values: "+27", "-27", "0".
	[[nodiscard]] std::string exp_to_string(int exp)
	{	return (exp > 0 ? "+" : "") + std::to_string(exp);
	}

	[[nodiscard]] std::string_view trim(std::string_view s) noexcept
	{	const auto first = s.find_first_not_of(SPACES);
		if (std::string_view::npos == first)
		{	return {};
		}
		return s.substr(first, s.find_last_not_of(SPACES) - first + 1U);
	}

	[[nodiscard]] bool is_space(char c) noexcept
	{	return std::string_view::npos != SPACES.find(c);
	}

	// The text after {prefix} that leaves a separator in front of an empty prefix dangling:
	// the end of the template, whitespace or punctuation other than a placeholder brace.
	[[nodiscard]] bool is_dangling(std::string_view tail) noexcept
	{	return tail.empty() ||
			is_space(tail.front()) ||
			('{' != tail.front() && 0 != std::ispunct(static_cast<unsigned char>(tail.front())));
	}

	// For an empty prefix: removes the whitespace character in front of each dangling {prefix}.
	// "{value} {prefix}\n" -> "{value}{prefix}\n", while a separator followed by a unit stays: "{value} {prefix}Hz".
	[[nodiscard]] std::string drop_separator(std::string_view tmpl)
	{	std::string result{ tmpl };
		for (auto pos = result.find(PREFIX); std::string::npos != pos; pos = result.find(PREFIX, pos + PREFIX.size()))
		{	if (pos > 0U && is_space(result[pos - 1U]) && is_dangling(std::string_view{ result }.substr(pos + PREFIX.size())))
			{	result.erase(--pos, 1U);
			}
		}
		return result;
	}
} // namespace

std::string misc::format(double value, unsigned char precision, std::string_view tmpl, std::string_view exp_tmpl)
{	if (std::isnan(value))
	{	return "NaN";
	}
	if (std::isinf(value))
	{	return std::signbit(value) ? "-INF" : "INF";
	}

	const auto [mantissa, exp] = vi_siDecompose(value, precision);
	const auto value_str = to_fixed(mantissa, precision);

	if (const auto prefix = find_prefix(exp))
	{	const auto symbol = trim(prefix->symbol_);
		if (symbol.empty())
		{	return substitute(drop_separator(tmpl), { { VALUE, value_str }, { PREFIX, symbol } });
		}
		return substitute(tmpl, { { VALUE, value_str }, { PREFIX, symbol } });
	}

	// Outside yocto..yotta.
	const auto exp_str = exp_to_string(exp);
	return substitute(exp_tmpl, { { VALUE, value_str }, { EXPONENT, exp_str } });
}

int VI_SI_CALL vi_siFormat(char *buff, std::size_t size, double value, unsigned char precision, const char *tmpl, const char *exp_tmpl) noexcept
{	if (!verify(nullptr != buff || 0U == size))
	{	return VI_EXIT_FAILURE;
	}

	try
	{	const auto str = misc::format
		(	value,
			precision,
			tmpl ? tmpl : VI_SI_TEMPLATE,
			exp_tmpl ? exp_tmpl : VI_SI_EXP_TEMPLATE
		);
		if (!verify(str.size() <= static_cast<std::size_t>(INT_MAX)))
		{	return VI_EXIT_FAILURE;
		}

		if (0U != size)
		{	const auto len = std::min(size - 1U, str.size());
			std::memcpy(buff, str.data(), len);
			buff[len] = '\0';
		}
		return static_cast<int>(str.size());
	}
	catch (const std::exception &)
	{	return VI_EXIT_FAILURE; // std::bad_alloc or std::length_error.
	}
}

int VI_SYS_CALL vi_siTickFormatter(double value, char *buff, int size, void *data)
{	if (!verify(size >= 0))
	{	return VI_EXIT_FAILURE;
	}

	if (const auto fmt = static_cast<const vi_siFormat_t *>(data))
	{	return vi_siFormat(buff, static_cast<std::size_t>(size), value, fmt->precision_, fmt->template_, fmt->exp_template_);
	}
	return vi_siFormat(buff, static_cast<std::size_t>(size), value, 0U, nullptr, nullptr);
}

#if VI_SI_DEBUG
namespace
{
	const auto nanotest_format = []
	{	// nanotest for substitute
		assert("1.0 k" == substitute("{value} {prefix}", { { VALUE, "1.0" }, { PREFIX, "k" } }));
		assert("{x} 1.0 {value" == substitute("{x} {value} {value", { { VALUE, "1.0" } }));
		assert("1.0e+27" == substitute("{value}e{exponent}", { { VALUE, "1.0" }, { EXPONENT, "+27" } }));

		// nanotest for to_fixed, exp_to_string and trim
		assert("47.81" == to_fixed(47.81, 2));
		assert("-3" == to_fixed(-3.0, 0));
		assert("+27" == exp_to_string(27) && "-27" == exp_to_string(-27) && "0" == exp_to_string(0));
		assert("k" == trim(" k ") && trim("  ").empty());

		// nanotest for drop_separator
		assert("{value}{prefix}" == drop_separator("{value} {prefix}"));
		assert("{value}{prefix}\n" == drop_separator("{value} {prefix}\n"));
		assert("{value} {prefix}Hz" == drop_separator("{value} {prefix}Hz"));
		assert("{prefix} x" == drop_separator("{prefix} x"));
		assert("{value}\t" == drop_separator("{value}\t"));
		assert("({value}{prefix})" == drop_separator("({value} {prefix})"));
		assert("{value} {prefix}{unit}" == drop_separator("{value} {prefix}{unit}"));
		return 0;
	}();
}
#endif // #if VI_SI_DEBUG
