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

#ifndef VI_SIPREFIX_VI_SIPREFIX_HPP
#	define VI_SIPREFIX_VI_SIPREFIX_HPP
#	pragma once

#include "vi_siprefix_c.h"

#ifdef __cplusplus
#	include <cassert>
#	include <cmath>
#	include <new>
#	include <stdexcept>
#	include <string>
#	include <string_view>
#	include <utility>

namespace vi_si
{
	using decomposed_t = vi_siDecomposed_t;

	// The exponent (or the symbol) has no entry in the prefix table.
	class range_error: public std::out_of_range
	{	public: using std::out_of_range::out_of_range;
	};

	// The text is not a number in plain, exponential or SI-prefixed notation.
	class parse_error: public std::invalid_argument
	{	int code_;
	public:
		explicit parse_error(int code): std::invalid_argument{ vi_siErrorText(code) }, code_{ code } {}
		[[nodiscard]] int code() const noexcept { return code_; }
	};

	[[nodiscard]] inline decomposed_t decompose(double value, unsigned char precision = 1) noexcept
	{	return vi_siDecompose(value, precision);
	}

	[[nodiscard]] inline std::string_view symbol_for(int exponent)
	{	if (const auto result = vi_siSymbolFor(exponent))
		{	return result;
		}
		throw range_error{ vi_siErrorText(VI_SI_ERR_RANGE) };
	}

	[[nodiscard]] inline std::string_view name_for(int exponent)
	{	if (const auto result = vi_siNameFor(exponent))
		{	return result;
		}
		throw range_error{ vi_siErrorText(VI_SI_ERR_RANGE) };
	}

	[[nodiscard]] inline int exponent_for(const char *symbol)
	{	int result = 0;
		if (VI_SI_OK != vi_siExponentFor(symbol, &result))
		{	throw range_error{ vi_siErrorText(VI_SI_ERR_RANGE) };
		}
		return result;
	}

	[[nodiscard]] inline int exponent_for(const std::string &symbol)
	{	return exponent_for(symbol.c_str());
	}

	// Multiple associated with a symbol, e.g. 1000.0 for "k".
	[[nodiscard]] inline double scale_for(const char *symbol)
	{	return std::pow(10.0, exponent_for(symbol));
	}

	[[nodiscard]] inline double scale_for(const std::string &symbol)
	{	return scale_for(symbol.c_str());
	}

	[[nodiscard]] inline std::string format
	(	double value,
		unsigned char precision = 1,
		const char *tmpl = VI_SI_TEMPLATE,
		const char *exp_tmpl = VI_SI_EXP_TEMPLATE
	)
	{	const auto len = vi_siFormat(nullptr, 0U, value, precision, tmpl, exp_tmpl);
		if (len < 0)
		{	throw std::bad_alloc{};
		}

		std::string result(static_cast<std::size_t>(len) + 1U, '\0');
		[[maybe_unused]] const auto written = vi_siFormat(result.data(), result.size(), value, precision, tmpl, exp_tmpl);
		assert(written == len);
		result.resize(static_cast<std::size_t>(len));
		return result;
	}

	[[nodiscard]] inline double parse(const char *text)
	{	double result = 0.0;
		if (const auto code = vi_siParse(text, &result); VI_SI_OK != code)
		{	throw parse_error{ code };
		}
		return result;
	}

	[[nodiscard]] inline double parse(const std::string &text)
	{	return parse(text.c_str());
	}

	// Axis tick formatter for plotting libraries that call back with (value, position) and expect text.
	class tick_formatter_t
	{	std::string template_{ VI_SI_TEMPLATE };
		std::string exp_template_{ VI_SI_EXP_TEMPLATE };
		unsigned char precision_ = 0;
	public:
		tick_formatter_t() = default;
		explicit tick_formatter_t(unsigned char precision, std::string tmpl = VI_SI_TEMPLATE, std::string exp_tmpl = VI_SI_EXP_TEMPLATE)
		:	template_{ std::move(tmpl) }, exp_template_{ std::move(exp_tmpl) }, precision_{ precision }
		{}

		[[nodiscard]] std::string operator()(double value, double /*position*/ = 0.0) const
		{	return format(value, precision_, template_.c_str(), exp_template_.c_str());
		}

		// Settings for the C callback vi_siTickFormatter. Valid while *this is alive and unchanged.
		[[nodiscard]] vi_siFormat_t settings() const noexcept
		{	return { precision_, template_.c_str(), exp_template_.c_str() };
		}
	}; // class tick_formatter_t
} // namespace vi_si

#		define VI_SI_FULLVERSION static_cast<const char*>(vi_siStaticInfo(VI_SI_INFO_VERSION))
#endif // #ifdef __cplusplus
#endif // #ifndef VI_SIPREFIX_VI_SIPREFIX_HPP
