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
#include <cfloat>
#include <cmath>

namespace
{
	constexpr double THOUSAND = 1e3;

	// Multiplies val by 10^exp. Factors beyond DBL_MAX_10_EXP are applied in several steps
	// so that subnormal values can be scaled up without overflow.
	[[nodiscard]] double scale10(double val, int exp) noexcept
	{	static const auto MAX10 = std::pow(10.0, DBL_MAX_10_EXP);
		while (exp > DBL_MAX_10_EXP)
		{	val *= MAX10;
			exp -= DBL_MAX_10_EXP;
		}
		while (exp < -DBL_MAX_10_EXP)
		{	val /= MAX10;
			exp += DBL_MAX_10_EXP;
		}
		return exp >= 0 ? val * std::pow(10.0, exp) : val / std::pow(10.0, -exp);
	}

	// Rounds half away from zero to 'precision' fractional digits.
	[[nodiscard]] double round_ext(double num, unsigned char precision) noexcept
	{	const auto factor = std::pow(10.0, precision);
		return std::round(num * factor) / factor;
	}

	// Exponent of ten aligned to a multiple of GROUP_SIZE so that the mantissa is at least 1.
	// Non-positive exponents go one group further down; the caller renormalizes.
	[[nodiscard]] constexpr int align_exp(int exp) noexcept
	{	return exp > 0 ?
			(exp / misc::GROUP_SIZE) * misc::GROUP_SIZE :
			-((-exp + misc::GROUP_SIZE) / misc::GROUP_SIZE) * misc::GROUP_SIZE;
	}
	static_assert
	(	align_exp(1) == 0 && align_exp(2) == 0 && align_exp(3) == 3 && align_exp(5) == 3 && align_exp(28) == 27 &&
		align_exp(0) == -3 && align_exp(-1) == -3 && align_exp(-2) == -3 && align_exp(-3) == -6 && align_exp(-4) == -6
	);
} // namespace

vi_siDecomposed_t VI_SI_CALL vi_siDecompose(double value, unsigned char precision) noexcept
{	if (0.0 == value)
	{	return { 0.0, 0 };
	}
	if (!std::isfinite(value))
	{	return { value, 0 };
	}

	const auto val = std::abs(value);
	auto exp = align_exp(static_cast<int>(std::floor(std::log10(val))));
	auto mantissa = scale10(val, -exp);

	if (mantissa >= THOUSAND)
	{	mantissa /= THOUSAND;
		exp += misc::GROUP_SIZE;
	}
	else if (mantissa < 1.0)
	{	// log10() rounded up to the next integer just below a power of ten.
		mantissa *= THOUSAND;
		exp -= misc::GROUP_SIZE;
	}

	auto rounded = round_ext(mantissa, precision);
	if (rounded >= THOUSAND)
	{	// "999.96" with precision 1 must become "1.0" of the next group, not "1000.0".
		mantissa /= THOUSAND;
		exp += misc::GROUP_SIZE;
		rounded = round_ext(mantissa, precision);
	}

	assert(0 == misc::group_mod(exp));
	return { std::copysign(rounded, value), exp };
}

#if VI_SI_DEBUG
namespace
{
	const auto nanotest_decompose = []
	{	// nanotest for round_ext
		assert(1.0 == round_ext(0.95, 1));
		assert(-2.0 == round_ext(-1.5, 0));
		assert(48.0 == round_ext(47.5, 0));

		// nanotest for scale10
		assert(1000.0 == scale10(1.0, 3));
		assert(1.0 == scale10(1000.0, -3));
		assert(std::isfinite(scale10(DBL_TRUE_MIN, 327)));

		{	const auto [m, e] = vi_siDecompose(0.0, 2);
			assert(0.0 == m && 0 == e);
		}
		{	const auto [m, e] = vi_siDecompose(999.96, 1);
			assert(1.0 == m && 3 == e);
		}
		{	const auto [m, e] = vi_siDecompose(-1000.0, 1);
			assert(-1.0 == m && 3 == e);
		}
		{	const auto [m, e] = vi_siDecompose(DBL_TRUE_MIN, 1);
			assert(4.9 == m && -324 == e);
		}
		return 0;
	}();
}
#endif // #if VI_SI_DEBUG
