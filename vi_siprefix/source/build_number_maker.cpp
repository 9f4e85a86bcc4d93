// This is an independent project of an individual developer. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++, C#, and Java: http://www.viva64.com

#include "build_number_maker.h"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <iterator>

namespace
{
	std::uint32_t last_build_number = 0U; // Constant-initialized before any dynamic initialization.

	// Two decimal digits; a leading space counts as '0' (__DATE__ pads the day with a space).
	constexpr unsigned two_digits(const char *s) noexcept
	{	return (' ' == s[0] ? 0U : static_cast<unsigned>(s[0] - '0')) * 10U + static_cast<unsigned>(s[1] - '0');
	}

	unsigned month(const char(&date)[12]) noexcept
	{	constexpr char months[][4] = { "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" };
		const auto it = std::find_if(std::begin(months), std::end(months), [&date](const char(&m)[4]) { return 0 == std::strncmp(date, m, 3); });
		assert(it != std::end(months));
		return static_cast<unsigned>(std::distance(std::begin(months), it)) + 1U;
	}
}

// date: "Mmm dd yyyy", time: "hh:mm:ss". Result: YYMMDDHHmm.
std::uint32_t misc::build_number_updater(const char(&date)[12], const char(&time)[9]) noexcept
{	const std::uint32_t result =
		two_digits(&date[9]) * 100'000'000U +
		month(date) * 1'000'000U +
		two_digits(&date[4]) * 10'000U +
		two_digits(&time[0]) * 100U +
		two_digits(&time[3]);

	last_build_number = std::max(last_build_number, result);
	return result;
}

std::uint32_t misc::build_number_get() noexcept
{	return last_build_number;
}
