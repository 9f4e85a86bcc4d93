#ifndef VI_SIPREFIX_SOURCE_BUILD_NUMBER_MAKER_H
#	define VI_SIPREFIX_SOURCE_BUILD_NUMBER_MAKER_H
#	pragma once

#include <cstdint>

namespace misc
{
	// Registers one compilation time ("Mmm dd yyyy", "hh:mm:ss") and returns it as YYMMDDHHmm.
	std::uint32_t build_number_updater(const char(&date)[12], const char(&time)[9]) noexcept;
	// Every source file that includes this header registers its own time.
	static const std::uint32_t dummy_build_number_updater = build_number_updater(__DATE__, __TIME__);

	// The newest registered time, e.g. 2610180933 for 2026-10-18 09:33.
	std::uint32_t build_number_get() noexcept;
}

#endif // #ifndef VI_SIPREFIX_SOURCE_BUILD_NUMBER_MAKER_H
