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

#include <array>
#include <cassert>
#include <cstdio>
#include <iterator>

namespace
{
#if VI_SI_DEBUG
	constexpr char CONFIG[] = "Debug";
#else
	constexpr char CONFIG[] = "Release";
#endif
#ifdef VI_SI_SHARED
	constexpr char TYPE[] = "shared";
#else
	constexpr char TYPE[] = "static";
#endif
} // namespace

const void* VI_SI_CALL vi_siStaticInfo(vi_siInfo_e info)
{	switch (info)
	{
		case VI_SI_INFO_VER:
		{	// MMmmmPPPP
			static const unsigned ver = (VI_SI_VERSION_MAJOR * 1000U + VI_SI_VERSION_MINOR) * 10000U + VI_SI_VERSION_PATCH;
			return &ver;
		}

		case VI_SI_INFO_BUILDNUMBER:
		{	static const unsigned build = misc::build_number_get();
			return &build;
		}

		case VI_SI_INFO_VERSION:
		{	// "0.1.0.2610180933D static"
			static const auto version = []
				{	static_assert(VI_SI_VERSION_MAJOR <= 99 && VI_SI_VERSION_MINOR <= 999 && VI_SI_VERSION_PATCH <= 9999);
					std::array<char, (std::size("99.999.9999.YYMMDDHHmm") - 1) + 2 + (std::size(TYPE) - 1) + 1> result;
					[[maybe_unused]] const auto sz = std::snprintf
					(	result.data(),
						result.size(),
						"%u.%u.%u.%u%c %s",
						static_cast<unsigned>(VI_SI_VERSION_MAJOR),
						static_cast<unsigned>(VI_SI_VERSION_MINOR),
						static_cast<unsigned>(VI_SI_VERSION_PATCH),
						static_cast<unsigned>(misc::build_number_get()),
						CONFIG[0],
						TYPE
					);
					assert(0 < sz && static_cast<std::size_t>(sz) < result.size());
					return result;
				}();
			return version.data();
		}

		case VI_SI_INFO_BUILDTYPE:
			return CONFIG;

		case VI_SI_INFO_LIBRARYTYPE:
			return TYPE;

		default:
			static_assert(VI_SI_INFO_COUNT_ == 5, "Not all vi_siInfo_e enum values are processed in the function vi_siStaticInfo.");
			assert(false);
			return nullptr;
	}
} // vi_siStaticInfo(vi_siInfo_e info)

int VI_SYS_CALL vi_siReportCb(const char *str, void *data)
{	// 'data' may be a FILE* opened by the same RTL library as this one; stdout otherwise.
	auto stream = static_cast<std::FILE *>(data);
	return std::fputs(str, stream ? stream : stdout);
}

const char* VI_SI_CALL vi_siErrorText(int code) noexcept
{	switch (code)
	{
		case VI_SI_OK:
			return "success";
		case VI_SI_ERR_FAILURE:
			return "failure";
		case VI_SI_ERR_RANGE:
			return "exponent out of representable range";
		case VI_SI_ERR_NO_NUMBER:
			return "no number found";
		case VI_SI_ERR_INVALID:
			return "invalid number";
		case VI_SI_ERR_AMBIGUOUS:
			return "ambiguous number";
		default:
			return "unknown error";
	}
}
