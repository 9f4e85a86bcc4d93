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

#ifndef VI_SIPREFIX_VI_SIPREFIX_C_H
#	define VI_SIPREFIX_VI_SIPREFIX_C_H
#	pragma once

#	define VI_SI_VERSION_MAJOR 0	// 0 - 99
#	define VI_SI_VERSION_MINOR 1	// 0 - 999
#	define VI_SI_VERSION_PATCH 0	// 0 - 9999

#	include <stddef.h>
#	include <stdio.h> // For fputs and stdout

//*******************************************************************************************************************
// Library configuration options:
//
// If VI_SI_SHARED defined, the library is a shared library.
// If VI_SI_EXPORTS defined, the library is built as a DLL and exports its functions.
//
// If VI_SI_ASCII_MICRO defined, the micro prefix is written as "u" instead of UTF-8 "µ".
// The parser accepts both spellings (and the Greek small letter mu) regardless of this option.
//#	define VI_SI_ASCII_MICRO
//*******************************************************************************************************************

// Define: VI_SYS_CALL, VI_SI_CALL and VI_SI_API vvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvv
#	if defined(_MSC_VER)
#		ifdef _M_IX86
#			define VI_SYS_CALL __cdecl
#			define VI_SI_CALL __fastcall
#		else
#			define VI_SYS_CALL
#			define VI_SI_CALL
#		endif

#		ifdef VI_SI_EXPORTS
#			define VI_SI_API __declspec(dllexport)
#		elif defined(VI_SI_SHARED)
#			define VI_SI_API __declspec(dllimport)
#		else
#			define VI_SI_API
#		endif
#	elif defined (__GNUC__) || defined(__clang__)
#		ifdef __i386__
#			define VI_SYS_CALL __attribute__((cdecl))
#			define VI_SI_CALL __attribute__((fastcall))
#		else
#			define VI_SYS_CALL
#			define VI_SI_CALL
#		endif

#		ifdef VI_SI_EXPORTS
#			define VI_SI_API __attribute__((visibility("default")))
#		else
#			define VI_SI_API
#		endif
#	else
#		define VI_SYS_CALL
#		define VI_SI_CALL
#		define VI_SI_API
#	endif
// Define: VI_SYS_CALL, VI_SI_CALL and VI_SI_API ^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^

#	define VI_EXIT_SUCCESS (0)
#	define VI_EXIT_FAILURE (-1)

#	define VI_SI_EXP_MIN (-24) // Exponent of the smallest prefix (yocto).
#	define VI_SI_EXP_MAX (24) // Exponent of the largest prefix (yotta).

typedef enum vi_siError_e
{	VI_SI_OK = VI_EXIT_SUCCESS,
	VI_SI_ERR_FAILURE = VI_EXIT_FAILURE, // Out of memory or invalid arguments.
	VI_SI_ERR_RANGE = -2,     // The exponent (or symbol) is not in the prefix table.
	VI_SI_ERR_NO_NUMBER = -3, // The text holds no digits at all.
	VI_SI_ERR_INVALID = -4,   // Unrecognized trailing characters or an unrepresentable number.
	VI_SI_ERR_AMBIGUOUS = -5, // A prefix symbol combined with an explicit exponent.
} vi_siError_e;

typedef struct vi_siDecomposed_t
{	double mantissa_; // 1 <= |mantissa_| < 1000, or 0.0 for zero.
	int exponent_;    // Multiple of 3, not limited to the prefix table.
} vi_siDecomposed_t;

typedef struct vi_siFormat_t // Settings for vi_siTickFormatter.
{	unsigned char precision_;
	const char *template_;     // nullptr - VI_SI_TEMPLATE.
	const char *exp_template_; // nullptr - VI_SI_EXP_TEMPLATE.
} vi_siFormat_t;

typedef enum vi_siInfo_e // Enumeration for various library information types.
{	VI_SI_INFO_VER,         // const unsigned*: Version number of the library.
	VI_SI_INFO_BUILDNUMBER, // const unsigned*: Build number of the library.
	VI_SI_INFO_VERSION,     // const char*: Full version string of the library.
	VI_SI_INFO_BUILDTYPE,   // const char*: Build type, either "Release" or "Debug".
	VI_SI_INFO_LIBRARYTYPE, // const char*: Library type, either "shared" or "static".

	VI_SI_INFO_COUNT_,      // Number of information types.
} vi_siInfo_e;

typedef int (VI_SYS_CALL *vi_siReportCb_t)(const char* str, void* data); // Callback type for report function. ABI must be compatible with std::fputs!

#	define VI_SI_TEMPLATE "{value} {prefix}"
#	define VI_SI_EXP_TEMPLATE "{value}e{exponent}"

#	ifdef __cplusplus
extern "C" {

#	define VI_NODISCARD [[nodiscard]]
#	define VI_NOEXCEPT noexcept
#	define VI_DEF(v) = (v)
#else
#	define VI_NODISCARD
#	define VI_NOEXCEPT
#	define VI_DEF(v)
#endif

// Main functions: vvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvv
	/// <summary>
	/// Splits a value into a mantissa in [1, 1000) and an exponent of ten that is a multiple of 3.
	/// </summary>
	/// <param name="value">Any finite value. Zero gives {0.0, 0}.</param>
	/// <param name="precision">Number of fractional digits the mantissa is rounded to.</param>
	/// <returns>The mantissa and the exponent. The exponent may exceed the prefix table.</returns>
	VI_SI_API VI_NODISCARD vi_siDecomposed_t VI_SI_CALL vi_siDecompose(double value, unsigned char precision VI_DEF(1)) VI_NOEXCEPT;

	/// <summary>
	/// Returns the prefix symbol for an exponent of ten ("k" for 3, "" for 0).
	/// </summary>
	/// <returns>A static null-terminated string, or nullptr if the exponent is not one of -24, -21, ..., 24.</returns>
	VI_SI_API VI_NODISCARD const char* VI_SI_CALL vi_siSymbolFor(int exponent) VI_NOEXCEPT;

	/// <summary>
	/// Returns the prefix name for an exponent of ten ("kilo" for 3, "" for 0).
	/// </summary>
	/// <returns>A static null-terminated string, or nullptr if the exponent is not in the table.</returns>
	VI_SI_API VI_NODISCARD const char* VI_SI_CALL vi_siNameFor(int exponent) VI_NOEXCEPT;

	/// <summary>
	/// Looks up the exponent of ten for a prefix symbol. The empty string and " " stand for 10^0.
	/// </summary>
	/// <param name="symbol">The prefix symbol.</param>
	/// <param name="exponent">Receives the exponent. Not modified on error.</param>
	/// <returns>VI_SI_OK, VI_SI_ERR_RANGE for an unknown symbol, or VI_SI_ERR_FAILURE for null arguments.</returns>
	VI_SI_API int VI_SI_CALL vi_siExponentFor(const char *symbol, int *exponent) VI_NOEXCEPT;

	/// <summary>
	/// Formats a value with an SI prefix, falling back to exponential notation outside yocto..yotta.
	/// </summary>
	/// <param name="buff">Destination buffer. May be nullptr if size is zero.</param>
	/// <param name="size">Size of the destination buffer. The result is always null-terminated if size is not zero.</param>
	/// <param name="value">The value to format.</param>
	/// <param name="precision">Number of fractional digits.</param>
	/// <param name="tmpl">Template with {value} and {prefix} placeholders. nullptr selects VI_SI_TEMPLATE.
	/// For the empty prefix the whitespace in front of {prefix} is dropped unless a unit follows: "3.94", "3.94 Hz".</param>
	/// <param name="exp_tmpl">Template with {value} and {exponent} placeholders. nullptr selects VI_SI_EXP_TEMPLATE.</param>
	/// <returns>The length of the whole result (like snprintf), or VI_EXIT_FAILURE.</returns>
	VI_SI_API int VI_SI_CALL vi_siFormat
	(	char *buff,
		size_t size,
		double value,
		unsigned char precision VI_DEF(1),
		const char *tmpl VI_DEF(nullptr),
		const char *exp_tmpl VI_DEF(nullptr)
	) VI_NOEXCEPT;

	/// <summary>
	/// Parses plain or exponential notation ("1.0e-27") or SI-prefixed notation ("47.8 m").
	/// </summary>
	/// <param name="text">Null-terminated text.</param>
	/// <param name="result">Receives the value. Not modified on error.</param>
	/// <returns>VI_SI_OK or one of VI_SI_ERR_NO_NUMBER, VI_SI_ERR_INVALID, VI_SI_ERR_AMBIGUOUS, VI_SI_ERR_FAILURE.</returns>
	VI_SI_API int VI_SI_CALL vi_siParse(const char *text, double *result) VI_NOEXCEPT;

	/// <summary>
	/// Retrieves static information about the library based on the specified info type.
	/// </summary>
	/// <returns>A pointer to the requested static information, or nullptr if the info type is not recognized.</returns>
	VI_SI_API VI_NODISCARD const void* VI_SI_CALL vi_siStaticInfo(vi_siInfo_e info);
// Main functions ^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^

// Auxiliary functions: vvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvvv
	VI_SI_API int VI_SYS_CALL vi_siReportCb(const char *str, void *data);

	/// <summary>
	/// Writes the prefix table (exponent, symbol, name) through a callback, one line per prefix.
	/// </summary>
	/// <param name="fn">A callback function used to output each line. If nullptr, vi_siReportCb is used.</param>
	/// <param name="data">A pointer to user data passed to the callback function.</param>
	/// <returns>The sum of the callback results, or a negative value if an error occurs.</returns>
	VI_SI_API int VI_SI_CALL vi_siReport(vi_siReportCb_t fn VI_DEF(vi_siReportCb), void *data VI_DEF(nullptr));

	/// <summary>
	/// Axis tick formatter compatible with ImPlotFormatter: int(*)(double value, char* buff, int size, void* user_data).
	/// </summary>
	/// <param name="data">const vi_siFormat_t* with precision and templates, or nullptr for precision 0 and the default templates.</param>
	/// <returns>The length of the whole result (like snprintf), or a negative value on error.</returns>
	VI_SI_API int VI_SYS_CALL vi_siTickFormatter(double value, char *buff, int size, void *data);

	// Returns a static description of a vi_siError_e code.
	VI_SI_API VI_NODISCARD const char* VI_SI_CALL vi_siErrorText(int code) VI_NOEXCEPT;
// Auxiliary functions: ^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^

#	ifdef __cplusplus
} // extern "C"
#	endif

#endif // #ifndef VI_SIPREFIX_VI_SIPREFIX_C_H
