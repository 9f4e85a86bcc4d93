// This is an independent project of an individual developer. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++, C#, and Java: http://www.viva64.com

#include "header.h"

#include <cassert>
#include <cstring>
#include <iostream>
#include <string>

namespace
{
	int VI_SYS_CALL collect(const char *str, void *data)
	{	static_cast<std::string *>(data)->append(str);
		return static_cast<int>(std::strlen(str));
	}

	int VI_SYS_CALL refuse(const char *, void *)
	{	return -1;
	}

	void test_lookup()
	{	static constexpr struct
		{	int line_;
			int exp_;
			const char *symbol_;
			const char *name_;
		} samples[] =
		{	{ __LINE__, -24, "y", "yocto" },
			{ __LINE__, -21, "z", "zepto" },
			{ __LINE__, -18, "a", "atto" },
			{ __LINE__, -15, "f", "femto" },
			{ __LINE__, -12, "p", "pico" },
			{ __LINE__, -9, "n", "nano" },
			{ __LINE__, -3, "m", "milli" },
			{ __LINE__, 0, "", "" },
			{ __LINE__, 3, "k", "kilo" },
			{ __LINE__, 6, "M", "mega" },
			{ __LINE__, 9, "G", "giga" },
			{ __LINE__, 12, "T", "tera" },
			{ __LINE__, 15, "P", "peta" },
			{ __LINE__, 18, "E", "exa" },
			{ __LINE__, 21, "Z", "zetta" },
			{ __LINE__, 24, "Y", "yotta" },
		};

		for (auto &s : samples)
		{	const auto symbol = vi_siSymbolFor(s.exp_);
			const auto name = vi_siNameFor(s.exp_);
			int exp = 12345;
			if (!symbol || !name || 0 != std::strcmp(symbol, s.symbol_) || 0 != std::strcmp(name, s.name_) ||
				VI_SI_OK != vi_siExponentFor(s.symbol_, &exp) || exp != s.exp_)
			{	std::cerr << "Line " << s.line_ << ": exponent " << s.exp_ << " - FAIL!!!\n";
				assert(false);
			}
		}

		// Micro has several spellings; the canonical one depends on VI_SI_ASCII_MICRO.
		assert(0 == std::strcmp(vi_siNameFor(-6), "micro"));
		const std::string micro = vi_siSymbolFor(-6);
		assert("\xC2\xB5" == micro || "u" == micro);
		for (auto alias : { "\xC2\xB5", "\xCE\xBC", "u" })
		{	int exp = 0;
			assert(VI_SI_OK == vi_siExponentFor(alias, &exp) && -6 == exp);
		}
	}

	void test_out_of_range()
	{	for (auto e : { 30, -30, 27, -27, 1, -1, 25, 2 })
		{	assert(nullptr == vi_siSymbolFor(e));
			assert(nullptr == vi_siNameFor(e));
		}

		for (auto s : { "x", "K", "kk", "mu", "  ", "e" })
		{	int exp = 12345;
			assert(VI_SI_ERR_RANGE == vi_siExponentFor(s, &exp));
			assert(12345 == exp); // Not modified on error.
		}

		int exp = 12345;
		assert(VI_SI_OK == vi_siExponentFor(" ", &exp) && 0 == exp);
	}

	void test_round_trip()
	{	for (int e = VI_SI_EXP_MIN; e <= VI_SI_EXP_MAX; e += 3)
		{	int exp = 12345;
			assert(VI_SI_OK == vi_siExponentFor(vi_siSymbolFor(e), &exp));
			assert(e == exp);
		}
	}

	void test_report()
	{	std::string text;
		const auto ret = vi_siReport(collect, &text);
		assert(ret > 0 && static_cast<std::size_t>(ret) == text.size());
		assert(0 == text.find("Exp.  Name   Symbol\n"));
		assert(std::string::npos != text.find(" -24  yocto  y\n"));
		assert(std::string::npos != text.find("  +3  kilo   k\n"));
		assert(std::string::npos != text.find(" +24  yotta  Y\n"));
		assert(std::string::npos != text.find("  -6  micro  " + std::string{ vi_siSymbolFor(-6) } + "\n"));

		std::size_t lines = 0;
		for (auto c : text)
		{	lines += ('\n' == c);
		}
		assert(1U + 17U == lines);

		assert(-1 == vi_siReport(refuse, nullptr));

		std::cout << "Prefix table:\n";
		[[maybe_unused]] const auto printed = vi_siReport();
		assert(printed > 0);
	}
} // namespace

void test_prefixes()
{	std::cout << "\nTest prefixes:\n";
	test_lookup();
	test_out_of_range();
	test_round_trip();
	test_report();
	std::cout << "Test prefixes - done" << std::endl;
}
