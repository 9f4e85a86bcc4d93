// This is an independent project of an individual developer. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++, C#, and Java: http://www.viva64.com

#include "header.h"

#include <cassert>
#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <string>

namespace
{
	std::string micro(const char *value)
	{	return std::string{ value } + " " + vi_siSymbolFor(-6);
	}

	std::string to_string(double value, unsigned char precision, const char *tmpl = nullptr, const char *exp_tmpl = nullptr)
	{	char buff[64];
		const auto len = vi_siFormat(buff, sizeof(buff), value, precision, tmpl, exp_tmpl);
		assert(len >= 0 && static_cast<std::size_t>(len) < sizeof(buff));
		assert(static_cast<std::size_t>(len) == std::strlen(buff));
		return buff;
	}

	void test_samples()
	{	static const struct
		{	int line_;
			double value_;
			unsigned char precision_;
			std::string expected_;
		} samples[] =
		{	{ __LINE__, 0.04781, 2, "47.81 m" },
			{ __LINE__, 4781.123, 2, "4.78 k" },
			{ __LINE__, 0.04781, 3, "47.810 m" },
			{ __LINE__, 4781.123, 3, "4.781 k" },
			{ __LINE__, 1e-27, 1, "1.0e-27" },
			{ __LINE__, 1.764e-24, 1, "1.8 y" },
			{ __LINE__, 7.4088e-23, 2, "74.09 y" },
			{ __LINE__, 3.1117e-21, 2, "3.11 z" },
			{ __LINE__, 1.30691e-19, 2, "130.69 z" },
			{ __LINE__, 5.48903e-18, 2, "5.49 a" },
			{ __LINE__, 2.30539e-16, 2, "230.54 a" },
			{ __LINE__, 9.68265e-15, 2, "9.68 f" },
			{ __LINE__, 4.06671e-13, 2, "406.67 f" },
			{ __LINE__, 1.70802e-11, 2, "17.08 p" },
			{ __LINE__, 7.17368e-10, 2, "717.37 p" },
			{ __LINE__, 3.01295e-08, 2, "30.13 n" },
			{ __LINE__, 1.26544e-06, 2, micro("1.27") },
			{ __LINE__, 5.31484e-05, 2, micro("53.15") },
			{ __LINE__, 0.00223223, 2, "2.23 m" },
			{ __LINE__, 0.0937537, 2, "93.75 m" },
			{ __LINE__, 3.93766, 2, "3.94" },
			{ __LINE__, 165.382, 2, "165.38" },
			{ __LINE__, 6946.03, 2, "6.95 k" },
			{ __LINE__, 291733, 2, "291.73 k" },
			{ __LINE__, 1.22528e+07, 2, "12.25 M" },
			{ __LINE__, 5.14617e+08, 2, "514.62 M" },
			{ __LINE__, 2.16139e+10, 2, "21.61 G" },
			{ __LINE__, 9.07785e+11, 2, "907.79 G" },
			{ __LINE__, 3.8127e+13, 2, "38.13 T" },
			{ __LINE__, 1.60133e+15, 2, "1.60 P" },
			{ __LINE__, 6.7256e+16, 2, "67.26 P" },
			{ __LINE__, 2.82475e+18, 2, "2.82 E" },
			{ __LINE__, 1.1864e+20, 2, "118.64 E" },
			{ __LINE__, 4.98286e+21, 2, "4.98 Z" },
			{ __LINE__, 2.0928e+23, 2, "209.28 Z" },
			{ __LINE__, 8.78977e+24, 2, "8.79 Y" },
			{ __LINE__, 3.6917e+26, 2, "369.17 Y" },
			{ __LINE__, 1.55051e+28, 2, "15.51e+27" },
			{ __LINE__, 6.51216e+29, 2, "651.22e+27" },
			{ __LINE__, -0.04781, 2, "-47.81 m" },
			{ __LINE__, 999.96, 1, "1.0 k" }, // Not "1000.0".
			{ __LINE__, 999999.0, 0, "1 M" },
			{ __LINE__, 1.0, 0, "1" },
			{ __LINE__, 0.0, 1, "0.0" },
			{ __LINE__, 1e24, 1, "1.0 Y" },
			{ __LINE__, 1e-24, 1, "1.0 y" },
			{ __LINE__, 9.995e-25, 2, "999.50e-27" },
			{ __LINE__, 1.7976931348623157e308, 2, "179.77e+306" },
			{ __LINE__, std::numeric_limits<double>::quiet_NaN(), 2, "NaN" },
			{ __LINE__, std::numeric_limits<double>::infinity(), 2, "INF" },
			{ __LINE__, -std::numeric_limits<double>::infinity(), 2, "-INF" },
		};

		for (auto &s : samples)
		{	if (const auto str = to_string(s.value_, s.precision_); str != s.expected_)
			{	std::cerr << "Line " << s.line_ << ": \'" << str << "\' != \'" << s.expected_ << "\' - FAIL!!!\n";
				assert(false);
			}
		}
	}

	void test_templates()
	{	assert("4.78kHz" == to_string(4781.123, 2, "{value}{prefix}Hz"));
		assert("3.94 Hz" == to_string(3.93766, 2, "{value} {prefix}Hz"));
		assert("4.78 k {unit}" == to_string(4781.123, 2, "{value} {prefix} {unit}"));
		assert("[4.78|k|4.78]" == to_string(4781.123, 2, "[{value}|{prefix}|{value}]"));
		assert("1.0x10^-27" == to_string(1e-27, 1, nullptr, "{value}x10^{exponent}"));
		assert("15.5 (+27)" == to_string(1.55051e+28, 1, "unused", "{value} ({exponent})"));
		assert("no placeholders" == to_string(4781.123, 2, "no placeholders"));
		assert("{k} 1.0 k" == to_string(1000.0, 1, "{{prefix}} {value} {prefix}"));

		// An empty prefix takes only its own separator; the rest of the template stays.
		assert("3.94\n" == to_string(3.93766, 2, "{value} {prefix}\n"));
		assert("4.78 k\n" == to_string(4781.123, 2, "{value} {prefix}\n"));
		assert("3.94\t" == to_string(3.93766, 2, "{value}\t"));
		assert("4.78\t" == to_string(4.78, 2, "{value}\t"));
		assert("3.94 {unit}" == to_string(3.93766, 2, "{value} {prefix} {unit}"));
		assert("(3.94)" == to_string(3.93766, 2, "({value} {prefix})"));
	}

	void test_buffer()
	{	char buff[4] = { 'x', 'x', 'x', 'x' };

		// Like snprintf: the full length is returned, the output is truncated and null-terminated.
		assert(6 == vi_siFormat(nullptr, 0U, 4781.123, 2, nullptr, nullptr));
		assert(6 == vi_siFormat(buff, 0U, 4781.123, 2, nullptr, nullptr));
		assert('x' == buff[0]);
		assert(6 == vi_siFormat(buff, sizeof(buff), 4781.123, 2, nullptr, nullptr));
		assert(0 == std::strcmp(buff, "4.7"));
		assert(6 == vi_siFormat(buff, 1U, 4781.123, 2, nullptr, nullptr));
		assert('\0' == buff[0]);
	}

	// Same shape as the axis tick formatter callback of plotting libraries (ImPlotFormatter).
	using plot_formatter_t = int (*)(double value, char *buff, int size, void *user_data);

	void test_tick_formatter()
	{	char buff[32];

		const plot_formatter_t formatter = vi_siTickFormatter;
		vi_siFormat_t precise{ 2, nullptr, nullptr };
		assert(6 == formatter(4781.123, buff, static_cast<int>(sizeof(buff)), &precise));
		assert(0 == std::strcmp(buff, "4.78 k"));
		assert(4 == formatter(3.93766, buff, static_cast<int>(sizeof(buff)), &precise));
		assert(0 == std::strcmp(buff, "3.94"));

		// Without settings: precision 0 and the default templates.
		assert(3 == vi_siTickFormatter(4781.123, buff, static_cast<int>(sizeof(buff)), nullptr));
		assert(0 == std::strcmp(buff, "5 k"));

		vi_siFormat_t settings{ 2, "{value} {prefix}V", nullptr };
		assert(7 == vi_siTickFormatter(4781.123, buff, static_cast<int>(sizeof(buff)), &settings));
		assert(0 == std::strcmp(buff, "4.78 kV"));
		assert(9 == vi_siTickFormatter(1.55051e+28, buff, static_cast<int>(sizeof(buff)), &settings));
		assert(0 == std::strcmp(buff, "15.51e+27"));

		assert(1 == vi_siTickFormatter(0.0, buff, static_cast<int>(sizeof(buff)), nullptr));
		assert(0 == std::strcmp(buff, "0"));
	}

	// Formatted text parses back to the value within the displayed precision.
	void test_round_trip()
	{	static constexpr double mantissas[] = { 1.0, 2.5, 3.14159, 47.81, 291.733, 999.4 };
		for (int e = -30; e <= 30; ++e)
		{	for (auto m : mantissas)
			{	for (auto sign : { 1.0, -1.0 })
				{	const auto value = sign * m * std::pow(10.0, e);
					for (unsigned char precision = 0; precision <= 3; ++precision)
					{	const auto str = to_string(value, precision);
						double parsed = 0.0;
						if
						(	VI_SI_OK != vi_siParse(str.c_str(), &parsed) ||
							std::abs(parsed - value) > std::pow(10.0, -precision) * std::abs(value)
						)
						{	std::cerr << "Round trip of " << value << " via \'" << str << "\' - FAIL!!!\n";
							assert(false);
						}
					}
				}
			}
		}
	}
} // namespace

void test_format()
{	std::cout << "\nTest format:\n";
	test_samples();
	test_templates();
	test_buffer();
	test_tick_formatter();
	test_round_trip();
	std::cout << "Test format - done" << std::endl;
}
