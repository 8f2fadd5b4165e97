//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Shortest round-trip number formatting. The digits are found by widening the
// `%.*e` precision until strtod reproduces the input, then laid out following
// the Number::toString algorithm of ECMA-262 (k digits, decimal exponent n).
//
//===----------------------------------------------------------------------===//

#include "support/number_format.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace lion::support
{
namespace
{
/// @brief Split |value| into significant digits and exponent of the first digit.
void shortestDigits(double value, std::string &digits, int &exponent)
{
    char buf[40];
    for (int precision = 1; precision <= 17; ++precision)
    {
        std::snprintf(buf, sizeof(buf), "%.*e", precision - 1, value);
        if (std::strtod(buf, nullptr) == value)
            break;
    }

    digits.clear();
    const char *p = buf;
    for (; *p && *p != 'e'; ++p)
    {
        if (*p >= '0' && *p <= '9')
            digits.push_back(*p);
    }
    exponent = (*p == 'e') ? std::atoi(p + 1) : 0;

    while (digits.size() > 1 && digits.back() == '0')
        digits.pop_back();
}
} // namespace

std::string formatNumber(double value)
{
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return value < 0 ? "-Infinity" : "Infinity";
    if (value == 0.0)
        return "0";

    std::string out;
    if (value < 0)
    {
        out.push_back('-');
        value = -value;
    }

    std::string digits;
    int exponent = 0;
    shortestDigits(value, digits, exponent);

    const int k = static_cast<int>(digits.size());
    const int n = exponent + 1;

    if (k <= n && n <= 21)
    {
        out += digits;
        out.append(static_cast<size_t>(n - k), '0');
    }
    else if (0 < n && n <= 21)
    {
        out += digits.substr(0, static_cast<size_t>(n));
        out.push_back('.');
        out += digits.substr(static_cast<size_t>(n));
    }
    else if (-6 < n && n <= 0)
    {
        out += "0.";
        out.append(static_cast<size_t>(-n), '0');
        out += digits;
    }
    else
    {
        out.push_back(digits[0]);
        if (k > 1)
        {
            out.push_back('.');
            out += digits.substr(1);
        }
        out.push_back('e');
        out.push_back(n - 1 >= 0 ? '+' : '-');
        out += std::to_string(std::abs(n - 1));
    }
    return out;
}

} // namespace lion::support
