#pragma once
/// @file textFormatUtil.hpp
/// @brief Field-level parsing and formatting helpers for CSV log lines

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <locale>
#include <locale.h>
#include <sstream>
#include <stdlib.h>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace CanLog::util {

/// @brief Strip leading and trailing ASCII whitespace
inline std::string_view trimWs(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

/// @brief Split on a single-character delimiter. No quoting or escaping.
/// @details "a,,b" yields three fields; an empty line yields one empty field.
inline std::vector<std::string_view> splitFields(std::string_view line, char delim) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(delim, start);
        if (pos == std::string_view::npos) {
            out.push_back(line.substr(start));
            break;
        }
        out.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

inline int digitValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return 99;
}

/// @brief Parse an unsigned 32-bit integer, whole field only
/// @details Surrounding whitespace and a leading '+' are accepted. With base 16 an
///          optional "0x"/"0X" prefix is skipped.
///          Sets invalid_argument or result_out_of_range on failure.
inline bool parseUnsignedStrict(std::string_view s, int base, uint32_t& out,
                                std::error_code& ec) {
    ec.clear();
    s = trimWs(s);
    if (!s.empty() && s.front() == '+')
        s.remove_prefix(1);
    if (base == 16 && s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
        s.remove_prefix(2);
    if (s.empty()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    uint64_t v = 0;
    for (char c : s) {
        int d = digitValue(c);
        if (d >= base) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        v = v * static_cast<uint64_t>(base) + static_cast<uint64_t>(d);
        if (v > std::numeric_limits<uint32_t>::max()) {
            ec = std::make_error_code(std::errc::result_out_of_range);
            return false;
        }
    }
    out = static_cast<uint32_t>(v);
    return true;
}

/// @brief "C" numeric locale, created once and never freed
/// @details Log text must not depend on what the host program passed to setlocale().
inline locale_t classicNumericLocale() {
    static const locale_t loc = ::newlocale(LC_NUMERIC_MASK, "C", static_cast<locale_t>(0));
    return loc;
}

/// @brief Parse a decimal floating point number, whole field only
/// @details Accepts surrounding whitespace, exponents, "inf" and "nan".
///          Hexadecimal floats are rejected. Out-of-range magnitudes saturate.
///          The decimal point is always '.', whatever the process locale.
inline bool parseDoubleStrict(std::string_view s, double& out, std::error_code& ec) {
    ec.clear();
    s = trimWs(s);
    if (s.empty() || s.find_first_of("xX") != std::string_view::npos) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    locale_t loc = classicNumericLocale();
    if (loc == static_cast<locale_t>(0)) {
        ec = std::make_error_code(std::errc::not_enough_memory);
        return false;
    }

    std::string tmp(s);
    char* end = nullptr;
    double v = ::strtod_l(tmp.c_str(), &end, loc);
    if (end != tmp.c_str() + tmp.size()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    out = v;
    return true;
}

/// @brief Shortest decimal text that parses back to exactly the same double
/// @details Integral values keep a ".0" suffix ("2.0"); exponent forms and
///          inf/nan are left as printed.
inline std::string formatDouble(double v) {
    std::string text;
    for (int prec = 15; prec <= 17; ++prec) {
        std::ostringstream os;
        os.imbue(std::locale::classic());
        os << std::setprecision(prec) << v;
        text = os.str();

        double back = 0;
        std::error_code ec;
        if (parseDoubleStrict(text, back, ec) && back == v)
            break;
    }
    // nan never compares equal; the last attempt ("nan") is kept
    if (text.find_first_of(".eni") == std::string::npos)
        text += ".0";
    return text;
}

/// @brief Lowercase hexadecimal with a 0x prefix ("0x0" for zero)
inline std::string formatHex(uint32_t v) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%x", static_cast<unsigned>(v));
    return buf;
}

} // namespace CanLog::util
