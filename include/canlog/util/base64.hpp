#pragma once
/// @file base64.hpp
/// @brief Standard base64 (RFC 4648, padded, no line wrapping)

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "textFormatUtil.hpp"

namespace CanLog::util {

constexpr const char* BASE64_ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline std::string base64Encode(const std::vector<uint8_t>& in) {
    std::string out;
    out.reserve((in.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < in.size(); i += 3) {
        uint32_t n = (uint32_t(in[i]) << 16) | (uint32_t(in[i + 1]) << 8) | in[i + 2];
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += BASE64_ALPHABET[(n >> 6) & 0x3F];
        out += BASE64_ALPHABET[n & 0x3F];
    }

    size_t rest = in.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t(in[i]) << 16;
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(in[i]) << 16) | (uint32_t(in[i + 1]) << 8);
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += BASE64_ALPHABET[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

inline int base64Value(char c) {
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    if (c == '+')
        return 62;
    if (c == '/')
        return 63;
    return -1;
}

/// @brief Decode padded base64. Surrounding whitespace is ignored.
/// @details Length must be a multiple of 4 and '=' may only appear as the final
///          one or two characters. On failure `out` is left untouched and
///          ec is set to invalid_argument.
inline bool base64Decode(std::string_view in, std::vector<uint8_t>& out, std::error_code& ec) {
    ec.clear();
    in = trimWs(in);
    if (in.size() % 4 != 0) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    size_t pad = 0;
    if (!in.empty() && in.back() == '=') {
        pad = (in.size() >= 2 && in[in.size() - 2] == '=') ? 2 : 1;
    }

    std::vector<uint8_t> tmp;
    tmp.reserve(in.size() / 4 * 3);

    for (size_t i = 0; i < in.size(); i += 4) {
        bool last = (i + 4 == in.size());
        uint32_t n = 0;
        for (size_t k = 0; k < 4; ++k) {
            char c = in[i + k];
            int v = 0;
            if (c == '=') {
                // padding only in the trailing positions of the final quantum
                if (!last || k < 4 - pad) {
                    ec = std::make_error_code(std::errc::invalid_argument);
                    return false;
                }
            } else {
                v = base64Value(c);
                if (v < 0 || (last && k >= 4 - pad)) {
                    ec = std::make_error_code(std::errc::invalid_argument);
                    return false;
                }
            }
            n = (n << 6) | static_cast<uint32_t>(v);
        }
        tmp.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (!last || pad < 2)
            tmp.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (!last || pad < 1)
            tmp.push_back(static_cast<uint8_t>(n & 0xFF));
    }

    out = std::move(tmp);
    return true;
}

} // namespace CanLog::util
