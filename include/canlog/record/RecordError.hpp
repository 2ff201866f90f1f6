#pragma once
/// @file RecordError.hpp
/// @brief Error codes for malformed CSV log lines

#include <system_error>

namespace CanLog {

/// @brief Reasons a content line is rejected (MalformedRecord)
/// @details Every value compares equal to std::errc::invalid_argument.
enum class RecordErrc {
    FieldCount = 1,   ///< Not exactly seven comma-separated fields
    Timestamp,        ///< Timestamp is not a floating point number
    ArbitrationId,    ///< Arbitration id is not hexadecimal or overflows 32 bits
    Dlc,              ///< DLC is not a decimal integer or overflows 32 bits
    Data,             ///< Data is not valid base64
};

/// @brief Category for RecordErrc ("canlog.record")
const std::error_category& recordCategory() noexcept;

std::error_code make_error_code(RecordErrc e) noexcept;

/// @brief True for any code produced by a malformed content line
bool isMalformedRecord(const std::error_code& ec) noexcept;

} // namespace CanLog

namespace std {
template <> struct is_error_code_enum<CanLog::RecordErrc> : true_type {};
} // namespace std
