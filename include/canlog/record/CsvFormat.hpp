#pragma once
/// @file CsvFormat.hpp
/// @brief Column table and delimiters of the CSV log format

#include <array>
#include <cstddef>
#include <string>

namespace CanLog {
namespace format {

/// @brief Column positions. Order is part of the file format.
enum Column : size_t {
    TIMESTAMP = 0,
    ARBITRATION_ID,
    EXTENDED_FLAG,
    REMOTE_FLAG,
    ERROR_FLAG,
    DLC,
    DATA,
    COLUMN_COUNT
};

/// @brief Header names, indexed by Column
constexpr std::array<const char*, COLUMN_COUNT> COLUMNS = {
    "timestamp", "arbitration_id", "extended", "remote", "error", "dlc", "data"};

constexpr char DELIMITER = ',';

/// @brief Line terminator written after every line (POSIX native)
constexpr const char* LINE_TERMINATOR = "\n";

constexpr const char* FLAG_TRUE = "1";
constexpr const char* FLAG_FALSE = "0";

/// @brief Header line without terminator
inline std::string headerLine() {
    std::string out;
    for (size_t i = 0; i < COLUMNS.size(); ++i) {
        if (i != 0)
            out += DELIMITER;
        out += COLUMNS[i];
    }
    return out;
}

} // namespace format
} // namespace CanLog
