#pragma once

/**
 * @file canlog.hpp
 * @brief Main convenience header for CanLog
 *
 * Include this single header to access all library functionality.
 *
 * @example Basic Usage
 * @code
 * #include <canlog/canlog.hpp>
 *
 * int main() {
 *     std::error_code ec;
 *     CanLog::CsvWriter writer("capture.csv", false, ec);
 *     CanLog::MessageRecord msg(1483389946.197, 0xdadada, {42, 9}, true);
 *     writer.onMessageReceived(msg, ec);
 *     writer.stop();
 *
 *     CanLog::CsvReader reader("capture.csv", ec);
 *     CanLog::MessageRecord rec;
 *     while (reader.next(rec, ec)) {
 *         // ...
 *     }
 * }
 * @endcode
 */

// =============================================================================
// Record Types
// =============================================================================
#include "record/MessageRecord.hpp"
#include "record/CsvFormat.hpp"
#include "record/RecordError.hpp"

// =============================================================================
// Readers / Writers
// =============================================================================
#include "io/MessageReader.hpp"
#include "io/MessageWriter.hpp"
#include "io/CsvReader.hpp"
#include "io/CsvWriter.hpp"

// =============================================================================
// Utilities
// =============================================================================
#include "util/UniqueFd.hpp"
#include "util/LineReader.hpp"
#include "util/textFormatUtil.hpp"
#include "util/base64.hpp"

/**
 * @namespace CanLog
 * @brief Root namespace for the CanLog library
 *
 * Key components:
 * - Record types: MessageRecord, RecordErrc, format::COLUMNS
 * - Readers / writers: MessageReader, MessageWriter, CsvReader, CsvWriter
 * - Utilities: UniqueFd, LineReader, text and base64 helpers
 */
namespace CanLog {

// Version information
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

} // namespace CanLog
