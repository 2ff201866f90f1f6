#pragma once
/// @file CsvReader.hpp
/// @brief Reader for CSV message logs

#include "../record/MessageRecord.hpp"
#include "../util/LineReader.hpp"
#include "../util/UniqueFd.hpp"

#include "MessageReader.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <system_error>

namespace CanLog {

/// @brief Iterates over the records of a CSV log
/// @details The first line is assumed to be the header and is skipped
///          unconditionally. Any line separator is accepted.
///
/// @code
/// std::error_code ec;
/// CanLog::CsvReader reader("capture.csv", ec);
/// CanLog::MessageRecord rec;
/// while (reader.next(rec, ec)) { ... }
/// if (ec) { ... reader.lineNumber() ... }
/// @endcode
class CsvReader : public MessageReader {
  public:
    /// @brief Open a file for reading; the descriptor is owned by the reader
    /// @param path File path
    /// @param ec Error code set on failure
    CsvReader(const std::string& path, std::error_code& ec);

    /// @brief Read from an open descriptor; it is never closed by the reader
    /// @param fd Descriptor opened for reading
    explicit CsvReader(int fd);

    ~CsvReader() override = default;

    CsvReader(const CsvReader&) = delete;
    CsvReader& operator=(const CsvReader&) = delete;

    /// @brief Produce the next record
    /// @details Returns false with ec clear at end of data (including a
    ///          stream without a header line) and performs stop(). A
    ///          malformed line sets ec to a RecordErrc; the following call
    ///          continues with the next line.
    bool next(MessageRecord& out, std::error_code& ec) override;

    /// @brief Close an owned descriptor and notify the stop handler once
    void stop() override;

    /// @brief Handler invoked by stop()
    void setStopHandler(std::function<void()> handler) { onStop_ = std::move(handler); }

    bool stopped() const noexcept { return stopped_; }

    /// @brief 1-based number of the line last read (the header is line 1)
    size_t lineNumber() const noexcept { return lineNumber_; }

    /// @brief Text of the line last read, without terminator
    const std::string& lastLine() const noexcept { return line_; }

    /// @brief Parse one content line
    /// @param line Line without terminator
    /// @param[out] out Filled on success
    /// @param[out] ec RecordErrc on failure
    static bool parseRecord(const std::string& line, MessageRecord& out, std::error_code& ec);

  private:
    detail::UniqueFd fd_;
    detail::LineReader lines_;
    std::function<void()> onStop_;
    std::string line_;
    size_t lineNumber_ = 0;
    bool headerSkipped_ = false;
    bool stopped_ = false;
};

} // namespace CanLog
