#pragma once
/// @file CsvWriter.hpp
/// @brief Writer for CSV message logs

#include "../record/MessageRecord.hpp"
#include "../util/UniqueFd.hpp"

#include "MessageWriter.hpp"

#include <string>
#include <system_error>

namespace CanLog {

/// @brief Writes one comma separated line per message
/// @details Columns, in order:
///
/// | column         | format                 | example        |
/// |----------------|------------------------|----------------|
/// | timestamp      | decimal float          | 1483389946.197 |
/// | arbitration_id | hex                    | 0xdadada       |
/// | extended       | 1 == true, 0 == false  | 1              |
/// | remote         | 1 == true, 0 == false  | 0              |
/// | error          | 1 == true, 0 == false  | 0              |
/// | dlc            | int                    | 6              |
/// | data           | base64 encoded         | WzQyLCA5XQ==   |
///
/// Each line is written with a single pass of write(2) calls; nothing is
/// buffered between calls.
class CsvWriter : public MessageWriter {
  public:
    /// @brief Open a file for writing; the descriptor is owned by the writer
    /// @param path File path. Missing parent directories are created.
    /// @param append true: append without header. false: truncate and write the header.
    /// @param ec Error code set on failure
    CsvWriter(const std::string& path, bool append, std::error_code& ec);

    /// @brief Write to an open descriptor; it is never closed by the writer
    /// @param fd Descriptor opened for writing
    /// @param append true: no header. false: the header is written first.
    /// @param ec Error code set if the header cannot be written
    CsvWriter(int fd, bool append, std::error_code& ec);

    ~CsvWriter() override = default;

    CsvWriter(const CsvWriter&) = delete;
    CsvWriter& operator=(const CsvWriter&) = delete;

    bool onMessageReceived(const MessageRecord& msg, std::error_code& ec) override;

    /// @brief Flush written lines to stable storage (fsync)
    bool sync(std::error_code& ec);

    /// @brief Close an owned descriptor; later writes fail with bad_file_descriptor
    void stop() override { fd_.reset(); }

    /// @brief Format one record as a line, terminator included
    static std::string formatRecord(const MessageRecord& msg);

  private:
    bool writeHeader(std::error_code& ec);
    bool writeAll(const std::string& text, std::error_code& ec);

    detail::UniqueFd fd_;
};

} // namespace CanLog
