#pragma once
/// @file LineReader.hpp
/// @brief Line-wise reading from a POSIX file descriptor (internal implementation)

#include <cstddef>
#include <string>
#include <system_error>

namespace CanLog {
namespace detail {

/// @brief Splits the bytes of a descriptor into lines
///
/// Accepts "\n", "\r\n" and a lone "\r" as terminators, including a "\r\n"
/// pair split across two reads. A final line without terminator is returned
/// as a normal line. The descriptor is not owned.
///
/// @note This class is for internal library use.
class LineReader {
  public:
    explicit LineReader(int fd) noexcept : fd_(fd) {}

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /// @brief Read the next line without its terminator
    /// @param[out] line Line content
    /// @param[out] ec errno of a failed read
    /// @return true if a line was produced; false on end of data or error
    bool readLine(std::string& line, std::error_code& ec);

    /// @brief Forget the descriptor; subsequent reads report end of data
    void detach() noexcept {
        fd_ = -1;
        eof_ = true;
        pos_ = len_ = 0;
    }

  private:
    /// @brief Refill buf_ from the descriptor. Sets eof_ at end of data.
    bool fill(std::error_code& ec);

    int fd_ = -1;
    char buf_[4096];
    size_t pos_ = 0;
    size_t len_ = 0;
    bool eof_ = false;
    bool skipLf_ = false; ///< Previous line ended with '\r'; swallow one '\n'
};

} // namespace detail
} // namespace CanLog
