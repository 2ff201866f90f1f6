/// @file LineReader.cpp
/// @brief Descriptor line splitting

#include <canlog/util/LineReader.hpp>

#include <cerrno>
#include <unistd.h>

namespace CanLog {
namespace detail {

bool LineReader::fill(std::error_code& ec) {
    pos_ = 0;
    len_ = 0;
    if (eof_ || fd_ < 0) {
        eof_ = true;
        return false;
    }

    ssize_t n;
    do {
        n = ::read(fd_, buf_, sizeof(buf_));
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    if (n == 0) {
        eof_ = true;
        return false;
    }
    len_ = static_cast<size_t>(n);
    return true;
}

bool LineReader::readLine(std::string& line, std::error_code& ec) {
    ec.clear();
    line.clear();
    bool any = false;

    while (true) {
        if (pos_ >= len_) {
            if (!fill(ec)) {
                if (ec)
                    return false;
                // unterminated last line
                return any;
            }
        }

        if (skipLf_) {
            skipLf_ = false;
            if (buf_[pos_] == '\n') {
                ++pos_;
                continue;
            }
        }

        // copy up to the next terminator in one step
        size_t start = pos_;
        while (pos_ < len_ && buf_[pos_] != '\n' && buf_[pos_] != '\r')
            ++pos_;
        line.append(buf_ + start, pos_ - start);
        if (pos_ > start)
            any = true;

        if (pos_ < len_) {
            skipLf_ = (buf_[pos_] == '\r');
            ++pos_;
            return true;
        }
    }
}

} // namespace detail
} // namespace CanLog
