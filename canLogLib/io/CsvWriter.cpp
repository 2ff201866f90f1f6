/// @file CsvWriter.cpp
/// @brief CSV log writer

#include <canlog/io/CsvWriter.hpp>
#include <canlog/record/CsvFormat.hpp>
#include <canlog/util/base64.hpp>
#include <canlog/util/textFormatUtil.hpp>

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace CanLog {

namespace fs = std::filesystem;

CsvWriter::CsvWriter(const std::string& path, bool append, std::error_code& ec) {
    ec.clear();

    fs::path p(path);
    fs::path dir = p.parent_path();
    if (!dir.empty()) {
        std::error_code fec;
        if (!fs::exists(dir, fec)) {
            fs::create_directories(dir, fec);
            if (fec) {
                ec = fec;
                return;
            }
        }
    }

    int flags = O_WRONLY | O_CREAT | (append ? O_APPEND : O_TRUNC);
#ifdef O_CLOEXEC
    flags |= O_CLOEXEC;
#endif
    fd_.reset(::open(path.c_str(), flags, 0644));
    if (!fd_) {
        ec = std::error_code(errno, std::generic_category());
        return;
    }

    // a writer that could not emit its header is unusable
    if (!append && !writeHeader(ec))
        fd_.reset();
}

CsvWriter::CsvWriter(int fd, bool append, std::error_code& ec)
    : fd_(detail::UniqueFd::borrow(fd)) {
    ec.clear();
    if (!fd_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return;
    }
    if (!append && !writeHeader(ec))
        fd_.reset();
}

bool CsvWriter::onMessageReceived(const MessageRecord& msg, std::error_code& ec) {
    ec.clear();
    return writeAll(formatRecord(msg), ec);
}

bool CsvWriter::sync(std::error_code& ec) {
    ec.clear();
    if (::fsync(fd_.get()) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    return true;
}

std::string CsvWriter::formatRecord(const MessageRecord& msg) {
    // column order follows format::COLUMNS
    std::string line;
    line += util::formatDouble(msg.timestamp);
    line += format::DELIMITER;
    line += util::formatHex(msg.arbitrationId);
    line += format::DELIMITER;
    line += msg.isExtendedId ? format::FLAG_TRUE : format::FLAG_FALSE;
    line += format::DELIMITER;
    line += msg.isRemoteFrame ? format::FLAG_TRUE : format::FLAG_FALSE;
    line += format::DELIMITER;
    line += msg.isErrorFrame ? format::FLAG_TRUE : format::FLAG_FALSE;
    line += format::DELIMITER;
    line += std::to_string(msg.dlc);
    line += format::DELIMITER;
    line += util::base64Encode(msg.data);
    line += format::LINE_TERMINATOR;
    return line;
}

bool CsvWriter::writeHeader(std::error_code& ec) {
    return writeAll(format::headerLine() + format::LINE_TERMINATOR, ec);
}

bool CsvWriter::writeAll(const std::string& text, std::error_code& ec) {
    if (!fd_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return false;
    }

    const char* p = text.data();
    size_t left = text.size();
    while (left > 0) {
        ssize_t n = ::write(fd_.get(), p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace CanLog
