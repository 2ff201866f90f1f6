/// @file CsvReader.cpp
/// @brief CSV log reader

#include <canlog/io/CsvReader.hpp>
#include <canlog/record/CsvFormat.hpp>
#include <canlog/record/RecordError.hpp>
#include <canlog/util/base64.hpp>
#include <canlog/util/textFormatUtil.hpp>

#include <cerrno>
#include <fcntl.h>

namespace CanLog {

namespace {

int openReadOnly(const std::string& path, std::error_code& ec) {
    ec.clear();
    int flags = O_RDONLY;
#ifdef O_CLOEXEC
    flags |= O_CLOEXEC;
#endif
    int fd = ::open(path.c_str(), flags);
    if (fd < 0)
        ec = std::error_code(errno, std::generic_category());
    return fd;
}

bool parseFlag(std::string_view field) { return field == format::FLAG_TRUE; }

} // namespace

CsvReader::CsvReader(const std::string& path, std::error_code& ec)
    : fd_(openReadOnly(path, ec)), lines_(fd_.get()) {}

CsvReader::CsvReader(int fd) : fd_(detail::UniqueFd::borrow(fd)), lines_(fd) {}

bool CsvReader::next(MessageRecord& out, std::error_code& ec) {
    ec.clear();
    if (stopped_)
        return false;
    if (!fd_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return false;
    }

    if (!headerSkipped_) {
        // a stream without even a header line is an empty log, not an error
        if (!lines_.readLine(line_, ec)) {
            if (!ec)
                stop();
            return false;
        }
        ++lineNumber_;
        headerSkipped_ = true;
    }

    if (!lines_.readLine(line_, ec)) {
        if (!ec)
            stop();
        return false;
    }
    ++lineNumber_;

    return parseRecord(line_, out, ec);
}

void CsvReader::stop() {
    if (stopped_)
        return;
    stopped_ = true;
    lines_.detach();
    fd_.reset();
    if (onStop_)
        onStop_();
}

bool CsvReader::parseRecord(const std::string& line, MessageRecord& out, std::error_code& ec) {
    ec.clear();

    auto fields = util::splitFields(line, format::DELIMITER);
    if (fields.size() != format::COLUMN_COUNT) {
        ec = RecordErrc::FieldCount;
        return false;
    }

    // parse into a scratch record so a failure leaves `out` untouched
    MessageRecord rec;
    std::error_code fec;

    if (!util::parseDoubleStrict(fields[format::TIMESTAMP], rec.timestamp, fec)) {
        ec = RecordErrc::Timestamp;
        return false;
    }
    if (!util::parseUnsignedStrict(fields[format::ARBITRATION_ID], 16, rec.arbitrationId, fec)) {
        ec = RecordErrc::ArbitrationId;
        return false;
    }

    // anything other than "1" is false, including malformed flag text
    rec.isExtendedId = parseFlag(fields[format::EXTENDED_FLAG]);
    rec.isRemoteFrame = parseFlag(fields[format::REMOTE_FLAG]);
    rec.isErrorFrame = parseFlag(fields[format::ERROR_FLAG]);

    if (!util::parseUnsignedStrict(fields[format::DLC], 10, rec.dlc, fec)) {
        ec = RecordErrc::Dlc;
        return false;
    }
    if (!util::base64Decode(fields[format::DATA], rec.data, fec)) {
        ec = RecordErrc::Data;
        return false;
    }

    out = std::move(rec);
    return true;
}

} // namespace CanLog
