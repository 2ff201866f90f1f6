/// @file RecordError.cpp
/// @brief canlog.record error category

#include <canlog/record/RecordError.hpp>

#include <string>

namespace CanLog {

namespace {

class RecordCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "canlog.record"; }

    std::string message(int ev) const override {
        switch (static_cast<RecordErrc>(ev)) {
        case RecordErrc::FieldCount:
            return "malformed record: wrong number of fields";
        case RecordErrc::Timestamp:
            return "malformed record: invalid timestamp";
        case RecordErrc::ArbitrationId:
            return "malformed record: invalid arbitration id";
        case RecordErrc::Dlc:
            return "malformed record: invalid dlc";
        case RecordErrc::Data:
            return "malformed record: invalid base64 data";
        }
        return "malformed record";
    }

    std::error_condition default_error_condition(int) const noexcept override {
        return std::make_error_condition(std::errc::invalid_argument);
    }
};

} // namespace

const std::error_category& recordCategory() noexcept {
    static const RecordCategory instance;
    return instance;
}

std::error_code make_error_code(RecordErrc e) noexcept {
    return std::error_code(static_cast<int>(e), recordCategory());
}

bool isMalformedRecord(const std::error_code& ec) noexcept {
    return ec.category() == recordCategory();
}

} // namespace CanLog
