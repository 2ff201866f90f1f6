#pragma once
/// @file MessageReader.hpp
/// @brief Lazy message source interface

#include "../record/MessageRecord.hpp"

#include <system_error>
#include <vector>

namespace CanLog {

/// @brief Forward-only, non-restartable source of message records
class MessageReader {
  public:
    virtual ~MessageReader() = default;

    /// @brief Produce the next record
    /// @param[out] out Filled when true is returned
    /// @param[out] ec Set on failure, clear at end of data
    /// @return true if a record was produced
    virtual bool next(MessageRecord& out, std::error_code& ec) = 0;

    /// @brief Terminal notification: no further records will be produced
    virtual void stop() = 0;

    /// @brief Drain the remaining records
    /// @param ec Error code of the first failure; records read so far are returned
    /// @return Records in file order
    std::vector<MessageRecord> readAll(std::error_code& ec) {
        std::vector<MessageRecord> result;
        MessageRecord rec;
        while (next(rec, ec))
            result.push_back(rec);
        return result;
    }
};

} // namespace CanLog
