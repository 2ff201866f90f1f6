#pragma once
/// @file MessageWriter.hpp
/// @brief Message sink interface

#include "../record/MessageRecord.hpp"

#include <system_error>

namespace CanLog {

/// @brief Receives message records one at a time
class MessageWriter {
  public:
    virtual ~MessageWriter() = default;

    /// @brief Persist one record
    /// @param msg Record to write
    /// @param ec Error code set on failure
    /// @return true on success
    virtual bool onMessageReceived(const MessageRecord& msg, std::error_code& ec) = 0;

    /// @brief Release the underlying stream; later writes fail
    virtual void stop() = 0;
};

} // namespace CanLog
