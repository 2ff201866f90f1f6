#pragma once
/// @file MessageRecord.hpp
/// @brief The bus message fields persisted by a CSV log line

#include <cstdint>
#include <utility>
#include <vector>

namespace CanLog {

/// @brief One captured bus message
/// @details Carries exactly the seven fields of a log line, in column order.
///          The timestamp is not required to be non-negative.
struct MessageRecord {
    double timestamp = 0.0;       ///< Seconds
    uint32_t arbitrationId = 0;   ///< Message identifier
    bool isExtendedId = false;    ///< 29-bit identifier
    bool isRemoteFrame = false;   ///< Remote transmission request
    bool isErrorFrame = false;    ///< Error frame
    uint32_t dlc = 0;             ///< Data length code as declared, not checked against data
    std::vector<uint8_t> data;    ///< Payload bytes

    MessageRecord() = default;
    MessageRecord(double ts, uint32_t id, std::vector<uint8_t> payload, bool extended = false)
        : timestamp(ts), arbitrationId(id), isExtendedId(extended),
          dlc(static_cast<uint32_t>(payload.size())), data(std::move(payload)) {}
};

inline bool operator==(const MessageRecord& a, const MessageRecord& b) {
    return a.timestamp == b.timestamp && a.arbitrationId == b.arbitrationId &&
           a.isExtendedId == b.isExtendedId && a.isRemoteFrame == b.isRemoteFrame &&
           a.isErrorFrame == b.isErrorFrame && a.dlc == b.dlc && a.data == b.data;
}

inline bool operator!=(const MessageRecord& a, const MessageRecord& b) { return !(a == b); }

} // namespace CanLog
