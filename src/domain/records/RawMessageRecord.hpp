#pragma once

#include "domain/records/RecordKey.hpp"
#include "domain/value_objects/MessageKind.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace obr::domain {

struct RawMessageRecord {
    Timestamp event_time;
    Timestamp received_time;
    std::string channel;
    std::string symbol;
    MessageKind message_kind;
    std::optional<int64_t> checksum;
    std::string payload;      // original frame text, never reshaped
    uint64_t sequence_id;

    RecordKey key() const { return RecordKey{event_time, sequence_id}; }

    bool operator==(const RawMessageRecord&) const = default;
};

} // namespace obr::domain
