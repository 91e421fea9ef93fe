#pragma once

#include "domain/records/RecordKey.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace obr::domain {

// A resolved Snapshot record at which a replay may begin.
struct StartPoint {
    std::string symbol;
    Timestamp event_time;
    uint64_t sequence_id;

    RecordKey key() const { return RecordKey{event_time, sequence_id}; }

    bool operator==(const StartPoint&) const = default;
};

// What a client hands back when attaching. The sequence id is optional
// because the streaming URL historically only carried the timestamp.
struct StartPointRef {
    std::string symbol;
    Timestamp event_time;
    std::optional<uint64_t> sequence_id;
};

} // namespace obr::domain
