#pragma once

#include "domain/value_objects/Timestamp.hpp"

#include <compare>
#include <cstdint>

namespace obr::domain {

// Total order of raw messages within one symbol.
struct RecordKey {
    Timestamp event_time;
    uint64_t sequence_id;

    bool operator==(const RecordKey&) const = default;
    auto operator<=>(const RecordKey&) const = default;
};

} // namespace obr::domain
