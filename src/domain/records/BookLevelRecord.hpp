#pragma once

#include "domain/value_objects/MessageKind.hpp"
#include "domain/value_objects/Price.hpp"
#include "domain/value_objects/Quantity.hpp"
#include "domain/value_objects/Side.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace obr::domain {

// One price level of one raw message. Unique by (event_time, symbol, side, price).
struct BookLevelRecord {
    Timestamp event_time;
    std::string symbol;
    Side side;
    Price price;
    Quantity quantity;
    MessageKind message_kind;
    std::optional<int64_t> checksum;

    auto identity() const { return std::tie(event_time, symbol, side, price); }

    bool operator==(const BookLevelRecord&) const = default;
};

} // namespace obr::domain
