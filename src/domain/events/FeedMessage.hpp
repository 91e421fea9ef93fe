#pragma once

#include "domain/value_objects/PriceLevel.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace obr::domain {

// A parsed message as delivered by the feed connection. The payload keeps
// the exact frame text; the other fields are read from it by the parser.
struct FeedMessage {
    std::string channel;
    std::string symbol;
    std::string kind_indicator;                   // "snapshot" or "update"
    std::optional<std::string> embedded_timestamp;
    std::optional<int64_t> checksum;
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
    std::string payload;
};

} // namespace obr::domain
