#pragma once

#include "domain/events/FeedMessage.hpp"

#include <optional>
#include <string>
#include <vector>

namespace obr::infrastructure {

class KrakenMessageParser {
public:
    // Parse one Kraken v2 WebSocket frame.
    // Returns nullopt for control frames (heartbeat, status, method replies).
    // Throws MalformedFeedMessage for anything else that cannot be read.
    // Only the first element of "data" is used; the payload is the frame as received.
    std::optional<obr::domain::FeedMessage> parse(const std::string& frame) const;

    // {"method":"subscribe","params":{"channel":"book","symbol":[...],"depth":N,"snapshot":true}}
    static std::string subscribe_request(const std::vector<std::string>& symbols, int depth);
};

} // namespace obr::infrastructure
