#pragma once

#include "domain/value_objects/Timestamp.hpp"
#include "services/IReplaySink.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace obr::infrastructure {

// Query parameters of a streaming URL such as /ws?start_date=...&sequence=...
struct StreamQuery {
    std::optional<std::string> start_date;
    std::optional<uint64_t> sequence;
};

// Percent-decodes the query string of `uri`; '+' decodes to a space.
std::map<std::string, std::string> parse_query_string(const std::string& uri);

StreamQuery parse_stream_query(const std::string& uri);

// Accepts ISO-8601 with a "Z" or numeric offset. Spaces are turned back
// into '+', since form decoding eats the '+' of "+00:00".
obr::domain::Timestamp parse_start_date(std::string value);

// Symbols of a {"method":"subscribe","params":{"symbol":[...]}} frame.
// nullopt when the frame is not a subscribe request.
// Throws std::invalid_argument when it is one but names no symbols.
std::optional<std::vector<std::string>> parse_subscribe(const std::string& frame);

std::string subscribe_ack(const std::string& symbol,
                          obr::domain::Timestamp time_in,
                          obr::domain::Timestamp time_out);

std::string error_frame(const std::string& message);

// How a finished session is reported to its client.
struct SessionEnding {
    std::optional<std::string> error;   // error frame sent before closing
    bool close_connection{false};
};

SessionEnding session_ending(obr::services::StopReason reason, const std::string& detail);

} // namespace obr::infrastructure
