#include "infrastructure/KrakenMessageParser.hpp"
#include "domain/Errors.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;
using namespace obr::domain;

namespace obr::infrastructure {

namespace {

// Kraken v2 sends prices and quantities as JSON numbers; accept strings too.
double decimal(const json& value, const char* field) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) return std::stod(value.get<std::string>());
    throw MalformedFeedMessage(std::string("'") + field + "' is not a number");
}

std::vector<PriceLevel> parse_levels(const json& entry, const char* side) {
    std::vector<PriceLevel> levels;
    if (!entry.contains(side)) return levels;

    const auto& array = entry[side];
    if (!array.is_array()) {
        throw MalformedFeedMessage(std::string("'") + side + "' is not an array");
    }
    for (const auto& level : array) {
        if (!level.is_object() || !level.contains("price") || !level.contains("qty")) {
            throw MalformedFeedMessage(std::string("Invalid ") + side + " level: " + level.dump());
        }
        levels.emplace_back(Price(decimal(level["price"], "price")),
                            Quantity(decimal(level["qty"], "qty")));
    }
    return levels;
}

} // namespace

std::optional<FeedMessage> KrakenMessageParser::parse(const std::string& frame) const {
    auto doc = json::parse(frame, nullptr, false);
    if (doc.is_discarded()) {
        throw MalformedFeedMessage("Frame is not valid JSON");
    }
    if (!doc.is_object()) {
        throw MalformedFeedMessage("Frame is not a JSON object");
    }

    // Replies to subscribe/unsubscribe/ping
    if (doc.contains("method")) return std::nullopt;

    if (!doc.contains("channel") || !doc["channel"].is_string()) {
        throw MalformedFeedMessage("Frame has no channel");
    }
    auto channel = doc["channel"].get<std::string>();
    if (channel == "heartbeat" || channel == "status") return std::nullopt;

    try {
        FeedMessage message;
        message.channel = channel;
        message.kind_indicator = doc.value("type", "");
        message.payload = frame;

        if (!doc.contains("data") || !doc["data"].is_array() || doc["data"].empty()) {
            throw MalformedFeedMessage("Frame has no data");
        }
        const auto& entry = doc["data"][0];
        if (!entry.is_object()) {
            throw MalformedFeedMessage("Data entry is not an object");
        }

        message.symbol = entry.value("symbol", "");
        if (entry.contains("checksum") && entry["checksum"].is_number_integer()) {
            message.checksum = entry["checksum"].get<int64_t>();
        }
        if (entry.contains("timestamp") && entry["timestamp"].is_string()) {
            message.embedded_timestamp = entry["timestamp"].get<std::string>();
        }
        message.bids = parse_levels(entry, "bids");
        message.asks = parse_levels(entry, "asks");
        return message;
    } catch (const json::exception& e) {
        throw MalformedFeedMessage(e.what());
    } catch (const std::logic_error& e) {
        // invalid_argument/out_of_range from stod and the value objects
        throw MalformedFeedMessage(std::string("Invalid level value: ") + e.what());
    }
}

std::string KrakenMessageParser::subscribe_request(const std::vector<std::string>& symbols,
                                                   int depth) {
    json request = {
        {"method", "subscribe"},
        {"params", {
            {"channel", "book"},
            {"symbol", symbols},
            {"depth", depth},
            {"snapshot", true},
        }},
    };
    return request.dump();
}

} // namespace obr::infrastructure
