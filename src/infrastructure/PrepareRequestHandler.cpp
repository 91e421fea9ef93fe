#include "infrastructure/PrepareRequestHandler.hpp"
#include "domain/Errors.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <stdexcept>

using json = nlohmann::json;
using namespace obr::domain;

namespace obr::infrastructure {

namespace {

HttpReply reply(int status, const json& body) {
    return HttpReply{status, body.dump()};
}

} // namespace

PrepareRequestHandler::PrepareRequestHandler(const obr::services::ReplaySessionService& service)
    : service_(service) {}

Timestamp PrepareRequestHandler::parse_requested_date(const json& value) {
    if (value.is_string()) {
        return Timestamp::from_iso8601(value.get<std::string>());
    }
    if (value.is_number()) {
        return Timestamp::from_epoch_seconds(value.get<double>());
    }
    throw std::invalid_argument("date must be a string or a number");
}

HttpReply PrepareRequestHandler::handle(const std::string& body) const {
    auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return reply(400, {{"error", "Request body must be a JSON object"}});
    }

    if (!doc.contains("date") || doc["date"].is_null()
        || (doc["date"].is_string() && doc["date"].get<std::string>().empty())) {
        return reply(400, {{"error", "date parameter required"}});
    }

    Timestamp requested(0);
    try {
        requested = parse_requested_date(doc["date"]);
    } catch (const std::logic_error& e) {
        return reply(400, {{"error", std::string("Invalid date format: ") + e.what()}});
    }

    std::optional<std::string> symbol;
    if (doc.contains("symbol") && !doc["symbol"].is_null()) {
        if (!doc["symbol"].is_string()) {
            return reply(400, {{"error", "symbol must be a string"}});
        }
        symbol = doc["symbol"].get<std::string>();
    }

    try {
        auto prepared = service_.prepare(requested, symbol);
        if (!prepared) {
            return reply(404, {
                {"error", "No snapshot found after the requested date"},
                {"requested_date", requested.to_iso8601()},
            });
        }

        const auto& start = prepared->start_point;
        std::cout << "[http] Prepared replay for " << start.symbol << " at "
                  << start.event_time.to_iso8601() << " (requested "
                  << requested.to_iso8601() << ")\n";
        return reply(200, {
            {"status", "ready"},
            {"replay_start_timestamp", start.event_time.to_iso8601()},
            {"requested_date", requested.to_iso8601()},
            {"message", "Replay prepared. Connect via WebSocket to start."},
            {"symbol", start.symbol},
            {"replay_start_sequence", start.sequence_id},
        });
    } catch (const StoreError& e) {
        std::cerr << "[http] Prepare failed: " << e.what() << "\n";
        return reply(500, {{"error", e.what()}});
    }
}

} // namespace obr::infrastructure
