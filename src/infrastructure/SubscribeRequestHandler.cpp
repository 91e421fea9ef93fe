#include "infrastructure/SubscribeRequestHandler.hpp"
#include "domain/Errors.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <vector>

using namespace obr::domain;

namespace obr::infrastructure {

namespace {

SubscribeOutcome rejected(const std::string& message) {
    SubscribeOutcome outcome;
    outcome.action = SubscribeOutcome::Action::Reject;
    outcome.reply = error_frame(message);
    return outcome;
}

} // namespace

SubscribeRequestHandler::SubscribeRequestHandler(const obr::services::ReplaySessionService& service)
    : service_(service) {}

SubscribeOutcome SubscribeRequestHandler::handle(const StreamQuery& query, const std::string& frame,
                                                 obr::services::IReplaySink& sink) const {
    std::optional<std::vector<std::string>> symbols;
    try {
        symbols = parse_subscribe(frame);
    } catch (const std::invalid_argument& e) {
        return rejected(e.what());
    }
    if (!symbols) return SubscribeOutcome{};

    const std::string& symbol = symbols->front();
    const Timestamp time_in = Timestamp::now();

    if (!query.start_date) {
        return rejected("start_date parameter required in query string");
    }
    std::optional<Timestamp> start;
    try {
        start = parse_start_date(*query.start_date);
    } catch (const std::logic_error&) {
        return rejected("Invalid start_date format. Use ISO format (YYYY-MM-DDTHH:MM:SS)");
    }

    SubscribeOutcome outcome;
    try {
        outcome.controller = service_.attach(StartPointRef{symbol, *start, query.sequence}, sink);
    } catch (const StaleReferenceError& e) {
        return rejected(e.what());
    } catch (const StoreError& e) {
        std::cerr << "[ws] Attach failed for " << symbol << ": " << e.what() << "\n";
        return rejected(e.what());
    }

    outcome.action = SubscribeOutcome::Action::Stream;
    outcome.symbol = symbol;
    outcome.reply = subscribe_ack(symbol, time_in, Timestamp::now());
    return outcome;
}

} // namespace obr::infrastructure
