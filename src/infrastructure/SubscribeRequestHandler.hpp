#pragma once

#include "infrastructure/ReplayProtocol.hpp"
#include "services/IReplaySink.hpp"
#include "services/ReplaySessionService.hpp"

#include <memory>
#include <string>

namespace obr::infrastructure {

struct SubscribeOutcome {
    enum class Action {
        Ignore,   // not a subscribe frame
        Reject,   // send `reply` as an error, then close
        Stream,   // send `reply` as the acknowledgement, then run `controller`
    };

    Action action{Action::Ignore};
    std::string reply;
    std::string symbol;
    std::unique_ptr<obr::services::ReplayStreamController> controller;
};

// Subscribe frames on /ws, independent of the WebSocket transport.
class SubscribeRequestHandler {
public:
    explicit SubscribeRequestHandler(const obr::services::ReplaySessionService& service);

    // `sink` must outlive the returned controller. Only the first symbol
    // of the subscription is replayed.
    SubscribeOutcome handle(const StreamQuery& query, const std::string& frame,
                            obr::services::IReplaySink& sink) const;

private:
    const obr::services::ReplaySessionService& service_;
};

} // namespace obr::infrastructure
