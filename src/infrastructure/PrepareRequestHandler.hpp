#pragma once

#include "domain/value_objects/Timestamp.hpp"
#include "services/ReplaySessionService.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace obr::infrastructure {

struct HttpReply {
    int status;
    std::string body;   // JSON
};

// POST /replay/prepare, independent of the HTTP transport.
class PrepareRequestHandler {
public:
    explicit PrepareRequestHandler(const obr::services::ReplaySessionService& service);

    HttpReply handle(const std::string& body) const;

    // "YYYY-MM-DD", ISO-8601 date-time, or epoch seconds as a JSON number.
    // Throws std::invalid_argument.
    static obr::domain::Timestamp parse_requested_date(const nlohmann::json& value);

private:
    const obr::services::ReplaySessionService& service_;
};

} // namespace obr::infrastructure
