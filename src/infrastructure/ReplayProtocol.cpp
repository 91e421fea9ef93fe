#include "infrastructure/ReplayProtocol.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;
using namespace obr::domain;

namespace obr::infrastructure {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '+') {
            out += ' ';
        } else if (str[i] == '%' && i + 2 < str.size()
                   && hex_value(str[i + 1]) >= 0 && hex_value(str[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(str[i + 1]) * 16 + hex_value(str[i + 2]));
            i += 2;
        } else {
            out += str[i];
        }
    }
    return out;
}

} // namespace

std::map<std::string, std::string> parse_query_string(const std::string& uri) {
    std::map<std::string, std::string> params;
    auto question = uri.find('?');
    if (question == std::string::npos) return params;

    size_t pos = question + 1;
    while (pos <= uri.size()) {
        auto amp = uri.find('&', pos);
        if (amp == std::string::npos) amp = uri.size();
        std::string pair = uri.substr(pos, amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                params[url_decode(pair)] = "";
            } else {
                params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        pos = amp + 1;
    }
    return params;
}

StreamQuery parse_stream_query(const std::string& uri) {
    auto params = parse_query_string(uri);
    StreamQuery query;
    if (auto it = params.find("start_date"); it != params.end() && !it->second.empty()) {
        query.start_date = it->second;
    }
    if (auto it = params.find("sequence"); it != params.end() && !it->second.empty()) {
        try {
            query.sequence = std::stoull(it->second);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Invalid sequence: " + it->second);
        }
    }
    return query;
}

Timestamp parse_start_date(std::string value) {
    std::replace(value.begin(), value.end(), ' ', '+');
    return Timestamp::from_iso8601(value);
}

std::optional<std::vector<std::string>> parse_subscribe(const std::string& frame) {
    auto doc = json::parse(frame, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;
    auto method = doc.find("method");
    if (method == doc.end() || !method->is_string() || *method != "subscribe") {
        return std::nullopt;
    }

    if (!doc.contains("params") || !doc["params"].is_object()) {
        throw std::invalid_argument("Invalid subscription format");
    }
    const auto& params = doc["params"];

    std::vector<std::string> symbols;
    if (params.contains("symbol")) {
        const auto& symbol = params["symbol"];
        if (symbol.is_string()) {
            symbols.push_back(symbol.get<std::string>());
        } else if (symbol.is_array()) {
            for (const auto& s : symbol) {
                if (!s.is_string()) throw std::invalid_argument("Invalid subscription format");
                symbols.push_back(s.get<std::string>());
            }
        } else {
            throw std::invalid_argument("Invalid subscription format");
        }
    }
    if (symbols.empty()) {
        throw std::invalid_argument("No symbols in subscription");
    }
    return symbols;
}

std::string subscribe_ack(const std::string& symbol, Timestamp time_in, Timestamp time_out) {
    json ack = {
        {"method", "subscribe"},
        {"result", {
            {"channel", "book"},
            {"snapshot", true},
            {"symbol", symbol},
        }},
        {"success", true},
        {"time_in", time_in.to_iso8601()},
        {"time_out", time_out.to_iso8601()},
    };
    return ack.dump();
}

std::string error_frame(const std::string& message) {
    return json{{"error", message}}.dump();
}

SessionEnding session_ending(obr::services::StopReason reason, const std::string& detail) {
    using obr::services::StopReason;
    switch (reason) {
        case StopReason::StoreError:
        case StopReason::StaleReference:
            return SessionEnding{error_frame(detail), true};
        case StopReason::SnapshotBoundary:
        case StopReason::Exhausted:
            return SessionEnding{std::nullopt, true};
        default:
            // Client already gone or server shutting down.
            return SessionEnding{};
    }
}

} // namespace obr::infrastructure
