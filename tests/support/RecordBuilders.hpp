#pragma once

#include "domain/records/BookLevelRecord.hpp"
#include "domain/records/RawMessageRecord.hpp"

#include <cstdint>
#include <string>

namespace obr::testing {

inline domain::RawMessageRecord raw(const std::string& symbol, int64_t event_us, uint64_t seq,
                                    domain::MessageKind kind = domain::MessageKind::Update,
                                    std::string payload = {}) {
    if (payload.empty()) {
        payload = R"({"channel":"book","type":")" + domain::to_string(kind)
                  + R"(","seq":)" + std::to_string(seq) + "}";
    }
    return domain::RawMessageRecord{
        domain::Timestamp(event_us),
        domain::Timestamp(event_us + 10),
        "book",
        symbol,
        kind,
        std::nullopt,
        std::move(payload),
        seq};
}

inline domain::RawMessageRecord snapshot(const std::string& symbol, int64_t event_us, uint64_t seq) {
    return raw(symbol, event_us, seq, domain::MessageKind::Snapshot);
}

inline domain::BookLevelRecord level(const std::string& symbol, int64_t event_us,
                                     domain::Side side, double price, double quantity,
                                     domain::MessageKind kind = domain::MessageKind::Update) {
    return domain::BookLevelRecord{
        domain::Timestamp(event_us),
        symbol,
        side,
        domain::Price(price),
        domain::Quantity(quantity),
        kind,
        std::nullopt};
}

} // namespace obr::testing
