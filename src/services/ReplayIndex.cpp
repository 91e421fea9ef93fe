#include "services/ReplayIndex.hpp"
#include "repositories/RawCursor.hpp"

using namespace obr::domain;
using obr::repositories::ScanMode;

namespace obr::services {

ReplayIndex::ReplayIndex(const obr::repositories::IEventStore& store,
                         std::chrono::seconds search_horizon,
                         size_t batch_size)
    : store_(store)
    , search_horizon_(search_horizon)
    , batch_size_(batch_size) {
}

std::optional<StartPoint> ReplayIndex::find_start_point(
    const std::string& symbol, Timestamp requested_time) const {
    std::optional<Timestamp> until;
    if (search_horizon_.count() > 0) {
        until = requested_time + search_horizon_;
    } else {
        until = store_.latest_event_time(symbol);
    }
    if (!until || *until < requested_time) return std::nullopt;

    auto cursor = store_.scan_raw(symbol, requested_time, ScanMode::bounded(*until), batch_size_);
    while (auto record = cursor.next()) {
        if (record->message_kind == MessageKind::Snapshot) {
            return StartPoint{symbol, record->event_time, record->sequence_id};
        }
    }
    return std::nullopt;
}

std::optional<StartPoint> ReplayIndex::find_start_point_any(Timestamp requested_time) const {
    std::optional<StartPoint> best;
    for (const auto& symbol : store_.symbols()) {
        auto candidate = find_start_point(symbol, requested_time);
        if (candidate && (!best || candidate->key() < best->key())) {
            best = std::move(candidate);
        }
    }
    return best;
}

} // namespace obr::services
