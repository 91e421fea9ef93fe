#include "services/ReplaySessionService.hpp"
#include "domain/Errors.hpp"
#include "repositories/RawCursor.hpp"

#include <stdexcept>

using namespace obr::domain;
using obr::repositories::ScanMode;

namespace obr::services {

ReplayOptions ReplayOptions::from_settings(const obr::config::ReplaySettings& settings) {
    if (settings.scan_batch_size <= 0) {
        throw std::invalid_argument("Scan batch size must be positive");
    }
    ReplayOptions options;
    options.search_horizon = std::chrono::seconds(settings.search_horizon_seconds);
    options.batch_size = static_cast<size_t>(settings.scan_batch_size);
    options.pacing = PacingOptions::from_settings(settings);
    return options;
}

ReplaySessionService::ReplaySessionService(const obr::repositories::IEventStore& store,
                                           ReplayOptions options)
    : store_(store)
    , options_(options)
    , index_(store, options.search_horizon, options.batch_size) {
}

std::optional<PreparedReplay> ReplaySessionService::prepare(
    Timestamp requested_time, const std::optional<std::string>& symbol) const {
    auto start = symbol ? index_.find_start_point(*symbol, requested_time)
                        : index_.find_start_point_any(requested_time);
    if (!start) return std::nullopt;
    return PreparedReplay{std::move(*start), requested_time};
}

std::unique_ptr<ReplayStreamController> ReplaySessionService::attach(
    const StartPointRef& ref, IReplaySink& sink) const {
    RecordKey from{ref.event_time, ref.sequence_id.value_or(0)};
    auto cursor = store_.scan_raw(ref.symbol, from, ScanMode::bounded(ref.event_time),
                                  options_.batch_size);

    while (auto record = cursor.next()) {
        if (ref.sequence_id && record->sequence_id != *ref.sequence_id) break;
        if (record->message_kind != MessageKind::Snapshot) {
            if (ref.sequence_id) break;
            continue;
        }
        return std::make_unique<ReplayStreamController>(
            store_, StartPoint{ref.symbol, record->event_time, record->sequence_id},
            sink, options_.pacing, options_.batch_size);
    }

    std::string message = "No snapshot for " + ref.symbol + " at " + ref.event_time.to_iso8601();
    if (ref.sequence_id) message += " with sequence " + std::to_string(*ref.sequence_id);
    throw StaleReferenceError(message);
}

} // namespace obr::services
