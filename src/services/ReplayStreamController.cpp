#include "services/ReplayStreamController.hpp"
#include "domain/Errors.hpp"
#include "repositories/RawCursor.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

using namespace obr::domain;
using obr::repositories::ScanMode;

namespace obr::services {

PacingMode pacing_mode_from_string(const std::string& str) {
    if (str == "none") return PacingMode::None;
    if (str == "realtime") return PacingMode::Realtime;
    throw std::invalid_argument("Invalid pacing mode: " + str);
}

PacingOptions PacingOptions::from_settings(const obr::config::ReplaySettings& settings) {
    if (settings.pacing_speed <= 0.0) {
        throw std::invalid_argument("Pacing speed must be positive");
    }
    PacingOptions options;
    options.mode = pacing_mode_from_string(settings.pacing);
    options.speed = settings.pacing_speed;
    options.max_delay = std::chrono::seconds(settings.max_pacing_delay_seconds);
    return options;
}

ReplayStreamController::ReplayStreamController(const obr::repositories::IEventStore& store,
                                               StartPoint start,
                                               IReplaySink& sink,
                                               PacingOptions pacing,
                                               size_t batch_size)
    : store_(store)
    , start_(std::move(start))
    , sink_(sink)
    , pacing_(pacing)
    , batch_size_(batch_size) {
}

StopReason ReplayStreamController::run() {
    StreamState expected = StreamState::Idle;
    if (!state_.compare_exchange_strong(expected, StreamState::Streaming)) {
        throw std::logic_error("Replay session already ran");
    }

    std::string detail;
    StopReason reason;
    try {
        reason = stream(detail);
    } catch (const obr::domain::StoreError& e) {
        reason = StopReason::StoreError;
        detail = e.what();
        std::cerr << "[replay] " << start_.symbol << " store failure after "
                  << emitted_.load() << " records: " << e.what() << "\n";
    }

    stop_reason_ = reason;
    state_ = StreamState::Stopped;
    sink_.close(reason, detail);
    return reason;
}

StopReason ReplayStreamController::stream(std::string& detail) {
    // The cursor lives only for the duration of this call.
    auto cursor = store_.scan_raw(start_.symbol, start_.key(), ScanMode::open_ended(), batch_size_);

    std::optional<Timestamp> previous;
    for (;;) {
        if (cancelled_) return StopReason::Cancelled;

        auto record = cursor.next();
        const bool is_first = !previous.has_value();
        if (is_first && (!record || record->key() != start_.key()
                         || record->message_kind != MessageKind::Snapshot)) {
            detail = "Snapshot for " + start_.symbol + " at "
                + start_.event_time.to_iso8601() + " is no longer stored";
            return StopReason::StaleReference;
        }
        if (!record) return StopReason::Exhausted;

        if (!is_first && pacing_.mode == PacingMode::Realtime && !pace(*previous, record->event_time)) {
            return StopReason::Cancelled;
        }

        if (!sink_.send(record->payload)) return StopReason::SinkClosed;
        ++emitted_;
        previous = record->event_time;

        if (!is_first && record->message_kind == MessageKind::Snapshot) {
            return StopReason::SnapshotBoundary;
        }
    }
}

bool ReplayStreamController::pace(Timestamp previous, Timestamp next) {
    auto gap = next - previous;
    if (gap.count() <= 0) return !cancelled_;

    auto scaled = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::duration<double, std::micro>(static_cast<double>(gap.count()) / pacing_.speed));
    auto delay = std::min<std::chrono::microseconds>(scaled, pacing_.max_delay);

    std::unique_lock lock(pacing_mutex_);
    return !pacing_cv_.wait_for(lock, delay, [this] { return cancelled_.load(); });
}

void ReplayStreamController::cancel() {
    {
        std::lock_guard lock(pacing_mutex_);
        cancelled_ = true;
    }
    pacing_cv_.notify_all();
}

} // namespace obr::services
