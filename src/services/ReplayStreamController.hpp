#pragma once

#include "config/Settings.hpp"
#include "domain/records/StartPoint.hpp"
#include "repositories/IEventStore.hpp"
#include "services/IReplaySink.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace obr::services {

enum class StreamState { Idle, Streaming, Stopped };

enum class PacingMode { None, Realtime };

PacingMode pacing_mode_from_string(const std::string& str);

struct PacingOptions {
    PacingMode mode = PacingMode::None;
    double speed = 1.0;
    std::chrono::milliseconds max_delay{60000};

    static PacingOptions from_settings(const obr::config::ReplaySettings& settings);
};

/// Streams one replay session: the start Snapshot, the Updates after it,
/// and the next Snapshot, then stops. run() blocks the calling thread;
/// cancel() may be called from any other thread.
class ReplayStreamController {
public:
    ReplayStreamController(const obr::repositories::IEventStore& store,
                           obr::domain::StartPoint start,
                           IReplaySink& sink,
                           PacingOptions pacing = {},
                           size_t batch_size = obr::repositories::IEventStore::kDefaultBatchSize);

    ReplayStreamController(const ReplayStreamController&) = delete;
    ReplayStreamController& operator=(const ReplayStreamController&) = delete;

    StopReason run();
    void cancel();

    StreamState state() const noexcept { return state_.load(); }
    StopReason stop_reason() const noexcept { return stop_reason_.load(); }
    uint64_t emitted() const noexcept { return emitted_.load(); }
    const obr::domain::StartPoint& start_point() const noexcept { return start_; }

private:
    StopReason stream(std::string& detail);
    // Sleeps for the scaled gap; false if cancelled meanwhile.
    bool pace(obr::domain::Timestamp previous, obr::domain::Timestamp next);

    const obr::repositories::IEventStore& store_;
    obr::domain::StartPoint start_;
    IReplaySink& sink_;
    PacingOptions pacing_;
    size_t batch_size_;

    std::atomic<StreamState> state_{StreamState::Idle};
    std::atomic<StopReason> stop_reason_{StopReason::None};
    std::atomic<uint64_t> emitted_{0};
    std::atomic<bool> cancelled_{false};

    std::mutex pacing_mutex_;
    std::condition_variable pacing_cv_;
};

} // namespace obr::services
