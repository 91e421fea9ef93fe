#pragma once

#include "config/Settings.hpp"
#include "domain/records/StartPoint.hpp"
#include "repositories/IEventStore.hpp"
#include "services/IReplaySink.hpp"
#include "services/ReplayIndex.hpp"
#include "services/ReplayStreamController.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace obr::services {

struct ReplayOptions {
    std::chrono::seconds search_horizon{0};
    size_t batch_size = obr::repositories::IEventStore::kDefaultBatchSize;
    PacingOptions pacing;

    static ReplayOptions from_settings(const obr::config::ReplaySettings& settings);
};

struct PreparedReplay {
    obr::domain::StartPoint start_point;
    obr::domain::Timestamp requested_time;
};

/// Entry point for replay clients. Holds no per-session state: prepare()
/// is a pure lookup, and each attach() returns an independent controller.
class ReplaySessionService {
public:
    ReplaySessionService(const obr::repositories::IEventStore& store, ReplayOptions options = {});

    // Without a symbol the earliest start point across symbols is returned.
    std::optional<PreparedReplay> prepare(obr::domain::Timestamp requested_time,
                                          const std::optional<std::string>& symbol = std::nullopt) const;

    // Throws StaleReferenceError unless ref names a stored Snapshot.
    std::unique_ptr<ReplayStreamController> attach(const obr::domain::StartPointRef& ref,
                                                   IReplaySink& sink) const;

private:
    const obr::repositories::IEventStore& store_;
    ReplayOptions options_;
    ReplayIndex index_;
};

} // namespace obr::services
