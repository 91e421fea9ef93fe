#pragma once

#include "domain/records/StartPoint.hpp"
#include "repositories/IEventStore.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace obr::services {

class ReplayIndex {
public:
    // A zero horizon searches up to the newest stored record of the symbol.
    explicit ReplayIndex(const obr::repositories::IEventStore& store,
                         std::chrono::seconds search_horizon = std::chrono::seconds{0},
                         size_t batch_size = obr::repositories::IEventStore::kDefaultBatchSize);

    // First Snapshot at or after requested_time, ties broken by lowest
    // sequence id. Updates are never start points.
    std::optional<obr::domain::StartPoint> find_start_point(
        const std::string& symbol, obr::domain::Timestamp requested_time) const;

    // Earliest qualifying Snapshot across all stored symbols.
    std::optional<obr::domain::StartPoint> find_start_point_any(
        obr::domain::Timestamp requested_time) const;

private:
    const obr::repositories::IEventStore& store_;
    std::chrono::seconds search_horizon_;
    size_t batch_size_;
};

} // namespace obr::services
