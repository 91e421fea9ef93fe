#pragma once

#include "config/Settings.hpp"
#include "repositories/IEventStore.hpp"

#include <memory>

namespace obr::repositories {

/// Owns the process-scoped event store selected by StorageSettings::backend
/// ("memory", "parquet" or "s3"), plus the S3 runtime when one is needed.
/// The store is flushed and destroyed before the S3 runtime is finalized.
class StoreHandle {
public:
    // Throws std::runtime_error for unknown or unavailable backends.
    static StoreHandle open(const obr::config::StorageSettings& settings);

    StoreHandle(StoreHandle&&) noexcept;
    ~StoreHandle();

    IEventStore& store() { return *store_; }

private:
    struct S3Runtime;

    StoreHandle() = default;

    std::unique_ptr<S3Runtime> s3_runtime_;
    std::unique_ptr<IEventStore> store_;
};

} // namespace obr::repositories
