#include "repositories/StoreHandle.hpp"
#include "repositories/InMemoryEventStore.hpp"

#ifdef OBR_HAS_PARQUET
#include "repositories/parquet/ParquetEventStore.hpp"
#include <arrow/filesystem/s3fs.h>
#endif

#include <iostream>
#include <stdexcept>

namespace obr::repositories {

struct StoreHandle::S3Runtime {
#ifdef OBR_HAS_PARQUET
    S3Runtime() {
        auto status = arrow::fs::EnsureS3Initialized();
        if (!status.ok()) {
            throw std::runtime_error("S3 initialization failed: " + status.ToString());
        }
    }
    ~S3Runtime() {
        auto status = arrow::fs::EnsureS3Finalized();
        if (!status.ok()) {
            std::cerr << "[store] S3 finalization failed: " << status.ToString() << "\n";
        }
    }
#endif
};

StoreHandle::StoreHandle(StoreHandle&&) noexcept = default;

StoreHandle::~StoreHandle() {
    store_.reset();
    s3_runtime_.reset();
}

StoreHandle StoreHandle::open(const obr::config::StorageSettings& settings) {
    StoreHandle handle;

    if (settings.backend == "s3") {
#ifdef OBR_HAS_PARQUET
        if (settings.s3_bucket.empty()) {
            throw std::runtime_error("S3 backend requires OBR_S3_BUCKET");
        }
        handle.s3_runtime_ = std::make_unique<S3Runtime>();
        handle.store_ = std::make_unique<pq::ParquetEventStore>(
            pq::ParquetEventStore::make_s3_fs(settings), settings);
        std::cout << "[store] Parquet on s3://" << settings.s3_bucket << "/"
                  << settings.s3_prefix << "\n";
#else
        throw std::runtime_error("S3 backend requested but not compiled in. "
                                 "Rebuild with Apache Arrow installed.");
#endif
    } else if (settings.backend == "parquet") {
#ifdef OBR_HAS_PARQUET
        handle.store_ = std::make_unique<pq::ParquetEventStore>(
            pq::ParquetEventStore::make_local_fs(settings.data_directory), settings);
        std::cout << "[store] Parquet in " << settings.data_directory << "\n";
#else
        throw std::runtime_error("Parquet backend requested but not compiled in. "
                                 "Rebuild with Apache Arrow installed.");
#endif
    } else if (settings.backend == "memory") {
        handle.store_ = std::make_unique<InMemoryEventStore>();
        std::cout << "[store] In memory (nothing is persisted)\n";
    } else {
        throw std::runtime_error("Unknown storage backend: " + settings.backend);
    }
    return handle;
}

} // namespace obr::repositories
