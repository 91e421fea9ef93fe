#pragma once

#include "config/Settings.hpp"
#include "repositories/IEventStore.hpp"

#include <arrow/filesystem/api.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace obr::repositories::pq {

/// Event store backed by Parquet files on an Arrow filesystem.
///
/// Layout (relative to the filesystem root):
///   raw/<symbol>/<YYYY-MM-DD>/raw_<HH>_<first_seq>_<last_seq>_<batch>.parquet
///   levels/<symbol>/<YYYY-MM-DD>/levels_<HH>_<batch>.parquet
///
/// Every file holds rows of a single symbol and a single UTC hour, so reads
/// skip whole partitions outside the requested range. Writes are buffered
/// and flushed by size, by age, on flush() and on destruction. Buffered rows
/// are visible to readers before they reach disk. A failed background flush
/// keeps its rows; appends fail only once the backlog is full and still
/// cannot be written.
class ParquetEventStore : public obr::repositories::IEventStore {
public:
    ParquetEventStore(std::shared_ptr<arrow::fs::FileSystem> fs,
                      const obr::config::StorageSettings& settings);

    /// Create a local filesystem rooted at root_dir (creates dir if needed).
    static std::shared_ptr<arrow::fs::FileSystem> make_local_fs(const std::string& root_dir);

    /// Create an S3-compatible filesystem (AWS S3, R2, B2, Wasabi, MinIO).
    /// Requires arrow::fs::EnsureS3Initialized() before use.
    static std::shared_ptr<arrow::fs::FileSystem> make_s3_fs(
        const obr::config::StorageSettings& settings);
    ~ParquetEventStore() override;

    // IEventStore
    AppendAck append(const obr::domain::RawMessageRecord& record) override;
    void upsert_levels(const std::vector<obr::domain::BookLevelRecord>& records) override;
    std::vector<obr::domain::RawMessageRecord> read_raw(
        const std::string& symbol, const ScanRange& range, size_t limit) const override;
    std::vector<obr::domain::BookLevelRecord> read_levels(
        const std::string& symbol, obr::domain::Timestamp from,
        std::optional<obr::domain::Timestamp> until) const override;
    std::vector<std::string> symbols() const override;
    std::optional<obr::domain::Timestamp> latest_event_time(const std::string& symbol) const override;
    uint64_t max_sequence_id() const override;
    StoreStats stats() const override;
    void flush() override;
    void truncate() override;

    // Directory-safe symbol names: "BTC/USD" <-> "BTC%2FUSD"
    static std::string encode_symbol(const std::string& symbol);
    static std::string decode_symbol(const std::string& encoded);

private:
    // A data file and the UTC hour its rows belong to.
    struct PartitionFile {
        std::string path;
        int64_t hour_start_us;
        uint64_t first_seq{0};
        uint64_t last_seq{0};
        std::pair<int64_t, uint64_t> batch{0, 0};   // flush epoch, counter
    };

    void make_room_locked();
    void maybe_flush();
    void flush_locked();
    void flush_raw();
    void flush_levels();
    std::string next_batch_id();

    bool has_parent_locked(const obr::domain::BookLevelRecord& level) const;

    std::vector<PartitionFile> list_partition_files(const std::string& dir) const;
    void write_table(const std::string& path, const std::shared_ptr<arrow::Table>& table);
    std::shared_ptr<arrow::Table> read_table(const std::string& path) const;

    void write_raw_file(const std::string& path,
                        const std::vector<obr::domain::RawMessageRecord>& records);
    void write_levels_file(const std::string& path,
                           const std::vector<obr::domain::BookLevelRecord>& records);
    std::vector<obr::domain::RawMessageRecord> read_raw_file(const std::string& path) const;
    std::vector<obr::domain::BookLevelRecord> read_levels_file(const std::string& path) const;

    static std::string raw_dir(const std::string& symbol);
    static std::string levels_dir(const std::string& symbol);
    static int64_t hour_start(obr::domain::Timestamp t);
    static std::string date_string(int64_t timestamp_us);
    static std::string hour_string(int64_t timestamp_us);

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    obr::config::StorageSettings settings_;
    mutable std::mutex mutex_;

    std::vector<obr::domain::RawMessageRecord> raw_buffer_;
    std::vector<obr::domain::BookLevelRecord> level_buffer_;

    std::chrono::steady_clock::time_point last_flush_time_;
    std::chrono::steady_clock::time_point flush_retry_after_{};
    uint64_t batch_counter_{0};
};

} // namespace obr::repositories::pq
