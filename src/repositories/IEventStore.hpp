#pragma once

#include "domain/records/BookLevelRecord.hpp"
#include "domain/records/RawMessageRecord.hpp"
#include "domain/records/RecordKey.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace obr::repositories {

class RawCursor;

// Upper bound of a raw scan. Open-ended scans see records appended while
// they run; bounded scans stop at `until` (inclusive).
struct ScanMode {
    std::optional<domain::Timestamp> until;

    static ScanMode open_ended() { return ScanMode{std::nullopt}; }
    static ScanMode bounded(domain::Timestamp until) { return ScanMode{until}; }
    bool is_bounded() const noexcept { return until.has_value(); }
};

struct ScanRange {
    domain::RecordKey from;                    // inclusive
    std::optional<domain::Timestamp> until;    // inclusive, on event_time
};

struct AppendAck {
    std::string symbol;
    domain::RecordKey key;
};

struct StoreStats {
    uint64_t raw_messages{0};
    uint64_t book_levels{0};
    size_t symbols{0};
    std::optional<domain::Timestamp> first_event_time;
    std::optional<domain::Timestamp> last_event_time;
};

class IEventStore {
public:
    static constexpr size_t kDefaultBatchSize = 500;

    // Raw log (source of truth). Writing an existing (event_time, symbol,
    // sequence_id) replaces the record. Throws TransientStoreError or
    // PermanentStoreError.
    virtual AppendAck append(const domain::RawMessageRecord& record) = 0;

    // Normalized projection. Later writes for the same
    // (event_time, symbol, side, price) replace earlier ones.
    virtual void upsert_levels(const std::vector<domain::BookLevelRecord>& records) = 0;

    // Records of `symbol` with key >= range.from, ordered by key, at most `limit`.
    virtual std::vector<domain::RawMessageRecord> read_raw(
        const std::string& symbol, const ScanRange& range, size_t limit) const = 0;

    virtual std::vector<domain::BookLevelRecord> read_levels(
        const std::string& symbol, domain::Timestamp from,
        std::optional<domain::Timestamp> until) const = 0;

    virtual std::vector<std::string> symbols() const = 0;
    virtual std::optional<domain::Timestamp> latest_event_time(const std::string& symbol) const = 0;
    virtual uint64_t max_sequence_id() const = 0;
    virtual StoreStats stats() const = 0;

    virtual void flush() = 0;

    // Administrative reset: drops both tables.
    virtual void truncate() = 0;

    // Lazy, restartable scan ordered by (event_time, sequence_id).
    RawCursor scan_raw(const std::string& symbol, domain::Timestamp from, ScanMode mode,
                       size_t batch_size = kDefaultBatchSize) const;
    RawCursor scan_raw(const std::string& symbol, domain::RecordKey from, ScanMode mode,
                       size_t batch_size = kDefaultBatchSize) const;

    virtual ~IEventStore() = default;
};

} // namespace obr::repositories
