#pragma once

#include "domain/Errors.hpp"
#include "repositories/IEventStore.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <tuple>

namespace obr::repositories {

class InMemoryEventStore : public IEventStore {
public:
    AppendAck append(const domain::RawMessageRecord& record) override {
        if (record.symbol.empty()) {
            throw domain::PermanentStoreError("Raw message has no symbol");
        }
        if (record.payload.empty()) {
            throw domain::PermanentStoreError("Raw message has an empty payload");
        }
        std::unique_lock lock(mutex_);
        partitions_[record.symbol].raw.insert_or_assign(record.key(), record);
        max_sequence_id_ = std::max(max_sequence_id_, record.sequence_id);
        return AppendAck{record.symbol, record.key()};
    }

    void upsert_levels(const std::vector<domain::BookLevelRecord>& records) override {
        std::unique_lock lock(mutex_);
        // Validate the whole batch first so a rejected batch leaves no rows behind.
        for (const auto& level : records) {
            if (!has_parent(level)) {
                throw domain::PermanentStoreError(
                    "Book level for " + level.symbol + " at " + level.event_time.to_iso8601()
                    + " has no matching raw message");
            }
        }
        for (const auto& level : records) {
            partitions_[level.symbol].levels.insert_or_assign(
                LevelKey{level.event_time, level.side, level.price}, level);
        }
    }

    std::vector<domain::RawMessageRecord> read_raw(
        const std::string& symbol, const ScanRange& range, size_t limit) const override {
        std::shared_lock lock(mutex_);
        std::vector<domain::RawMessageRecord> result;
        auto pit = partitions_.find(symbol);
        if (pit == partitions_.end()) return result;

        const auto& raw = pit->second.raw;
        for (auto it = raw.lower_bound(range.from); it != raw.end() && result.size() < limit; ++it) {
            if (range.until && it->first.event_time > *range.until) break;
            result.push_back(it->second);
        }
        return result;
    }

    std::vector<domain::BookLevelRecord> read_levels(
        const std::string& symbol, domain::Timestamp from,
        std::optional<domain::Timestamp> until) const override {
        std::shared_lock lock(mutex_);
        std::vector<domain::BookLevelRecord> result;
        auto pit = partitions_.find(symbol);
        if (pit == partitions_.end()) return result;

        for (const auto& [key, level] : pit->second.levels) {
            if (level.event_time < from) continue;
            if (until && level.event_time > *until) break;
            result.push_back(level);
        }
        return result;
    }

    std::vector<std::string> symbols() const override {
        std::shared_lock lock(mutex_);
        std::vector<std::string> result;
        for (const auto& [symbol, partition] : partitions_) {
            if (!partition.raw.empty()) result.push_back(symbol);
        }
        return result;
    }

    std::optional<domain::Timestamp> latest_event_time(const std::string& symbol) const override {
        std::shared_lock lock(mutex_);
        auto pit = partitions_.find(symbol);
        if (pit == partitions_.end() || pit->second.raw.empty()) return std::nullopt;
        return pit->second.raw.rbegin()->first.event_time;
    }

    uint64_t max_sequence_id() const override {
        std::shared_lock lock(mutex_);
        return max_sequence_id_;
    }

    StoreStats stats() const override {
        std::shared_lock lock(mutex_);
        StoreStats s;
        for (const auto& [symbol, partition] : partitions_) {
            if (partition.raw.empty()) continue;
            ++s.symbols;
            s.raw_messages += partition.raw.size();
            s.book_levels += partition.levels.size();
            auto first = partition.raw.begin()->first.event_time;
            auto last = partition.raw.rbegin()->first.event_time;
            if (!s.first_event_time || first < *s.first_event_time) s.first_event_time = first;
            if (!s.last_event_time || last > *s.last_event_time) s.last_event_time = last;
        }
        return s;
    }

    void flush() override {}

    void truncate() override {
        std::unique_lock lock(mutex_);
        partitions_.clear();
    }

    // Test helpers
    size_t raw_count() const { return stats().raw_messages; }
    size_t level_count() const { return stats().book_levels; }

private:
    using LevelKey = std::tuple<domain::Timestamp, domain::Side, domain::Price>;

    struct Partition {
        std::map<domain::RecordKey, domain::RawMessageRecord> raw;
        std::map<LevelKey, domain::BookLevelRecord> levels;
    };

    bool has_parent(const domain::BookLevelRecord& level) const {
        auto pit = partitions_.find(level.symbol);
        if (pit == partitions_.end()) return false;
        const auto& raw = pit->second.raw;
        for (auto it = raw.lower_bound(domain::RecordKey{level.event_time, 0});
             it != raw.end() && it->first.event_time == level.event_time; ++it) {
            if (it->second.message_kind == level.message_kind) return true;
        }
        return false;
    }

    mutable std::shared_mutex mutex_;
    std::map<std::string, Partition> partitions_;
    uint64_t max_sequence_id_{0};
};

} // namespace obr::repositories
