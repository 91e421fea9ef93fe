#pragma once

#include "config/Settings.hpp"
#include "domain/events/FeedMessage.hpp"
#include "domain/records/RawMessageRecord.hpp"
#include "repositories/IEventStore.hpp"
#include "services/IFeedConnection.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace obr::services {

enum class OverflowPolicy { DropOldest, Block };
enum class EventTimeSource { Embedded, Ingest };

OverflowPolicy overflow_policy_from_string(const std::string& str);
EventTimeSource event_time_source_from_string(const std::string& str);

struct IngestOptions {
    size_t queue_capacity = 10000;
    OverflowPolicy overflow_policy = OverflowPolicy::DropOldest;
    int max_write_attempts = 5;
    std::chrono::milliseconds initial_backoff{50};
    std::chrono::milliseconds max_backoff{2000};
    EventTimeSource event_time_source = EventTimeSource::Embedded;

    static IngestOptions from_settings(const obr::config::IngestSettings& settings);
};

struct IngestStats {
    uint64_t accepted{0};
    uint64_t stored{0};
    uint64_t overflowed{0};
    uint64_t malformed{0};
    uint64_t retries{0};
    uint64_t dropped_transient{0};
    uint64_t dropped_permanent{0};
};

/// Turns feed messages into stored records. ingest() only classifies,
/// stamps and enqueues; a single writer thread does all store I/O, so a
/// slow store never blocks the feed connection.
class IngestPipeline {
public:
    using Clock = std::function<obr::domain::Timestamp()>;

    IngestPipeline(obr::repositories::IEventStore& store,
                   IngestOptions options = {},
                   Clock clock = &obr::domain::Timestamp::now);
    ~IngestPipeline();

    IngestPipeline(const IngestPipeline&) = delete;
    IngestPipeline& operator=(const IngestPipeline&) = delete;

    // Route a feed's callbacks into this pipeline.
    void attach(IFeedConnection& feed);

    void start();
    // Stops accepting, drains the queue, joins the writer and flushes the store.
    void stop();

    void ingest(obr::domain::FeedMessage message);
    void record_malformed(const std::string& reason);

    IngestStats stats() const;
    std::map<std::string, uint64_t> symbol_counts() const;
    size_t queue_depth() const;

private:
    struct Pending {
        obr::domain::RawMessageRecord raw;
        std::vector<obr::domain::PriceLevel> bids;
        std::vector<obr::domain::PriceLevel> asks;
    };

    void writer_loop();
    void write(const Pending& item);
    template <typename Op>
    bool write_with_retry(Op&& op, const char* what, const std::string& symbol);
    obr::domain::Timestamp resolve_event_time(const obr::domain::FeedMessage& message,
                                              obr::domain::Timestamp received,
                                              std::optional<obr::domain::Timestamp> stored_latest);

    obr::repositories::IEventStore& store_;
    IngestOptions options_;
    Clock clock_;

    mutable std::mutex queue_mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<Pending> queue_;
    bool accepting_{true};
    bool stopping_{false};
    uint64_t next_sequence_id_;
    std::map<std::string, obr::domain::Timestamp> last_event_time_;

    std::thread writer_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> stored_{0};
    std::atomic<uint64_t> overflowed_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> dropped_transient_{0};
    std::atomic<uint64_t> dropped_permanent_{0};

    mutable std::mutex counts_mutex_;
    std::map<std::string, uint64_t> symbol_counts_;
};

} // namespace obr::services
