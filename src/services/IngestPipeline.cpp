#include "services/IngestPipeline.hpp"
#include "domain/Errors.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>

using namespace obr::domain;

namespace obr::services {

OverflowPolicy overflow_policy_from_string(const std::string& str) {
    if (str == "drop_oldest") return OverflowPolicy::DropOldest;
    if (str == "block") return OverflowPolicy::Block;
    throw std::invalid_argument("Invalid overflow policy: " + str);
}

EventTimeSource event_time_source_from_string(const std::string& str) {
    if (str == "embedded") return EventTimeSource::Embedded;
    if (str == "ingest") return EventTimeSource::Ingest;
    throw std::invalid_argument("Invalid event time source: " + str);
}

IngestOptions IngestOptions::from_settings(const obr::config::IngestSettings& settings) {
    if (settings.queue_capacity <= 0) {
        throw std::invalid_argument("Queue capacity must be positive");
    }
    if (settings.max_write_attempts <= 0) {
        throw std::invalid_argument("Max write attempts must be positive");
    }
    IngestOptions options;
    options.queue_capacity = static_cast<size_t>(settings.queue_capacity);
    options.overflow_policy = overflow_policy_from_string(settings.overflow_policy);
    options.max_write_attempts = settings.max_write_attempts;
    options.initial_backoff = std::chrono::milliseconds(settings.initial_backoff_ms);
    options.max_backoff = std::chrono::milliseconds(settings.max_backoff_ms);
    options.event_time_source = event_time_source_from_string(settings.event_time_source);
    return options;
}

IngestPipeline::IngestPipeline(obr::repositories::IEventStore& store,
                               IngestOptions options,
                               Clock clock)
    : store_(store)
    , options_(options)
    , clock_(std::move(clock))
    , next_sequence_id_(store.max_sequence_id() + 1) {
}

IngestPipeline::~IngestPipeline() {
    stop();
}

void IngestPipeline::attach(IFeedConnection& feed) {
    feed.set_on_message([this](const FeedMessage& message) {
        ingest(message);
    });
    feed.set_on_malformed([this](const std::string& reason) {
        record_malformed(reason);
    });
}

void IngestPipeline::start() {
    std::lock_guard lock(queue_mutex_);
    if (writer_.joinable()) return;
    accepting_ = true;
    stopping_ = false;
    writer_ = std::thread([this] { writer_loop(); });
}

void IngestPipeline::stop() {
    {
        std::lock_guard lock(queue_mutex_);
        accepting_ = false;
        stopping_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    if (!writer_.joinable()) return;
    writer_.join();

    try {
        store_.flush();
    } catch (const StoreError& e) {
        std::cerr << "[ingest] Flush on stop failed: " << e.what() << "\n";
    }
}

void IngestPipeline::record_malformed(const std::string& reason) {
    ++malformed_;
    std::cerr << "[ingest] Skipping malformed message: " << reason << "\n";
}

void IngestPipeline::ingest(FeedMessage message) {
    if (message.channel != "book") {
        record_malformed("unexpected channel '" + message.channel + "'");
        return;
    }
    if (message.symbol.empty() || message.payload.empty()) {
        record_malformed("missing symbol or payload");
        return;
    }
    MessageKind kind;
    try {
        kind = message_kind_from_string(message.kind_indicator);
    } catch (const std::invalid_argument& e) {
        record_malformed(e.what());
        return;
    }

    const Timestamp received = clock_();

    // First message of a symbol since start: records stored by an earlier
    // run bound its event time from below. Looked up outside the queue lock.
    bool seen;
    {
        std::lock_guard lock(queue_mutex_);
        seen = last_event_time_.count(message.symbol) > 0;
    }
    std::optional<Timestamp> stored_latest;
    if (!seen) {
        try {
            stored_latest = store_.latest_event_time(message.symbol);
        } catch (const StoreError& e) {
            std::cerr << "[ingest] Could not read latest event time for "
                      << message.symbol << ": " << e.what() << "\n";
        }
    }

    std::unique_lock lock(queue_mutex_);
    if (options_.overflow_policy == OverflowPolicy::Block) {
        not_full_.wait(lock, [this] {
            return queue_.size() < options_.queue_capacity || !accepting_;
        });
    }
    if (!accepting_) {
        ++overflowed_;
        return;
    }
    if (queue_.size() >= options_.queue_capacity) {
        queue_.pop_front();
        ++overflowed_;
    }

    Pending item{
        RawMessageRecord{
            resolve_event_time(message, received, stored_latest),
            received,
            message.channel,
            message.symbol,
            kind,
            message.checksum,
            std::move(message.payload),
            next_sequence_id_++,
        },
        std::move(message.bids),
        std::move(message.asks),
    };
    queue_.push_back(std::move(item));
    ++accepted_;
    lock.unlock();
    not_empty_.notify_one();
}

// Called with queue_mutex_ held, so the clamp follows arrival order.
Timestamp IngestPipeline::resolve_event_time(const FeedMessage& message, Timestamp received,
                                             std::optional<Timestamp> stored_latest) {
    Timestamp event_time = received;
    if (options_.event_time_source == EventTimeSource::Embedded && message.embedded_timestamp) {
        try {
            event_time = Timestamp::from_iso8601(*message.embedded_timestamp);
        } catch (const std::logic_error&) {
            event_time = received;
        }
    }

    auto it = last_event_time_.find(message.symbol);
    if (it == last_event_time_.end()) {
        if (stored_latest) event_time = std::max(event_time, *stored_latest);
        last_event_time_.emplace(message.symbol, event_time);
    } else {
        event_time = std::max(event_time, it->second);
        it->second = event_time;
    }
    return event_time;
}

void IngestPipeline::writer_loop() {
    for (;;) {
        std::optional<Pending> item;
        {
            std::unique_lock lock(queue_mutex_);
            not_empty_.wait(lock, [this] { return !queue_.empty() || stopping_; });
            if (queue_.empty()) break;
            item.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }
        not_full_.notify_one();
        write(*item);
    }
}

void IngestPipeline::write(const Pending& item) {
    const auto& raw = item.raw;
    if (!write_with_retry([&] { store_.append(raw); }, "raw message", raw.symbol)) {
        return;
    }
    ++stored_;
    {
        std::lock_guard lock(counts_mutex_);
        ++symbol_counts_[raw.symbol];
    }

    std::vector<BookLevelRecord> levels;
    levels.reserve(item.bids.size() + item.asks.size());
    auto add = [&](Side side, const std::vector<PriceLevel>& entries) {
        for (const auto& entry : entries) {
            levels.push_back(BookLevelRecord{
                raw.event_time, raw.symbol, side, entry.price(), entry.quantity(),
                raw.message_kind, raw.checksum});
        }
    };
    add(Side::Bid, item.bids);
    add(Side::Ask, item.asks);
    if (levels.empty()) return;

    write_with_retry([&] { store_.upsert_levels(levels); }, "book levels", raw.symbol);
}

template <typename Op>
bool IngestPipeline::write_with_retry(Op&& op, const char* what, const std::string& symbol) {
    auto backoff = options_.initial_backoff;
    for (int attempt = 1;; ++attempt) {
        try {
            op();
            return true;
        } catch (const TransientStoreError& e) {
            if (attempt >= options_.max_write_attempts) {
                ++dropped_transient_;
                std::cerr << "[ingest] Dropping " << what << " for " << symbol
                          << " after " << attempt << " attempts: " << e.what() << "\n";
                return false;
            }
            ++retries_;
            std::this_thread::sleep_for(backoff);
            backoff = std::min(backoff * 2, options_.max_backoff);
        } catch (const StoreError& e) {
            ++dropped_permanent_;
            std::cerr << "[ingest] Dropping " << what << " for " << symbol
                      << ": " << e.what() << "\n";
            return false;
        }
    }
}

IngestStats IngestPipeline::stats() const {
    return IngestStats{
        accepted_.load(),
        stored_.load(),
        overflowed_.load(),
        malformed_.load(),
        retries_.load(),
        dropped_transient_.load(),
        dropped_permanent_.load(),
    };
}

std::map<std::string, uint64_t> IngestPipeline::symbol_counts() const {
    std::lock_guard lock(counts_mutex_);
    return symbol_counts_;
}

size_t IngestPipeline::queue_depth() const {
    std::lock_guard lock(queue_mutex_);
    return queue_.size();
}

} // namespace obr::services
