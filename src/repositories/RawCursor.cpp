#include "repositories/RawCursor.hpp"

#include <stdexcept>

using namespace obr::domain;

namespace obr::repositories {

RawCursor::RawCursor(const IEventStore& store, std::string symbol, RecordKey from,
                     ScanMode mode, size_t batch_size)
    : store_(store)
    , symbol_(std::move(symbol))
    , next_from_(from)
    , mode_(mode)
    , batch_size_(batch_size) {
    if (batch_size_ == 0) {
        throw std::invalid_argument("RawCursor batch size must be positive");
    }
}

std::optional<RawMessageRecord> RawCursor::next() {
    if (page_.empty()) {
        fetch();
        if (page_.empty()) return std::nullopt;
    }
    RawMessageRecord record = std::move(page_.front());
    page_.pop_front();
    position_ = record.key();
    return record;
}

void RawCursor::restart_from(RecordKey from) {
    page_.clear();
    position_.reset();
    next_from_ = from;
}

void RawCursor::fetch() {
    auto records = store_.read_raw(symbol_, ScanRange{next_from_, mode_.until}, batch_size_);
    if (records.empty()) return;
    const auto& last = records.back().key();
    next_from_ = RecordKey{last.event_time, last.sequence_id + 1};
    for (auto& record : records) {
        page_.push_back(std::move(record));
    }
}

RawCursor IEventStore::scan_raw(const std::string& symbol, Timestamp from, ScanMode mode,
                                size_t batch_size) const {
    return RawCursor(*this, symbol, RecordKey{from, 0}, mode, batch_size);
}

RawCursor IEventStore::scan_raw(const std::string& symbol, RecordKey from, ScanMode mode,
                                size_t batch_size) const {
    return RawCursor(*this, symbol, from, mode, batch_size);
}

} // namespace obr::repositories
