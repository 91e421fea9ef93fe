#pragma once

#include "repositories/IEventStore.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

namespace obr::repositories {

// Pages through one symbol's raw log. Each page is a fresh read_raw call,
// so the cursor holds no lock between pages. An open-ended cursor that
// returned nullopt may yield more records later, once they are appended.
class RawCursor {
public:
    RawCursor(const IEventStore& store, std::string symbol, domain::RecordKey from,
              ScanMode mode, size_t batch_size);

    std::optional<domain::RawMessageRecord> next();

    // Key of the last record returned, if any.
    const std::optional<domain::RecordKey>& position() const noexcept { return position_; }

    // Drops buffered records and continues from `from` (inclusive).
    void restart_from(domain::RecordKey from);

    const std::string& symbol() const noexcept { return symbol_; }

private:
    void fetch();

    const IEventStore& store_;
    std::string symbol_;
    domain::RecordKey next_from_;
    ScanMode mode_;
    size_t batch_size_;
    std::deque<domain::RawMessageRecord> page_;
    std::optional<domain::RecordKey> position_;
};

} // namespace obr::repositories
