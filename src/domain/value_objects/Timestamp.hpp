#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <string>

namespace obr::domain {

// Microseconds since the Unix epoch, UTC.
class Timestamp {
public:
    explicit Timestamp(int64_t microseconds_since_epoch);

    static Timestamp from_epoch_seconds(double seconds_since_epoch);

    // Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[.ffffff]" with an optional
    // "Z" or "+HH:MM"/"-HH:MM" suffix. A space may replace the 'T'.
    // Values without an offset are UTC.
    static Timestamp from_iso8601(const std::string& str);
    static Timestamp now();

    int64_t microseconds() const noexcept { return us_; }

    // "2025-11-08T17:50:22.885395+00:00"; the fraction is omitted when zero.
    std::string to_iso8601() const;

    Timestamp operator+(std::chrono::microseconds delta) const;
    Timestamp operator-(std::chrono::microseconds delta) const;
    std::chrono::microseconds operator-(const Timestamp& other) const noexcept {
        return std::chrono::microseconds(us_ - other.us_);
    }

    bool operator==(const Timestamp&) const = default;
    auto operator<=>(const Timestamp&) const = default;

private:
    int64_t us_;
};

} // namespace obr::domain
