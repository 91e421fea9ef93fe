#include "domain/value_objects/Timestamp.hpp"

#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace obr::domain {

namespace {

constexpr int64_t kMicrosPerSecond = 1'000'000;

[[noreturn]] void invalid(const std::string& str) {
    throw std::invalid_argument("Invalid timestamp: '" + str + "'");
}

int read_digits(const std::string& str, size_t& pos, size_t count) {
    if (pos + count > str.size()) invalid(str);
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = str[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) invalid(str);
        value = value * 10 + (c - '0');
    }
    pos += count;
    return value;
}

void expect(const std::string& str, size_t& pos, char c) {
    if (pos >= str.size() || str[pos] != c) invalid(str);
    ++pos;
}

} // namespace

Timestamp::Timestamp(int64_t microseconds_since_epoch) : us_(microseconds_since_epoch) {
    if (microseconds_since_epoch < 0) {
        throw std::out_of_range(
            "Timestamp must be non-negative, got: " + std::to_string(microseconds_since_epoch));
    }
}

Timestamp Timestamp::from_epoch_seconds(double seconds_since_epoch) {
    if (!std::isfinite(seconds_since_epoch)) {
        throw std::invalid_argument("Timestamp seconds must be finite");
    }
    return Timestamp(static_cast<int64_t>(std::llround(seconds_since_epoch * kMicrosPerSecond)));
}

Timestamp Timestamp::from_iso8601(const std::string& str) {
    size_t pos = 0;
    std::tm tm{};
    tm.tm_year = read_digits(str, pos, 4) - 1900;
    expect(str, pos, '-');
    tm.tm_mon = read_digits(str, pos, 2) - 1;
    expect(str, pos, '-');
    tm.tm_mday = read_digits(str, pos, 2);

    int64_t fraction_us = 0;
    int64_t offset_seconds = 0;

    if (pos < str.size()) {
        if (str[pos] != 'T' && str[pos] != 't' && str[pos] != ' ') invalid(str);
        ++pos;
        tm.tm_hour = read_digits(str, pos, 2);
        expect(str, pos, ':');
        tm.tm_min = read_digits(str, pos, 2);
        expect(str, pos, ':');
        tm.tm_sec = read_digits(str, pos, 2);

        if (pos < str.size() && str[pos] == '.') {
            ++pos;
            int digits = 0;
            while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
                if (digits < 6) {
                    fraction_us = fraction_us * 10 + (str[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) invalid(str);
            for (int i = digits; i < 6; ++i) fraction_us *= 10;
        }

        if (pos < str.size()) {
            char designator = str[pos];
            if (designator == 'Z' || designator == 'z') {
                ++pos;
            } else if (designator == '+' || designator == '-') {
                ++pos;
                int oh = read_digits(str, pos, 2);
                if (pos < str.size() && str[pos] == ':') ++pos;
                int om = read_digits(str, pos, 2);
                if (oh > 23 || om > 59) invalid(str);
                offset_seconds = (oh * 3600 + om * 60) * (designator == '+' ? 1 : -1);
            } else {
                invalid(str);
            }
        }
    }

    if (pos != str.size()) invalid(str);
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 59) {
        invalid(str);
    }

    // timegm normalizes out-of-range days; a round trip catches 2025-02-30.
    std::tm requested = tm;
    std::time_t seconds = timegm(&tm);
    if (tm.tm_mday != requested.tm_mday || tm.tm_mon != requested.tm_mon) invalid(str);

    int64_t utc_seconds = static_cast<int64_t>(seconds) - offset_seconds;
    return Timestamp(utc_seconds * kMicrosPerSecond + fraction_us);
}

Timestamp Timestamp::now() {
    return Timestamp(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string Timestamp::to_iso8601() const {
    std::time_t seconds = static_cast<std::time_t>(us_ / kMicrosPerSecond);
    int64_t fraction = us_ % kMicrosPerSecond;
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (fraction != 0) {
        oss << '.' << std::setfill('0') << std::setw(6) << fraction;
    }
    oss << "+00:00";
    return oss.str();
}

Timestamp Timestamp::operator+(std::chrono::microseconds delta) const {
    return Timestamp(us_ + delta.count());
}

Timestamp Timestamp::operator-(std::chrono::microseconds delta) const {
    return Timestamp(us_ - delta.count());
}

} // namespace obr::domain
