#pragma once

#include <compare>
#include <stdexcept>
#include <string>

namespace obr::domain {

// A resting quantity at a price level. Zero is valid and means the level
// was removed by an update.
class Quantity {
public:
    explicit Quantity(double value);

    double value() const noexcept { return value_; }
    bool is_zero() const noexcept { return value_ == 0.0; }

    bool operator==(const Quantity&) const = default;
    auto operator<=>(const Quantity&) const = default;

private:
    double value_;
};

} // namespace obr::domain
