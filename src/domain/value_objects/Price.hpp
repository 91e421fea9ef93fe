#pragma once

#include <compare>
#include <stdexcept>
#include <string>

namespace obr::domain {

// Quote-currency price of a book level. Any finite, non-negative value.
class Price {
public:
    explicit Price(double value);

    double value() const noexcept { return value_; }

    bool operator==(const Price&) const = default;
    auto operator<=>(const Price&) const = default;

private:
    double value_;
};

} // namespace obr::domain
