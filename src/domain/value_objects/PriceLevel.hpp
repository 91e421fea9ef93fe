#pragma once

#include "domain/value_objects/Price.hpp"
#include "domain/value_objects/Quantity.hpp"

namespace obr::domain {

class PriceLevel {
public:
    PriceLevel(Price price, Quantity quantity);

    const Price& price() const noexcept { return price_; }
    const Quantity& quantity() const noexcept { return quantity_; }

    bool operator==(const PriceLevel&) const = default;
    auto operator<=>(const PriceLevel&) const = default;

private:
    Price price_;
    Quantity quantity_;
};

} // namespace obr::domain
