#include "domain/value_objects/Quantity.hpp"

#include <cmath>

namespace obr::domain {

Quantity::Quantity(double value) : value_(value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw std::out_of_range(
            "Quantity must be finite and non-negative, got: " + std::to_string(value));
    }
}

} // namespace obr::domain
