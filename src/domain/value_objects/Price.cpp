#include "domain/value_objects/Price.hpp"

#include <cmath>

namespace obr::domain {

Price::Price(double value) : value_(value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw std::out_of_range(
            "Price must be finite and non-negative, got: " + std::to_string(value));
    }
}

} // namespace obr::domain
