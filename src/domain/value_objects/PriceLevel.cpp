#include "domain/value_objects/PriceLevel.hpp"

namespace obr::domain {

PriceLevel::PriceLevel(Price price, Quantity quantity)
    : price_(price)
    , quantity_(quantity) {}

} // namespace obr::domain
