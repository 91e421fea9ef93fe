#include "domain/value_objects/PriceLevel.hpp"

#include <gtest/gtest.h>

using obr::domain::Price;
using obr::domain::PriceLevel;
using obr::domain::Quantity;

TEST(PriceLevel, ConstructsWithPriceAndQuantity) {
    PriceLevel level(Price(101234.5), Quantity(0.75));
    EXPECT_DOUBLE_EQ(level.price().value(), 101234.5);
    EXPECT_DOUBLE_EQ(level.quantity().value(), 0.75);
}

TEST(PriceLevel, RejectsNegativeQuantity) {
    EXPECT_THROW(PriceLevel(Price(1.0), Quantity(-2.0)), std::out_of_range);
}

TEST(PriceLevel, DifferentQuantitiesAreNotEqual) {
    PriceLevel a(Price(10.0), Quantity(1.0));
    PriceLevel b(Price(10.0), Quantity(2.0));
    EXPECT_NE(a, b);
}

TEST(PriceLevel, OrdersByPriceFirst) {
    PriceLevel low(Price(10.0), Quantity(100.0));
    PriceLevel high(Price(20.0), Quantity(1.0));
    EXPECT_LT(low, high);
}
