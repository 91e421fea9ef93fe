#include "domain/value_objects/Price.hpp"

#include <gtest/gtest.h>

#include <limits>

using obr::domain::Price;

TEST(Price, ConstructsWithValidValue) {
    Price p(101234.5);
    EXPECT_DOUBLE_EQ(p.value(), 101234.5);
}

TEST(Price, AllowsZero) {
    EXPECT_DOUBLE_EQ(Price(0.0).value(), 0.0);
}

TEST(Price, ThrowsOnNegative) {
    EXPECT_THROW(Price(-0.01), std::out_of_range);
}

TEST(Price, ThrowsOnNonFinite) {
    EXPECT_THROW(Price(std::numeric_limits<double>::infinity()), std::out_of_range);
    EXPECT_THROW(Price(std::numeric_limits<double>::quiet_NaN()), std::out_of_range);
}

TEST(Price, Ordering) {
    EXPECT_LT(Price(100.0), Price(100.5));
    EXPECT_EQ(Price(100.0), Price(100.0));
}
