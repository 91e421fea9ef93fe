#include "domain/value_objects/MessageKind.hpp"
#include "domain/value_objects/Side.hpp"

#include <gtest/gtest.h>

using obr::domain::MessageKind;
using obr::domain::Side;

TEST(Side, ConvertsToString) {
    EXPECT_EQ(obr::domain::to_string(Side::Bid), "bid");
    EXPECT_EQ(obr::domain::to_string(Side::Ask), "ask");
}

TEST(MessageKind, ParsesFromString) {
    EXPECT_EQ(obr::domain::message_kind_from_string("snapshot"), MessageKind::Snapshot);
    EXPECT_EQ(obr::domain::message_kind_from_string("update"), MessageKind::Update);
    EXPECT_THROW(obr::domain::message_kind_from_string("delta"), std::invalid_argument);
}

TEST(MessageKind, ConvertsToString) {
    EXPECT_EQ(obr::domain::to_string(MessageKind::Snapshot), "snapshot");
    EXPECT_EQ(obr::domain::to_string(MessageKind::Update), "update");
}
