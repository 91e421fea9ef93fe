#include "domain/Errors.hpp"
#include "infrastructure/KrakenMessageParser.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace obr::domain;
using obr::infrastructure::KrakenMessageParser;

class KrakenParserTest : public ::testing::Test {
protected:
    KrakenMessageParser parser;
};

// --- Book frames ---

TEST_F(KrakenParserTest, ParsesBookSnapshot) {
    const std::string frame = R"({"channel":"book","type":"snapshot","data":[{
        "symbol":"BTC/USD",
        "bids":[{"price":101234.5,"qty":0.5},{"price":101234.0,"qty":1.25}],
        "asks":[{"price":101235.1,"qty":2.0}],
        "checksum":2439117997,
        "timestamp":"2025-11-08T17:50:22.885395Z"}]})";

    auto message = parser.parse(frame);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->channel, "book");
    EXPECT_EQ(message->kind_indicator, "snapshot");
    EXPECT_EQ(message->symbol, "BTC/USD");
    EXPECT_EQ(message->checksum, 2439117997);
    EXPECT_EQ(message->embedded_timestamp, "2025-11-08T17:50:22.885395Z");

    ASSERT_EQ(message->bids.size(), 2u);
    EXPECT_DOUBLE_EQ(message->bids[0].price().value(), 101234.5);
    EXPECT_DOUBLE_EQ(message->bids[1].quantity().value(), 1.25);
    ASSERT_EQ(message->asks.size(), 1u);
    EXPECT_DOUBLE_EQ(message->asks[0].price().value(), 101235.1);
}

TEST_F(KrakenParserTest, PayloadIsExactFrameText) {
    const std::string frame =
        R"({"channel":"book",  "type":"update","data":[{"symbol":"ETH/USD","bids":[{"price":3000.10,"qty":0}]}]})";
    auto message = parser.parse(frame);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->payload, frame);
}

TEST_F(KrakenParserTest, ParsesUpdateWithZeroQuantity) {
    auto message = parser.parse(
        R"({"channel":"book","type":"update","data":[{"symbol":"BTC/USD","bids":[{"price":100.0,"qty":0.0}],"asks":[]}]})");
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->kind_indicator, "update");
    ASSERT_EQ(message->bids.size(), 1u);
    EXPECT_TRUE(message->bids[0].quantity().is_zero());
    EXPECT_TRUE(message->asks.empty());
    EXPECT_FALSE(message->checksum.has_value());
    EXPECT_FALSE(message->embedded_timestamp.has_value());
}

TEST_F(KrakenParserTest, AcceptsStringDecimals) {
    auto message = parser.parse(
        R"({"channel":"book","type":"update","data":[{"symbol":"BTC/USD","asks":[{"price":"101.5","qty":"3"}]}]})");
    ASSERT_TRUE(message.has_value());
    EXPECT_DOUBLE_EQ(message->asks[0].price().value(), 101.5);
    EXPECT_DOUBLE_EQ(message->asks[0].quantity().value(), 3.0);
}

TEST_F(KrakenParserTest, OnlyFirstDataEntryIsRead) {
    auto message = parser.parse(
        R"({"channel":"book","type":"update","data":[{"symbol":"BTC/USD"},{"symbol":"ETH/USD"}]})");
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->symbol, "BTC/USD");
}

TEST_F(KrakenParserTest, ForwardsOtherChannels) {
    auto message = parser.parse(
        R"({"channel":"ticker","type":"update","data":[{"symbol":"BTC/USD","last":1.0}]})");
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->channel, "ticker");
}

// --- Control frames ---

TEST_F(KrakenParserTest, IgnoresHeartbeatAndStatus) {
    EXPECT_FALSE(parser.parse(R"({"channel":"heartbeat"})").has_value());
    EXPECT_FALSE(parser.parse(
        R"({"channel":"status","type":"update","data":[{"system":"online"}]})").has_value());
}

TEST_F(KrakenParserTest, IgnoresMethodReplies) {
    EXPECT_FALSE(parser.parse(
        R"({"method":"subscribe","result":{"channel":"book","symbol":"BTC/USD"},"success":true})")
        .has_value());
}

// --- Malformed ---

TEST_F(KrakenParserTest, RejectsInvalidJson) {
    EXPECT_THROW(parser.parse("not json"), MalformedFeedMessage);
    EXPECT_THROW(parser.parse("[1,2,3]"), MalformedFeedMessage);
}

TEST_F(KrakenParserTest, RejectsMissingChannelOrData) {
    EXPECT_THROW(parser.parse(R"({"type":"update"})"), MalformedFeedMessage);
    EXPECT_THROW(parser.parse(R"({"channel":"book","type":"update"})"), MalformedFeedMessage);
    EXPECT_THROW(parser.parse(R"({"channel":"book","type":"update","data":[]})"),
                 MalformedFeedMessage);
}

TEST_F(KrakenParserTest, RejectsBadLevels) {
    EXPECT_THROW(parser.parse(
        R"({"channel":"book","type":"update","data":[{"symbol":"BTC/USD","bids":{"price":1}}]})"),
        MalformedFeedMessage);
    EXPECT_THROW(parser.parse(
        R"({"channel":"book","type":"update","data":[{"symbol":"BTC/USD","bids":[{"price":1}]}]})"),
        MalformedFeedMessage);
    EXPECT_THROW(parser.parse(
        R"({"channel":"book","type":"update","data":[{"symbol":"BTC/USD","bids":[{"price":-1,"qty":1}]}]})"),
        MalformedFeedMessage);
    EXPECT_THROW(parser.parse(
        R"({"channel":"book","type":"update","data":[{"symbol":"BTC/USD","asks":[{"price":"abc","qty":1}]}]})"),
        MalformedFeedMessage);
}

// --- Subscribe request ---

TEST(KrakenSubscribeRequest, ListsSymbolsAndDepth) {
    auto request = nlohmann::json::parse(
        KrakenMessageParser::subscribe_request({"BTC/USD", "ETH/USD"}, 25));
    EXPECT_EQ(request["method"], "subscribe");
    EXPECT_EQ(request["params"]["channel"], "book");
    EXPECT_EQ(request["params"]["depth"], 25);
    EXPECT_EQ(request["params"]["snapshot"], true);
    ASSERT_EQ(request["params"]["symbol"].size(), 2u);
    EXPECT_EQ(request["params"]["symbol"][1], "ETH/USD");
}
