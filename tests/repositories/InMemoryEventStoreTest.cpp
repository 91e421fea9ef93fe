#include "domain/Errors.hpp"
#include "repositories/InMemoryEventStore.hpp"
#include "support/RecordBuilders.hpp"

#include <gtest/gtest.h>

using namespace obr::domain;
using obr::repositories::InMemoryEventStore;
using obr::repositories::ScanRange;
using obr::testing::level;
using obr::testing::raw;
using obr::testing::snapshot;

namespace {
const std::string kBtc = "BTC/USD";
const std::string kEth = "ETH/USD";

ScanRange from_start() {
    return ScanRange{RecordKey{Timestamp(0), 0}, std::nullopt};
}
} // namespace

TEST(InMemoryEventStore, AppendReturnsKey) {
    InMemoryEventStore store;
    auto ack = store.append(raw(kBtc, 1000, 7));
    EXPECT_EQ(ack.symbol, kBtc);
    EXPECT_EQ(ack.key, (RecordKey{Timestamp(1000), 7}));
}

TEST(InMemoryEventStore, ReadsInKeyOrderRegardlessOfAppendOrder) {
    InMemoryEventStore store;
    store.append(raw(kBtc, 3000, 3));
    store.append(raw(kBtc, 1000, 2));
    store.append(raw(kBtc, 1000, 1));
    store.append(raw(kBtc, 2000, 4));

    auto records = store.read_raw(kBtc, from_start(), 10);
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0].sequence_id, 1u);
    EXPECT_EQ(records[1].sequence_id, 2u);
    EXPECT_EQ(records[2].sequence_id, 4u);
    EXPECT_EQ(records[3].sequence_id, 3u);
}

TEST(InMemoryEventStore, AppendingSameKeyReplacesRecord) {
    InMemoryEventStore store;
    store.append(raw(kBtc, 1000, 1, MessageKind::Update, R"({"v":1})"));
    store.append(raw(kBtc, 1000, 1, MessageKind::Update, R"({"v":2})"));

    auto records = store.read_raw(kBtc, from_start(), 10);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].payload, R"({"v":2})");
    EXPECT_EQ(store.raw_count(), 1u);
}

TEST(InMemoryEventStore, PayloadIsStoredVerbatim) {
    InMemoryEventStore store;
    const std::string frame = R"({ "channel" : "book",  "data":[{"price":1.10}] })";
    store.append(raw(kBtc, 1000, 1, MessageKind::Update, frame));
    EXPECT_EQ(store.read_raw(kBtc, from_start(), 1)[0].payload, frame);
}

TEST(InMemoryEventStore, RejectsRecordWithoutSymbolOrPayload) {
    InMemoryEventStore store;
    EXPECT_THROW(store.append(raw("", 1000, 1)), PermanentStoreError);
    auto empty = raw(kBtc, 1000, 1);
    empty.payload.clear();
    EXPECT_THROW(store.append(empty), PermanentStoreError);
    EXPECT_EQ(store.raw_count(), 0u);
}

TEST(InMemoryEventStore, ReadRespectsRangeAndLimit) {
    InMemoryEventStore store;
    for (uint64_t i = 1; i <= 5; ++i) {
        store.append(raw(kBtc, static_cast<int64_t>(i) * 1000, i));
    }

    auto page = store.read_raw(kBtc, ScanRange{RecordKey{Timestamp(2000), 0}, Timestamp(4000)}, 10);
    ASSERT_EQ(page.size(), 3u);
    EXPECT_EQ(page.front().sequence_id, 2u);
    EXPECT_EQ(page.back().sequence_id, 4u);

    auto limited = store.read_raw(kBtc, from_start(), 2);
    EXPECT_EQ(limited.size(), 2u);
}

TEST(InMemoryEventStore, SymbolsArePartitioned) {
    InMemoryEventStore store;
    store.append(raw(kBtc, 1000, 1));
    store.append(raw(kEth, 1000, 2));

    EXPECT_EQ(store.read_raw(kBtc, from_start(), 10).size(), 1u);
    EXPECT_EQ(store.read_raw(kEth, from_start(), 10).size(), 1u);
    EXPECT_TRUE(store.read_raw("SOL/USD", from_start(), 10).empty());
    EXPECT_EQ(store.symbols(), (std::vector<std::string>{kBtc, kEth}));
}

TEST(InMemoryEventStore, UpsertLevelsLaterWriteWins) {
    InMemoryEventStore store;
    store.append(snapshot(kBtc, 1000, 1));
    store.upsert_levels({level(kBtc, 1000, Side::Bid, 100.0, 1.0, MessageKind::Snapshot)});
    store.upsert_levels({level(kBtc, 1000, Side::Bid, 100.0, 3.0, MessageKind::Snapshot)});

    auto levels = store.read_levels(kBtc, Timestamp(0), std::nullopt);
    ASSERT_EQ(levels.size(), 1u);
    EXPECT_DOUBLE_EQ(levels[0].quantity.value(), 3.0);
}

TEST(InMemoryEventStore, UpsertLevelsKeepsSidesApart) {
    InMemoryEventStore store;
    store.append(raw(kBtc, 1000, 1));
    store.upsert_levels({
        level(kBtc, 1000, Side::Bid, 100.0, 1.0),
        level(kBtc, 1000, Side::Ask, 100.0, 2.0),
    });
    EXPECT_EQ(store.level_count(), 2u);
}

TEST(InMemoryEventStore, RejectsOrphanLevels) {
    InMemoryEventStore store;
    store.append(raw(kBtc, 1000, 1));
    EXPECT_THROW(store.upsert_levels({level(kBtc, 2000, Side::Bid, 1.0, 1.0)}),
                 PermanentStoreError);
    // Kind must match the parent too.
    EXPECT_THROW(store.upsert_levels({level(kBtc, 1000, Side::Bid, 1.0, 1.0, MessageKind::Snapshot)}),
                 PermanentStoreError);
}

TEST(InMemoryEventStore, RejectedBatchWritesNothing) {
    InMemoryEventStore store;
    store.append(raw(kBtc, 1000, 1));
    EXPECT_THROW(store.upsert_levels({
                     level(kBtc, 1000, Side::Bid, 1.0, 1.0),
                     level(kEth, 1000, Side::Bid, 1.0, 1.0),
                 }),
                 PermanentStoreError);
    EXPECT_EQ(store.level_count(), 0u);
}

TEST(InMemoryEventStore, ReadLevelsFiltersByTime) {
    InMemoryEventStore store;
    store.append(raw(kBtc, 1000, 1));
    store.append(raw(kBtc, 2000, 2));
    store.upsert_levels({level(kBtc, 1000, Side::Bid, 1.0, 1.0)});
    store.upsert_levels({level(kBtc, 2000, Side::Ask, 2.0, 1.0)});

    auto levels = store.read_levels(kBtc, Timestamp(1500), Timestamp(2500));
    ASSERT_EQ(levels.size(), 1u);
    EXPECT_EQ(levels[0].side, Side::Ask);
}

TEST(InMemoryEventStore, TracksLatestTimeAndSequence) {
    InMemoryEventStore store;
    EXPECT_FALSE(store.latest_event_time(kBtc).has_value());
    EXPECT_EQ(store.max_sequence_id(), 0u);

    store.append(raw(kBtc, 5000, 9));
    store.append(raw(kBtc, 3000, 12));
    EXPECT_EQ(store.latest_event_time(kBtc), Timestamp(5000));
    EXPECT_EQ(store.max_sequence_id(), 12u);
}

TEST(InMemoryEventStore, StatsSummarizeAllSymbols) {
    InMemoryEventStore store;
    store.append(raw(kBtc, 2000, 1));
    store.append(raw(kEth, 1000, 2));
    store.append(raw(kEth, 4000, 3));
    store.upsert_levels({level(kEth, 4000, Side::Bid, 1.0, 1.0)});

    auto s = store.stats();
    EXPECT_EQ(s.raw_messages, 3u);
    EXPECT_EQ(s.book_levels, 1u);
    EXPECT_EQ(s.symbols, 2u);
    EXPECT_EQ(s.first_event_time, Timestamp(1000));
    EXPECT_EQ(s.last_event_time, Timestamp(4000));
}

TEST(InMemoryEventStore, TruncateDropsEverything) {
    InMemoryEventStore store;
    store.append(raw(kBtc, 1000, 1));
    store.upsert_levels({level(kBtc, 1000, Side::Bid, 1.0, 1.0)});
    store.truncate();

    EXPECT_EQ(store.raw_count(), 0u);
    EXPECT_EQ(store.level_count(), 0u);
    EXPECT_TRUE(store.symbols().empty());
}
