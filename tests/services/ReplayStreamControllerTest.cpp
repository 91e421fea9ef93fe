#include "domain/Errors.hpp"
#include "repositories/InMemoryEventStore.hpp"
#include "services/ReplayStreamController.hpp"
#include "support/RecordBuilders.hpp"
#include "support/RecordingSink.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace obr::domain;
using namespace obr::services;
using obr::repositories::InMemoryEventStore;
using obr::repositories::ScanRange;
using obr::testing::RecordingSink;
using obr::testing::level;
using obr::testing::raw;
using obr::testing::snapshot;

namespace {

// Reads fail once the first page has been served.
class FailingStore : public InMemoryEventStore {
public:
    std::vector<RawMessageRecord> read_raw(const std::string& symbol, const ScanRange& range,
                                           size_t limit) const override {
        if (reads_++ > 0) throw TransientStoreError("disk went away");
        return InMemoryEventStore::read_raw(symbol, range, limit);
    }

private:
    mutable int reads_{0};
};

constexpr int64_t kSecond = 1'000'000;
const int64_t kT0 = Timestamp::from_iso8601("2025-11-08T17:00:00Z").microseconds();

} // namespace

class ReplayStreamControllerTest : public ::testing::Test {
protected:
    InMemoryEventStore store;
    const std::string sym = "BTC/USD";

    StartPoint start_at(int64_t event_us, uint64_t seq) const {
        return StartPoint{sym, Timestamp(event_us), seq};
    }
};

TEST_F(ReplayStreamControllerTest, StreamsSnapshotUpdatesAndNextSnapshotThenStops) {
    const int64_t t1 = kT0 + kSecond;
    const int64_t t2 = kT0 + 2 * kSecond;
    store.append(snapshot(sym, kT0, 1));
    store.upsert_levels({level(sym, kT0, Side::Bid, 100, 1, MessageKind::Snapshot),
                         level(sym, kT0, Side::Ask, 101, 2, MessageKind::Snapshot)});
    store.append(raw(sym, t1, 2));
    store.upsert_levels({level(sym, t1, Side::Bid, 100, 0.5)});
    store.append(snapshot(sym, t2, 3));
    store.upsert_levels({level(sym, t2, Side::Bid, 99, 3, MessageKind::Snapshot)});
    store.append(raw(sym, kT0 + 3 * kSecond, 4));

    RecordingSink sink;
    ReplayStreamController controller(store, start_at(kT0, 1), sink);
    auto reason = controller.run();

    EXPECT_EQ(reason, StopReason::SnapshotBoundary);
    auto payloads = sink.payloads();
    ASSERT_EQ(payloads.size(), 3u);
    EXPECT_EQ(payloads[0], snapshot(sym, kT0, 1).payload);
    EXPECT_EQ(payloads[1], raw(sym, t1, 2).payload);
    EXPECT_EQ(payloads[2], snapshot(sym, t2, 3).payload);
    EXPECT_EQ(controller.emitted(), 3u);
    EXPECT_EQ(controller.state(), StreamState::Stopped);
    EXPECT_EQ(sink.close_calls(), 1);
    EXPECT_EQ(sink.reason(), StopReason::SnapshotBoundary);
}

TEST_F(ReplayStreamControllerTest, ExhaustedWhenNoLaterSnapshot) {
    store.append(snapshot(sym, 1000, 1));
    store.append(raw(sym, 2000, 2));
    store.append(raw(sym, 3000, 3));

    RecordingSink sink;
    ReplayStreamController controller(store, start_at(1000, 1), sink, {}, 1);
    EXPECT_EQ(controller.run(), StopReason::Exhausted);
    EXPECT_EQ(sink.payloads().size(), 3u);
}

TEST_F(ReplayStreamControllerTest, IgnoresRecordsBeforeStartPoint) {
    store.append(raw(sym, 500, 1));
    store.append(raw(sym, 1000, 2));
    store.append(snapshot(sym, 1000, 3));
    store.append(raw(sym, 2000, 4));

    RecordingSink sink;
    ReplayStreamController controller(store, start_at(1000, 3), sink);
    controller.run();
    auto payloads = sink.payloads();
    ASSERT_EQ(payloads.size(), 2u);
    EXPECT_EQ(payloads[0], snapshot(sym, 1000, 3).payload);
}

TEST_F(ReplayStreamControllerTest, StaleWhenStartSnapshotMissing) {
    store.append(raw(sym, 1000, 1));
    store.append(snapshot(sym, 2000, 2));

    RecordingSink sink;
    ReplayStreamController controller(store, start_at(1000, 1), sink);
    EXPECT_EQ(controller.run(), StopReason::StaleReference);
    EXPECT_TRUE(sink.payloads().empty());
    EXPECT_EQ(sink.reason(), StopReason::StaleReference);
    EXPECT_FALSE(sink.detail().empty());
}

TEST_F(ReplayStreamControllerTest, StaleAfterTruncate) {
    store.append(snapshot(sym, 1000, 1));
    StartPoint start = start_at(1000, 1);
    store.truncate();

    RecordingSink sink;
    ReplayStreamController controller(store, start, sink);
    EXPECT_EQ(controller.run(), StopReason::StaleReference);
    EXPECT_EQ(controller.emitted(), 0u);
    EXPECT_TRUE(sink.payloads().empty());
    EXPECT_EQ(sink.reason(), StopReason::StaleReference);
    EXPECT_FALSE(sink.detail().empty());
}

TEST_F(ReplayStreamControllerTest, StopsWhenSinkRefuses) {
    store.append(snapshot(sym, 1000, 1));
    store.append(raw(sym, 2000, 2));
    store.append(raw(sym, 3000, 3));

    RecordingSink sink(1);
    ReplayStreamController controller(store, start_at(1000, 1), sink);
    EXPECT_EQ(controller.run(), StopReason::SinkClosed);
    EXPECT_EQ(controller.emitted(), 1u);
}

TEST_F(ReplayStreamControllerTest, CancelBeforeRunEmitsNothing) {
    store.append(snapshot(sym, 1000, 1));
    RecordingSink sink;
    ReplayStreamController controller(store, start_at(1000, 1), sink);
    controller.cancel();
    EXPECT_EQ(controller.run(), StopReason::Cancelled);
    EXPECT_TRUE(sink.payloads().empty());
    EXPECT_EQ(sink.close_calls(), 1);
}

TEST_F(ReplayStreamControllerTest, RunsOnlyOnce) {
    store.append(snapshot(sym, 1000, 1));
    RecordingSink sink;
    ReplayStreamController controller(store, start_at(1000, 1), sink);
    controller.run();
    EXPECT_THROW(controller.run(), std::logic_error);
    EXPECT_EQ(sink.close_calls(), 1);
}

TEST_F(ReplayStreamControllerTest, StoreFailureEndsSession) {
    FailingStore failing;
    failing.append(snapshot(sym, 1000, 1));
    failing.append(raw(sym, 2000, 2));

    RecordingSink sink;
    ReplayStreamController controller(failing, start_at(1000, 1), sink, {}, 1);
    EXPECT_EQ(controller.run(), StopReason::StoreError);
    EXPECT_EQ(sink.payloads().size(), 1u);
    EXPECT_EQ(sink.detail(), "disk went away");
}

TEST_F(ReplayStreamControllerTest, RealtimePacingCapsDelay) {
    store.append(snapshot(sym, kT0, 1));
    store.append(raw(sym, kT0 + 30 * kSecond, 2));

    PacingOptions pacing;
    pacing.mode = PacingMode::Realtime;
    pacing.max_delay = std::chrono::milliseconds(20);

    RecordingSink sink;
    ReplayStreamController controller(store, start_at(kT0, 1), sink, pacing);
    auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(controller.run(), StopReason::Exhausted);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_GE(elapsed, std::chrono::milliseconds(20));
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_EQ(sink.payloads().size(), 2u);
}

TEST_F(ReplayStreamControllerTest, CancelInterruptsPacing) {
    store.append(snapshot(sym, kT0, 1));
    store.append(raw(sym, kT0 + 600 * kSecond, 2));

    PacingOptions pacing;
    pacing.mode = PacingMode::Realtime;

    RecordingSink sink;
    ReplayStreamController controller(store, start_at(kT0, 1), sink, pacing);
    std::thread runner([&] { controller.run(); });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (sink.payloads().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    controller.cancel();
    runner.join();

    EXPECT_EQ(controller.stop_reason(), StopReason::Cancelled);
    EXPECT_EQ(sink.payloads().size(), 1u);
}

TEST(PacingOptions, FromSettings) {
    obr::config::ReplaySettings settings;
    settings.pacing = "realtime";
    settings.pacing_speed = 4.0;
    settings.max_pacing_delay_seconds = 3;
    auto options = PacingOptions::from_settings(settings);
    EXPECT_EQ(options.mode, PacingMode::Realtime);
    EXPECT_DOUBLE_EQ(options.speed, 4.0);
    EXPECT_EQ(options.max_delay, std::chrono::milliseconds(3000));

    settings.pacing_speed = 0.0;
    EXPECT_THROW(PacingOptions::from_settings(settings), std::invalid_argument);
    settings.pacing_speed = 1.0;
    settings.pacing = "turbo";
    EXPECT_THROW(PacingOptions::from_settings(settings), std::invalid_argument);
}
