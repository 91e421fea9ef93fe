#include "config/Settings.hpp"
#include "repositories/RawCursor.hpp"
#include "repositories/StoreHandle.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <deque>
#include <iostream>
#include <string>

using namespace obr::domain;
using obr::repositories::IEventStore;
using obr::repositories::ScanMode;

namespace {

constexpr size_t kRecentMessages = 10;
constexpr size_t kRecentLevels = 20;
constexpr std::chrono::minutes kLookback{10};

void print_recent_messages(const IEventStore& store, const std::string& symbol) {
    auto latest = store.latest_event_time(symbol);
    if (!latest) {
        std::cout << "(no messages for " << symbol << ")\n";
        return;
    }

    std::deque<RawMessageRecord> recent;
    auto cursor = store.scan_raw(symbol, *latest - kLookback, ScanMode::bounded(*latest));
    while (auto record = cursor.next()) {
        recent.push_back(std::move(*record));
        if (recent.size() > kRecentMessages) recent.pop_front();
    }

    for (auto it = recent.rbegin(); it != recent.rend(); ++it) {
        std::cout << "Timestamp: " << it->event_time.to_iso8601() << "\n";
        std::cout << "Type: " << to_string(it->message_kind) << ", Symbol: " << it->symbol
                  << ", Sequence: " << it->sequence_id << "\n";
        std::cout << "Checksum: "
                  << (it->checksum ? std::to_string(*it->checksum) : std::string("none")) << "\n";
        auto payload = nlohmann::json::parse(it->payload, nullptr, false);
        std::cout << "Raw message: "
                  << (payload.is_discarded() ? it->payload : payload.dump(2)) << "\n";
        std::cout << std::string(80, '-') << "\n";
    }
}

void print_recent_levels(const IEventStore& store, const std::string& symbol) {
    auto latest = store.latest_event_time(symbol);
    if (!latest) return;

    auto levels = store.read_levels(symbol, *latest - kLookback, *latest);
    size_t shown = 0;
    for (auto it = levels.rbegin(); it != levels.rend() && shown < kRecentLevels; ++it, ++shown) {
        std::cout << it->event_time.to_iso8601() << " | " << it->symbol << " | "
                  << to_string(it->side) << " | $" << it->price.value() << " x "
                  << it->quantity.value() << " | " << to_string(it->message_kind) << "\n";
    }
}

void print_stats(const IEventStore& store) {
    auto stats = store.stats();
    std::cout << "Total messages: " << stats.raw_messages << "\n";
    std::cout << "Total levels: " << stats.book_levels << "\n";
    std::cout << "Unique symbols: " << stats.symbols << "\n";
    std::cout << "First message: "
              << (stats.first_event_time ? stats.first_event_time->to_iso8601() : "none") << "\n";
    std::cout << "Last message: "
              << (stats.last_event_time ? stats.last_event_time->to_iso8601() : "none") << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    auto settings = obr::config::Settings::from_environment();
    std::string symbol = argc >= 2 ? argv[1] : settings.feed.symbols.front();

    try {
        auto handle = obr::repositories::StoreHandle::open(settings.storage);
        auto& store = handle.store();

        std::cout << "=== Recent Order Book Messages (" << symbol << ") ===\n";
        print_recent_messages(store, symbol);

        std::cout << "\n=== Recent Bid/Ask Entries (" << symbol << ") ===\n";
        print_recent_levels(store, symbol);

        std::cout << "\n=== Statistics ===\n";
        print_stats(store);
    } catch (const std::exception& e) {
        std::cerr << "[query] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
