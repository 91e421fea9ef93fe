#include "config/Settings.hpp"
#include "infrastructure/KrakenFeedClient.hpp"
#include "infrastructure/ReplayHttpServer.hpp"
#include "infrastructure/ReplayWebSocketServer.hpp"
#include "repositories/StoreHandle.hpp"
#include "services/IngestPipeline.hpp"
#include "services/ReplaySessionService.hpp"

#include <ixwebsocket/IXNetSystem.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

static std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

int main() {
    auto settings = obr::config::Settings::from_environment();

    const auto& mode = settings.service.mode;
    if (mode != "capture" && mode != "replay" && mode != "all") {
        std::cerr << "Unknown OBR_MODE '" << mode << "'. Use capture, replay or all." << std::endl;
        return 1;
    }
    const bool capture = mode != "replay";
    const bool replay = mode != "capture";

    std::optional<obr::repositories::StoreHandle> handle;
    std::optional<obr::services::IngestOptions> ingest_options;
    std::optional<obr::services::ReplayOptions> replay_options;
    try {
        handle.emplace(obr::repositories::StoreHandle::open(settings.storage));
        ingest_options = obr::services::IngestOptions::from_settings(settings.ingest);
        replay_options = obr::services::ReplayOptions::from_settings(settings.replay);
    } catch (const std::exception& e) {
        std::cerr << "[engine] " << e.what() << std::endl;
        return 1;
    }
    auto& store = handle->store();

    ix::initNetSystem();

    std::unique_ptr<obr::services::IngestPipeline> pipeline;
    std::unique_ptr<obr::infrastructure::KrakenFeedClient> feed;
    std::unique_ptr<obr::services::ReplaySessionService> sessions;
    std::unique_ptr<obr::infrastructure::ReplayHttpServer> http;
    std::unique_ptr<obr::infrastructure::ReplayWebSocketServer> ws;

    try {
        if (capture) {
            pipeline = std::make_unique<obr::services::IngestPipeline>(store, *ingest_options);
            feed = std::make_unique<obr::infrastructure::KrakenFeedClient>(settings.feed);
            pipeline->attach(*feed);
            for (const auto& symbol : settings.feed.symbols) {
                feed->subscribe(symbol);
            }
        }
        if (replay) {
            sessions = std::make_unique<obr::services::ReplaySessionService>(store, *replay_options);
            http = std::make_unique<obr::infrastructure::ReplayHttpServer>(
                *sessions, settings.replay.host, settings.replay.http_port);
            ws = std::make_unique<obr::infrastructure::ReplayWebSocketServer>(
                *sessions, settings.replay.host, settings.replay.ws_port,
                static_cast<size_t>(settings.replay.max_send_buffer_kb) * 1024);
            http->start();
            ws->start();
        }
        if (capture) {
            pipeline->start();
            feed->start();
            std::cout << "[engine] Capturing " << settings.feed.symbols.size()
                      << " symbol(s) from " << settings.feed.url << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[engine] Startup failed: " << e.what() << std::endl;
        ix::uninitNetSystem();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::cout << "[engine] Started (mode=" << mode << ")" << std::endl;

    // Log-mode stats loop
    uint64_t last_accepted = 0;
    auto last_stats_time = std::chrono::steady_clock::now();

    while (running) {
        // Sleep in 1-second increments to allow clean shutdown
        for (int i = 0; i < settings.service.stats_interval_seconds && running; ++i) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        if (!running) break;

        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - last_stats_time).count();

        std::cout << "[stats]";
        if (pipeline) {
            auto stats = pipeline->stats();
            double events_per_sec = (elapsed > 0) ? (stats.accepted - last_accepted) / elapsed : 0;
            std::cout << " events/sec=" << static_cast<int>(events_per_sec)
                      << " stored=" << stats.stored
                      << " overflowed=" << stats.overflowed
                      << " malformed=" << stats.malformed
                      << " retries=" << stats.retries
                      << " dropped=" << (stats.dropped_transient + stats.dropped_permanent)
                      << " queue=" << pipeline->queue_depth();
            for (const auto& [symbol, count] : pipeline->symbol_counts()) {
                std::cout << " " << symbol << "=" << count;
            }
            last_accepted = stats.accepted;
        }
        if (ws) {
            std::cout << " replay_sessions=" << ws->active_sessions();
        }
        std::cout << std::endl;
        last_stats_time = now;
    }

    std::cout << "\n[engine] Shutting down..." << std::endl;
    if (feed) feed->stop();
    if (pipeline) pipeline->stop();
    if (ws) ws->stop();
    if (http) http->stop();

    if (pipeline) {
        auto stats = pipeline->stats();
        std::cout << "[engine] Done. Stored " << stats.stored << " of "
                  << stats.accepted << " accepted messages." << std::endl;
    }
    ws.reset();
    http.reset();
    sessions.reset();
    pipeline.reset();
    feed.reset();
    handle.reset();
    ix::uninitNetSystem();
    return 0;
}
