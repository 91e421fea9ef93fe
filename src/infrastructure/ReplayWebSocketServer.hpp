#pragma once

#include "infrastructure/ReplayProtocol.hpp"
#include "infrastructure/SubscribeRequestHandler.hpp"
#include "services/IReplaySink.hpp"
#include "services/ReplaySessionService.hpp"

#include <ixwebsocket/IXWebSocketServer.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace obr::infrastructure {

// Holds a sender back while a connection's unsent backlog exceeds a limit.
class SendThrottle {
public:
    explicit SendThrottle(size_t max_buffered,
                          std::chrono::milliseconds poll = std::chrono::milliseconds(5));

    // Returns true once `buffered()` is within the limit. Returns false if
    // `open()` turns false or cancel() is called first.
    bool wait(const std::function<size_t()>& buffered, const std::function<bool()>& open);
    void cancel();

private:
    size_t max_buffered_;
    std::chrono::milliseconds poll_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_{false};
};

// Sends replay payloads to one client socket.
class WebSocketReplaySink : public obr::services::IReplaySink {
public:
    static constexpr size_t kDefaultMaxBuffered = 1 << 20;

    explicit WebSocketReplaySink(ix::WebSocket& ws, size_t max_buffered = kDefaultMaxBuffered)
        : ws_(ws), throttle_(max_buffered) {}

    bool send(const std::string& payload) override;
    void close(obr::services::StopReason reason, const std::string& detail) override;

    // Releases a send blocked on a slow client.
    void abort() { throttle_.cancel(); }

private:
    ix::WebSocket& ws_;
    SendThrottle throttle_;
};

/// WebSocket front: /ws?start_date=<iso>[&sequence=<n>]. The client sends a
/// subscribe frame, receives an acknowledgement, then the stored payloads.
/// Each session streams on its own thread and is cancelled when the client
/// disconnects.
class ReplayWebSocketServer {
public:
    ReplayWebSocketServer(const obr::services::ReplaySessionService& service,
                          const std::string& host, int port,
                          size_t max_send_buffer = WebSocketReplaySink::kDefaultMaxBuffered);
    ~ReplayWebSocketServer();

    void start();
    void stop();

    size_t active_sessions() const;

private:
    struct Session {
        StreamQuery query;
        bool subscribed{false};
        std::unique_ptr<WebSocketReplaySink> sink;
        std::unique_ptr<obr::services::ReplayStreamController> controller;
        std::thread worker;
    };

    void on_client_message(const std::shared_ptr<ix::ConnectionState>& state,
                           ix::WebSocket& ws, const ix::WebSocketMessagePtr& msg);
    void on_open(const std::string& id, ix::WebSocket& ws, const std::string& uri);
    void on_text(const std::string& id, ix::WebSocket& ws, const std::string& frame);
    void on_close(const std::string& id);
    static void shutdown_session(Session& session);
    static void reject(ix::WebSocket& ws, const std::string& reply);

    SubscribeRequestHandler subscribe_handler_;
    ix::WebSocketServer server_;
    int port_;
    size_t max_send_buffer_;
    bool running_{false};

    mutable std::mutex sessions_mutex_;
    std::map<std::string, std::unique_ptr<Session>> sessions_;
};

} // namespace obr::infrastructure
