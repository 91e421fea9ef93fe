#include "infrastructure/ReplayWebSocketServer.hpp"

#include <iostream>
#include <stdexcept>

using obr::services::StopReason;

namespace obr::infrastructure {

SendThrottle::SendThrottle(size_t max_buffered, std::chrono::milliseconds poll)
    : max_buffered_(max_buffered)
    , poll_(poll) {}

bool SendThrottle::wait(const std::function<size_t()>& buffered,
                        const std::function<bool()>& open) {
    std::unique_lock lock(mutex_);
    while (!cancelled_) {
        if (!open()) return false;
        if (buffered() <= max_buffered_) return true;
        cv_.wait_for(lock, poll_, [this] { return cancelled_; });
    }
    return false;
}

void SendThrottle::cancel() {
    {
        std::lock_guard lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool WebSocketReplaySink::send(const std::string& payload) {
    bool writable = throttle_.wait(
        [this] { return ws_.bufferedAmount(); },
        [this] { return ws_.getReadyState() == ix::ReadyState::Open; });
    if (!writable) return false;
    return ws_.sendText(payload).success;
}

void WebSocketReplaySink::close(StopReason reason, const std::string& detail) {
    auto ending = session_ending(reason, detail);
    if (ending.error && !ws_.sendText(*ending.error).success) {
        std::cerr << "[ws] Could not deliver error to client: " << detail << "\n";
    }
    if (ending.close_connection) ws_.close();
}

ReplayWebSocketServer::ReplayWebSocketServer(const obr::services::ReplaySessionService& service,
                                             const std::string& host, int port,
                                             size_t max_send_buffer)
    : subscribe_handler_(service)
    , server_(port, host)
    , port_(port)
    , max_send_buffer_(max_send_buffer) {
    server_.setOnClientMessageCallback(
        [this](std::shared_ptr<ix::ConnectionState> state, ix::WebSocket& ws,
               const ix::WebSocketMessagePtr& msg) {
            on_client_message(state, ws, msg);
        });
}

ReplayWebSocketServer::~ReplayWebSocketServer() {
    stop();
}

void ReplayWebSocketServer::start() {
    auto [ok, error] = server_.listen();
    if (!ok) {
        throw std::runtime_error("WebSocket server cannot listen on port "
                                 + std::to_string(port_) + ": " + error);
    }
    server_.start();
    running_ = true;
    std::cout << "[ws] Listening on port " << port_ << " (/ws?start_date=...)\n";
}

void ReplayWebSocketServer::stop() {
    if (!running_) return;
    {
        std::lock_guard lock(sessions_mutex_);
        for (auto& [id, session] : sessions_) {
            if (session->controller) session->controller->cancel();
            if (session->sink) session->sink->abort();
        }
    }
    server_.stop();
    running_ = false;

    // Close callbacks normally reap sessions; collect whatever is left.
    std::map<std::string, std::unique_ptr<Session>> remaining;
    {
        std::lock_guard lock(sessions_mutex_);
        remaining.swap(sessions_);
    }
    for (auto& [id, session] : remaining) {
        shutdown_session(*session);
    }
}

size_t ReplayWebSocketServer::active_sessions() const {
    std::lock_guard lock(sessions_mutex_);
    return sessions_.size();
}

void ReplayWebSocketServer::on_client_message(const std::shared_ptr<ix::ConnectionState>& state,
                                              ix::WebSocket& ws,
                                              const ix::WebSocketMessagePtr& msg) {
    const std::string id = state->getId();
    switch (msg->type) {
        case ix::WebSocketMessageType::Open:
            on_open(id, ws, msg->openInfo.uri);
            break;
        case ix::WebSocketMessageType::Message:
            on_text(id, ws, msg->str);
            break;
        case ix::WebSocketMessageType::Close:
            on_close(id);
            break;
        case ix::WebSocketMessageType::Error:
            std::cerr << "[ws] " << id << " error: " << msg->errorInfo.reason << "\n";
            break;
        default:
            break;
    }
}

void ReplayWebSocketServer::on_open(const std::string& id, ix::WebSocket& ws,
                                    const std::string& uri) {
    auto session = std::make_unique<Session>();
    try {
        session->query = parse_stream_query(uri);
    } catch (const std::invalid_argument& e) {
        reject(ws, error_frame(e.what()));
        return;
    }
    std::cout << "[ws] " << id << " connected: " << uri << "\n";

    std::lock_guard lock(sessions_mutex_);
    sessions_[id] = std::move(session);
}

void ReplayWebSocketServer::on_text(const std::string& id, ix::WebSocket& ws,
                                    const std::string& frame) {
    StreamQuery query;
    {
        std::lock_guard lock(sessions_mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end() || it->second->subscribed) return;
        query = it->second->query;
    }

    // Attach reads the store, so it runs outside the sessions lock.
    auto sink = std::make_unique<WebSocketReplaySink>(ws, max_send_buffer_);
    auto outcome = subscribe_handler_.handle(query, frame, *sink);
    switch (outcome.action) {
        case SubscribeOutcome::Action::Ignore:
            return;
        case SubscribeOutcome::Action::Reject:
            {
                std::lock_guard lock(sessions_mutex_);
                if (auto it = sessions_.find(id); it != sessions_.end()) {
                    it->second->subscribed = true;
                }
            }
            reject(ws, outcome.reply);
            return;
        case SubscribeOutcome::Action::Stream:
            break;
    }

    std::lock_guard lock(sessions_mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || it->second->subscribed) return;   // server stopping
    auto& session = *it->second;
    session.subscribed = true;

    if (!ws.sendText(outcome.reply).success) {
        // The session still starts and ends with SinkClosed on its first send.
        std::cerr << "[ws] " << id << " could not send subscribe acknowledgement\n";
    }
    std::cout << "[ws] " << id << " replaying " << outcome.symbol << " from "
              << *query.start_date << "\n";

    session.sink = std::move(sink);
    session.controller = std::move(outcome.controller);
    auto* controller = session.controller.get();
    session.worker = std::thread([controller, id] {
        auto reason = controller->run();
        std::cout << "[ws] " << id << " finished after " << controller->emitted()
                  << " messages (" << obr::services::to_string(reason) << ")\n";
    });
}

void ReplayWebSocketServer::on_close(const std::string& id) {
    std::unique_ptr<Session> session;
    {
        std::lock_guard lock(sessions_mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return;
        session = std::move(it->second);
        sessions_.erase(it);
    }
    shutdown_session(*session);
    std::cout << "[ws] " << id << " disconnected\n";
}

void ReplayWebSocketServer::shutdown_session(Session& session) {
    if (session.controller) session.controller->cancel();
    if (session.sink) session.sink->abort();
    if (session.worker.joinable()) session.worker.join();
}

void ReplayWebSocketServer::reject(ix::WebSocket& ws, const std::string& reply) {
    if (!ws.sendText(reply).success) {
        std::cerr << "[ws] Could not deliver error to client: " << reply << "\n";
    }
    ws.close();
}

} // namespace obr::infrastructure
