#pragma once

#include "config/Settings.hpp"
#include "infrastructure/KrakenMessageParser.hpp"
#include "services/IFeedConnection.hpp"

#include <ixwebsocket/IXWebSocket.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace obr::infrastructure {

class KrakenFeedClient : public obr::services::IFeedConnection {
public:
    explicit KrakenFeedClient(const obr::config::FeedSettings& settings);
    ~KrakenFeedClient() override;

    void set_on_message(MessageCallback callback) override;
    void set_on_malformed(MalformedCallback callback) override;
    void subscribe(const std::string& symbol) override;
    void start() override;
    void stop() override;

    bool connected() const noexcept { return connected_; }

private:
    ix::WebSocket ws_;
    KrakenMessageParser parser_;
    int book_depth_;
    MessageCallback on_message_;
    MalformedCallback on_malformed_;
    std::vector<std::string> symbols_;
    std::atomic<bool> connected_{false};
    std::mutex callback_mutex_;

    void on_frame(const ix::WebSocketMessagePtr& msg);
    void send_subscribe();
};

} // namespace obr::infrastructure
