#include "infrastructure/KrakenFeedClient.hpp"
#include "domain/Errors.hpp"

#include <iostream>

namespace obr::infrastructure {

KrakenFeedClient::KrakenFeedClient(const obr::config::FeedSettings& settings)
    : book_depth_(settings.book_depth) {
    ws_.setUrl(settings.url);
    ws_.setPingInterval(settings.ping_interval_seconds);

    ws_.setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
        on_frame(msg);
    });
}

KrakenFeedClient::~KrakenFeedClient() {
    ws_.stop();
}

void KrakenFeedClient::set_on_message(MessageCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_message_ = std::move(callback);
}

void KrakenFeedClient::set_on_malformed(MalformedCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_malformed_ = std::move(callback);
}

void KrakenFeedClient::subscribe(const std::string& symbol) {
    symbols_.push_back(symbol);
    if (connected_) {
        send_subscribe();
    }
}

void KrakenFeedClient::start() {
    ws_.start();
}

void KrakenFeedClient::stop() {
    ws_.stop();
}

void KrakenFeedClient::on_frame(const ix::WebSocketMessagePtr& msg) {
    switch (msg->type) {
        case ix::WebSocketMessageType::Open:
            connected_ = true;
            std::cout << "[feed] Connected to " << ws_.getUrl() << "\n";
            if (!symbols_.empty()) {
                send_subscribe();
            }
            break;

        case ix::WebSocketMessageType::Message: {
            std::lock_guard lock(callback_mutex_);
            try {
                auto message = parser_.parse(msg->str);
                if (message && on_message_) {
                    on_message_(*message);
                }
            } catch (const obr::domain::MalformedFeedMessage& e) {
                if (on_malformed_) on_malformed_(e.what());
            }
            break;
        }

        case ix::WebSocketMessageType::Close:
            connected_ = false;
            std::cout << "[feed] Disconnected (" << msg->closeInfo.code << " "
                      << msg->closeInfo.reason << ")\n";
            break;

        case ix::WebSocketMessageType::Error:
            std::cerr << "[feed] Connection error: " << msg->errorInfo.reason << "\n";
            break;

        default:
            break;
    }
}

void KrakenFeedClient::send_subscribe() {
    auto info = ws_.send(KrakenMessageParser::subscribe_request(symbols_, book_depth_));
    if (!info.success) {
        std::cerr << "[feed] Failed to send subscribe request\n";
    }
}

} // namespace obr::infrastructure
