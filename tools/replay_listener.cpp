#include <ixwebsocket/IXHttpClient.h>
#include <ixwebsocket/IXNetSystem.h>
#include <ixwebsocket/IXWebSocket.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

static std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

std::string url_encode(const std::string& str) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == ':') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: replay_listener <date> <symbol>" << std::endl;
        std::cerr << "       e.g. replay_listener 2025-11-08T17:50:00Z BTC/USD" << std::endl;
        return 1;
    }
    const std::string date = argv[1];
    const std::string symbol = argv[2];
    const std::string host = env_or("OBR_REPLAY_HOST", "localhost");
    const std::string http_port = env_or("OBR_HTTP_PORT", "8080");
    const std::string ws_port = env_or("OBR_WS_PORT", "8081");

    ix::initNetSystem();

    // Step 1: prepare
    ix::HttpClient http;
    auto args = http.createRequest();
    args->extraHeaders["Content-Type"] = "application/json";
    nlohmann::json body = {{"date", date}, {"symbol", symbol}};
    auto response = http.post("http://" + host + ":" + http_port + "/replay/prepare",
                              body.dump(), args);

    std::cout << "[prepare] " << response->statusCode << " " << response->body << std::endl;
    if (response->statusCode != 200) {
        ix::uninitNetSystem();
        return 1;
    }
    auto prepared = nlohmann::json::parse(response->body, nullptr, false);
    if (prepared.is_discarded() || !prepared.contains("replay_start_timestamp")) {
        std::cerr << "[prepare] Unexpected response" << std::endl;
        ix::uninitNetSystem();
        return 1;
    }

    std::string url = "ws://" + host + ":" + ws_port + "/ws?start_date="
        + url_encode(prepared["replay_start_timestamp"].get<std::string>());
    if (prepared.contains("replay_start_sequence")) {
        url += "&sequence=" + std::to_string(prepared["replay_start_sequence"].get<uint64_t>());
    }

    // Step 2: attach and print every frame
    ix::WebSocket ws;
    ws.setUrl(url);
    ws.disableAutomaticReconnection();

    std::atomic<uint64_t> frames{0};
    ws.setOnMessageCallback([&](const ix::WebSocketMessagePtr& msg) {
        switch (msg->type) {
            case ix::WebSocketMessageType::Open: {
                std::cout << "[connected] " << url << std::endl;
                nlohmann::json subscribe = {
                    {"method", "subscribe"},
                    {"params", {{"channel", "book"}, {"symbol", nlohmann::json::array({symbol})}}},
                };
                if (!ws.send(subscribe.dump()).success) {
                    std::cerr << "[error] Could not send subscribe" << std::endl;
                }
                break;
            }

            case ix::WebSocketMessageType::Message:
                ++frames;
                std::cout << msg->str << "\n" << std::endl;
                break;

            case ix::WebSocketMessageType::Error:
                std::cerr << "[error] " << msg->errorInfo.reason << std::endl;
                running = false;
                break;

            case ix::WebSocketMessageType::Close:
                std::cout << "[disconnected] " << msg->closeInfo.reason << std::endl;
                running = false;
                break;

            default:
                break;
        }
    });

    std::signal(SIGINT, signal_handler);

    ws.start();
    std::cout << "Listening... (Ctrl+C to quit)" << std::endl;

    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    ws.stop();
    ix::uninitNetSystem();
    std::cout << "\nDone. Received " << frames.load() << " frames." << std::endl;
    return 0;
}
