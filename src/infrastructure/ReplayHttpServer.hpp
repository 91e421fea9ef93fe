#pragma once

#include "infrastructure/PrepareRequestHandler.hpp"

#include <ixwebsocket/IXHttpServer.h>

#include <string>

namespace obr::infrastructure {

// HTTP front: POST /replay/prepare, GET /health, CORS preflight.
class ReplayHttpServer {
public:
    ReplayHttpServer(const obr::services::ReplaySessionService& service,
                     const std::string& host, int port);
    ~ReplayHttpServer();

    // Throws std::runtime_error if the port cannot be bound.
    void start();
    void stop();

    // Routing without sockets, for tests and for the server callback.
    HttpReply route(const std::string& method, const std::string& uri,
                    const std::string& body) const;

private:
    ix::HttpResponsePtr on_request(const ix::HttpRequestPtr& request) const;

    PrepareRequestHandler prepare_handler_;
    ix::HttpServer server_;
    int port_;
    bool running_{false};
};

} // namespace obr::infrastructure
