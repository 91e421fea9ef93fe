#include "infrastructure/ReplayHttpServer.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>

namespace obr::infrastructure {

namespace {

std::string path_of(const std::string& uri) {
    auto question = uri.find('?');
    return question == std::string::npos ? uri : uri.substr(0, question);
}

std::string reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        default: return "Internal Server Error";
    }
}

} // namespace

ReplayHttpServer::ReplayHttpServer(const obr::services::ReplaySessionService& service,
                                   const std::string& host, int port)
    : prepare_handler_(service)
    , server_(port, host)
    , port_(port) {
    server_.setOnConnectionCallback(
        [this](ix::HttpRequestPtr request,
               std::shared_ptr<ix::ConnectionState> /*state*/) -> ix::HttpResponsePtr {
            return on_request(request);
        });
}

ReplayHttpServer::~ReplayHttpServer() {
    stop();
}

void ReplayHttpServer::start() {
    auto [ok, error] = server_.listen();
    if (!ok) {
        throw std::runtime_error("HTTP server cannot listen on port "
                                 + std::to_string(port_) + ": " + error);
    }
    server_.start();
    running_ = true;
    std::cout << "[http] Listening on port " << port_
              << " (POST /replay/prepare, GET /health)\n";
}

void ReplayHttpServer::stop() {
    if (!running_) return;
    server_.stop();
    running_ = false;
}

HttpReply ReplayHttpServer::route(const std::string& method, const std::string& uri,
                                  const std::string& body) const {
    const std::string path = path_of(uri);
    if (method == "OPTIONS") {
        return HttpReply{204, ""};
    }
    if (path == "/replay/prepare") {
        if (method != "POST") {
            return HttpReply{405, nlohmann::json{{"error", "Method not allowed"}}.dump()};
        }
        return prepare_handler_.handle(body);
    }
    if (path == "/health" && method == "GET") {
        return HttpReply{200, nlohmann::json{{"status", "ok"}}.dump()};
    }
    return HttpReply{404, nlohmann::json{{"error", "Not found"}}.dump()};
}

ix::HttpResponsePtr ReplayHttpServer::on_request(const ix::HttpRequestPtr& request) const {
    auto result = route(request->method, request->uri, request->body);

    ix::WebSocketHttpHeaders headers;
    headers["Access-Control-Allow-Origin"] = "*";
    headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
    headers["Access-Control-Allow-Headers"] = "*";
    if (!result.body.empty()) {
        headers["Content-Type"] = "application/json";
    }

    return std::make_shared<ix::HttpResponse>(
        result.status, reason_phrase(result.status), ix::HttpErrorCode::Ok,
        headers, result.body);
}

} // namespace obr::infrastructure
