#include "infrastructure/api/ApiServer.hpp"

#include "core/types/Errors.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <sstream>

namespace markflow::infra {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

} // namespace

void ApiResponse::setJson(const nlohmann::json& json) {
    body = json.dump();
    headers["Content-Type"] = "application/json";
}

void ApiResponse::setError(int code, const std::string& message) {
    statusCode = code;
    switch (code) {
    case 400:
        statusText = "Bad Request";
        break;
    case 404:
        statusText = "Not Found";
        break;
    case 405:
        statusText = "Method Not Allowed";
        break;
    case 500:
        statusText = "Internal Server Error";
        break;
    default:
        statusText = "Error";
    }
    nlohmann::json error;
    error["error"] = message;
    error["status"] = code;
    setJson(error);
}

std::string ApiResponse::toString() const {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << statusCode << " " << statusText << "\r\n";
    for (const auto& [key, value] : headers) {
        ss << key << ": " << value << "\r\n";
    }
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    ss << body;
    return ss.str();
}

ApiServer::ApiServer(AsioContext& asioContext, std::shared_ptr<EventBroadcaster> broadcaster,
                     ApiServerOptions options)
    : asioContext_(asioContext), broadcaster_(std::move(broadcaster)),
      options_(std::move(options)) {
    registerRoutes();
}

ApiServer::~ApiServer() {
    stop();
}

void ApiServer::registerRoutes() {
    routes_.push_back(
        {HttpMethod::GET, kHealthPath, [this](auto& req, auto& res) { handleHealth(req, res); }});
}

void ApiServer::start(uint16_t port) {
    if (running_.load()) {
        return;
    }

    try {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(options_.bindAddress), port);
        auto acceptor = std::make_unique<asio::ip::tcp::acceptor>(asioContext_.getContext());
        acceptor->open(endpoint.protocol());
        acceptor->set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor->bind(endpoint);
        acceptor->listen();

        acceptor_ = std::move(acceptor);
        port_ = acceptor_->local_endpoint().port();
    } catch (const std::system_error& e) {
        throw core::StartupError("Failed to listen on " + options_.bindAddress + ":" +
                                 std::to_string(port) + ": " + e.what());
    }

    startedAt_ = std::chrono::steady_clock::now();
    running_ = true;
    startAccept();
    spdlog::info("API server listening on {}", baseUrl());
}

void ApiServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (acceptor_) {
        asio::error_code ec;
        acceptor_->close(ec);
    }

    std::vector<std::shared_ptr<EventStreamSession>> open;
    {
        std::lock_guard lock(sessionsMutex_);
        for (auto& weak : sessions_) {
            if (auto session = weak.lock()) {
                open.push_back(std::move(session));
            }
        }
    }
    for (auto& session : open) {
        session->close();
    }

    spdlog::info("API server stopped ({} event streams closed)", open.size());
}

std::string ApiServer::baseUrl() const {
    return "http://" + options_.bindAddress + ":" + std::to_string(port_) + "/";
}

size_t ApiServer::activeStreams() const {
    std::lock_guard lock(sessionsMutex_);
    return static_cast<size_t>(std::count_if(sessions_.begin(), sessions_.end(), [](auto& weak) {
        auto session = weak.lock();
        return session && !session->isClosed();
    }));
}

void ApiServer::startAccept() {
    if (!running_.load()) {
        return;
    }

    auto socket = std::make_shared<asio::ip::tcp::socket>(asioContext_.getContext());
    auto self = shared_from_this();

    acceptor_->async_accept(*socket, [this, self, socket](const asio::error_code& ec) {
        if (!ec && running_.load()) {
            readRequest(socket);
        } else if (ec && ec != asio::error::operation_aborted) {
            spdlog::warn("Accept failed: {}", ec.message());
        }
        if (running_.load()) {
            startAccept();
        }
    });
}

void ApiServer::readRequest(std::shared_ptr<asio::ip::tcp::socket> socket) {
    auto buffer = std::make_shared<asio::streambuf>();
    auto self = shared_from_this();

    asio::async_read_until(
        *socket, *buffer, "\r\n\r\n",
        [this, self, socket, buffer](const asio::error_code& ec, std::size_t /*bytesTransferred*/) {
            if (ec) {
                return;
            }

            std::string headerData((std::istreambuf_iterator<char>(&*buffer)),
                                   std::istreambuf_iterator<char>());
            processRequest(socket, headerData);
        });
}

void ApiServer::processRequest(std::shared_ptr<asio::ip::tcp::socket> socket,
                               const std::string& rawRequest) {
    ApiRequest request = parseRequest(rawRequest);
    ApiResponse response;

    spdlog::debug("API request: {}{}", request.path,
                  request.method == HttpMethod::GET ? "" : " (unsupported method)");

    if (request.path == kEventsPath) {
        if (request.method == HttpMethod::GET) {
            startEventStream(socket);
            return;
        }
        response.setError(405, "Method not allowed");
        sendResponse(socket, response);
        return;
    }

    bool pathFound = false;
    for (auto& route : routes_) {
        if (route.path != request.path) {
            continue;
        }
        pathFound = true;
        if (route.method != request.method) {
            continue;
        }

        try {
            route.handler(request, response);
        } catch (const std::exception& e) {
            spdlog::error("API error: {}", e.what());
            response.setError(500, "Internal server error");
        }
        sendResponse(socket, response);
        return;
    }

    if (pathFound) {
        response.setError(405, "Method not allowed");
    } else {
        response.setError(404, "Endpoint not found");
    }
    sendResponse(socket, response);
}

void ApiServer::sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket,
                             const ApiResponse& response) {
    auto responseStr = std::make_shared<std::string>(response.toString());

    asio::async_write(*socket, asio::buffer(*responseStr),
                      [socket, responseStr](const asio::error_code& /*ec*/, std::size_t /*bytes*/) {
                          asio::error_code shutdownEc;
                          socket->shutdown(asio::ip::tcp::socket::shutdown_both, shutdownEc);
                      });
}

void ApiServer::startEventStream(std::shared_ptr<asio::ip::tcp::socket> socket) {
    auto session = std::make_shared<EventStreamSession>(
        std::move(socket), broadcaster_, options_.keepaliveInterval, options_.deliveryInterval);
    {
        std::lock_guard lock(sessionsMutex_);
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [](auto& weak) { return weak.expired(); }),
                        sessions_.end());
        sessions_.push_back(session);
    }
    session->start();
}

ApiRequest ApiServer::parseRequest(const std::string& rawRequest) {
    ApiRequest request;
    std::istringstream iss(rawRequest);
    std::string line;

    if (std::getline(iss, line)) {
        std::istringstream lineStream(trim(line));
        std::string method, path, version;
        lineStream >> method >> path >> version;

        request.method = (method == "GET") ? HttpMethod::GET : HttpMethod::UNSUPPORTED;
        request.path = path.substr(0, path.find('?'));
    }

    return request;
}

void ApiServer::handleHealth(const ApiRequest& /*req*/, ApiResponse& res) {
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                      std::chrono::steady_clock::now() - startedAt_)
                      .count();

    nlohmann::json j;
    j["status"] = "healthy";
    j["version"] = options_.version;
    j["url"] = baseUrl();
    j["uptime_s"] = uptime;
    j["subscribers"] = broadcaster_->subscriberCount();
    j["pending_events"] = broadcaster_->size();
    j["timestamp"] = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    res.setJson(j);
}

} // namespace markflow::infra
