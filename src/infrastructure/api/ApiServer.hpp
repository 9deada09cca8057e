#pragma once

#include "infrastructure/api/EventStreamSession.hpp"
#include "infrastructure/events/EventBroadcaster.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace markflow::infra {

/**
 * @brief HTTP method of a request. Every endpoint is read-only.
 */
enum class HttpMethod { GET, UNSUPPORTED };

/**
 * @brief Request line of an incoming API request. Headers and bodies are ignored.
 */
struct ApiRequest {
    HttpMethod method{HttpMethod::UNSUPPORTED}; ///< HTTP method of the request.
    std::string path;                           ///< Request path without the query string.
};

/**
 * @brief Represents an API response to send.
 */
struct ApiResponse {
    int statusCode{200};                        ///< HTTP status code.
    std::string statusText{"OK"};               ///< HTTP status text.
    std::string body;                           ///< Response body content.
    std::map<std::string, std::string> headers; ///< Response headers.

    /**
     * @brief Sets the response body as JSON.
     * @param json JSON object to serialize as body.
     */
    void setJson(const nlohmann::json& json);

    /**
     * @brief Sets an error response.
     * @param code HTTP status code for the error.
     * @param message Error message.
     */
    void setError(int code, const std::string& message);

    /**
     * @brief Converts the response to an HTTP response string.
     * @return Complete HTTP response string.
     */
    std::string toString() const;
};

/**
 * @brief Handler function type for route endpoints.
 */
using RouteHandler = std::function<void(const ApiRequest&, ApiResponse&)>;

/**
 * @brief Route definition for API endpoints.
 */
struct Route {
    HttpMethod method;   ///< HTTP method this route handles.
    std::string path;    ///< Exact request path.
    RouteHandler handler; ///< Handler function for this route.
};

/**
 * @brief Settings for the API server.
 */
struct ApiServerOptions {
    std::string bindAddress{"127.0.0.1"};                  ///< Loopback only.
    std::chrono::milliseconds keepaliveInterval{1000};     ///< Idle time before a ping frame.
    std::chrono::milliseconds deliveryInterval{100};       ///< Event stream poll interval.
    std::string version{"1.0.0"};                          ///< Reported by /api/health.
};

/**
 * @brief HTTP server of the owning instance.
 *
 * Serves the health endpoint and the `/events` push channel. Each push
 * connection is handed to an EventStreamSession and stays open until the
 * client disconnects or the server stops.
 *
 * @note This class is non-copyable and must be owned by a std::shared_ptr.
 */
class ApiServer : public std::enable_shared_from_this<ApiServer> {
public:
    static constexpr const char* kEventsPath = "/events";
    static constexpr const char* kHealthPath = "/api/health";

    /**
     * @brief Constructs an ApiServer.
     * @param asioContext Context that runs accept, request and stream handlers.
     * @param broadcaster Event source for push connections.
     * @param options Bind address, stream intervals and version string.
     */
    ApiServer(AsioContext& asioContext, std::shared_ptr<EventBroadcaster> broadcaster,
              ApiServerOptions options = {});

    /**
     * @brief Destructor. Stops the server if running.
     */
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    /**
     * @brief Binds the port and begins accepting connections.
     * @param port Port to listen on, usually from PortAllocator.
     * @throws core::StartupError if the port cannot be bound.
     */
    void start(uint16_t port);

    /**
     * @brief Stops accepting and closes all open event streams.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    uint16_t port() const { return port_; }

    /**
     * @brief Returns the base URL clients use, e.g. "http://127.0.0.1:5000/".
     */
    std::string baseUrl() const;

    /**
     * @brief Number of event streams that are still open.
     */
    size_t activeStreams() const;

private:
    void startAccept();
    void readRequest(std::shared_ptr<asio::ip::tcp::socket> socket);
    void processRequest(std::shared_ptr<asio::ip::tcp::socket> socket, const std::string& rawRequest);
    void sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket, const ApiResponse& response);
    void startEventStream(std::shared_ptr<asio::ip::tcp::socket> socket);

    static ApiRequest parseRequest(const std::string& rawRequest);

    void registerRoutes();
    void handleHealth(const ApiRequest& req, ApiResponse& res);

    AsioContext& asioContext_;
    std::shared_ptr<EventBroadcaster> broadcaster_;
    ApiServerOptions options_;
    uint16_t port_{0};
    std::atomic<bool> running_{false};
    std::chrono::steady_clock::time_point startedAt_;

    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::vector<Route> routes_;

    mutable std::mutex sessionsMutex_;
    std::vector<std::weak_ptr<EventStreamSession>> sessions_;
};

} // namespace markflow::infra
