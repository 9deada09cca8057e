#pragma once

#include "core/services/IEventBroadcaster.hpp"

#include <array>
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace markflow::infra {

/**
 * @brief One long-lived push-channel connection.
 *
 * Writes the event-stream response header, replays the broadcaster's queue
 * and then forwards newly published events in order. When nothing has been
 * written for the keepalive interval a ping frame is sent instead. A failed
 * write or a closed peer ends the session and unsubscribes it.
 *
 * All socket and timer work runs on one strand, so a session never blocks
 * other sessions or the publisher.
 */
class EventStreamSession : public std::enable_shared_from_this<EventStreamSession> {
public:
    /**
     * @brief Constructs a session for an accepted connection.
     * @param socket Connected socket whose request has already been read.
     * @param broadcaster Source of events.
     * @param keepaliveInterval Idle time after which a ping is sent.
     * @param deliveryInterval How often the session checks for new events.
     */
    EventStreamSession(std::shared_ptr<asio::ip::tcp::socket> socket,
                       std::shared_ptr<core::IEventBroadcaster> broadcaster,
                       std::chrono::milliseconds keepaliveInterval,
                       std::chrono::milliseconds deliveryInterval);

    ~EventStreamSession();

    EventStreamSession(const EventStreamSession&) = delete;
    EventStreamSession& operator=(const EventStreamSession&) = delete;

    /**
     * @brief Subscribes and starts streaming.
     */
    void start();

    /**
     * @brief Ends the session from any thread.
     */
    void close();

    bool isClosed() const { return closed_.load(); }

    static std::string responseHeader();

private:
    void pump();
    void write(std::string data);
    void scheduleNextPump();
    void watchForDisconnect();
    void finish(const std::string& reason);

    std::shared_ptr<asio::ip::tcp::socket> socket_;
    std::shared_ptr<core::IEventBroadcaster> broadcaster_;
    std::shared_ptr<core::Subscription> subscription_;
    asio::strand<asio::any_io_executor> strand_;
    asio::steady_timer timer_;
    std::chrono::milliseconds keepaliveInterval_;
    std::chrono::milliseconds deliveryInterval_;
    std::chrono::steady_clock::time_point lastSend_;
    std::array<char, 256> readBuffer_{};
    std::atomic<bool> closed_{false};
};

} // namespace markflow::infra
