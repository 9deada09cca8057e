#include "infrastructure/api/EventStreamSession.hpp"

#include <spdlog/spdlog.h>

namespace markflow::infra {

EventStreamSession::EventStreamSession(std::shared_ptr<asio::ip::tcp::socket> socket,
                                       std::shared_ptr<core::IEventBroadcaster> broadcaster,
                                       std::chrono::milliseconds keepaliveInterval,
                                       std::chrono::milliseconds deliveryInterval)
    : socket_(std::move(socket)), broadcaster_(std::move(broadcaster)),
      strand_(asio::make_strand(socket_->get_executor())), timer_(strand_),
      keepaliveInterval_(keepaliveInterval), deliveryInterval_(deliveryInterval) {}

EventStreamSession::~EventStreamSession() {
    broadcaster_->unsubscribe(subscription_);
}

std::string EventStreamSession::responseHeader() {
    return "HTTP/1.1 200 OK\r\n"
           "Content-Type: text/event-stream\r\n"
           "Cache-Control: no-cache\r\n"
           "Connection: keep-alive\r\n"
           "Access-Control-Allow-Origin: *\r\n"
           "\r\n";
}

void EventStreamSession::start() {
    subscription_ = broadcaster_->subscribe();
    spdlog::debug("Event stream {} opened", subscription_->id);

    auto self = shared_from_this();
    asio::dispatch(strand_, [this, self]() {
        watchForDisconnect();
        write(responseHeader());
    });
}

void EventStreamSession::close() {
    auto self = shared_from_this();
    asio::post(strand_, [this, self]() { finish("server stopping"); });
}

void EventStreamSession::pump() {
    if (closed_.load()) {
        return;
    }

    std::string frames;
    for (const auto& event : broadcaster_->fetch(*subscription_)) {
        frames += event.toStreamFrame();
    }

    if (frames.empty() && std::chrono::steady_clock::now() - lastSend_ >= keepaliveInterval_) {
        frames = core::Event::ping().toStreamFrame();
    }

    if (frames.empty()) {
        scheduleNextPump();
        return;
    }

    write(std::move(frames));
}

void EventStreamSession::write(std::string data) {
    auto buffer = std::make_shared<std::string>(std::move(data));
    auto self = shared_from_this();

    asio::async_write(
        *socket_, asio::buffer(*buffer),
        asio::bind_executor(strand_, [this, self, buffer](const asio::error_code& ec,
                                                          std::size_t /*bytes*/) {
            if (ec) {
                finish("write failed: " + ec.message());
                return;
            }
            lastSend_ = std::chrono::steady_clock::now();
            pump();
        }));
}

void EventStreamSession::scheduleNextPump() {
    auto self = shared_from_this();
    timer_.expires_after(deliveryInterval_);
    timer_.async_wait([this, self](const asio::error_code& ec) {
        if (!ec) {
            pump();
        }
    });
}

void EventStreamSession::watchForDisconnect() {
    auto self = shared_from_this();
    socket_->async_read_some(
        asio::buffer(readBuffer_),
        asio::bind_executor(strand_, [this, self](const asio::error_code& ec,
                                                  std::size_t /*bytes*/) {
            if (ec) {
                finish("peer closed: " + ec.message());
                return;
            }
            // Clients have nothing to say on this channel; keep draining.
            watchForDisconnect();
        }));
}

void EventStreamSession::finish(const std::string& reason) {
    if (closed_.exchange(true)) {
        return;
    }

    broadcaster_->unsubscribe(subscription_);
    timer_.cancel();

    asio::error_code ec;
    socket_->shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_->close(ec);

    spdlog::debug("Event stream {} closed ({})", subscription_ ? subscription_->id : 0, reason);
}

} // namespace markflow::infra
