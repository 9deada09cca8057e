#pragma once

#include "core/services/IEventBroadcaster.hpp"

#include <atomic>
#include <deque>
#include <map>
#include <mutex>

namespace markflow::infra {

/**
 * @brief Bounded, ordered event buffer fanned out to live subscribers.
 *
 * Events carry consecutive sequence numbers and subscribers are plain
 * cursors into that sequence, so every subscriber sees events in publish
 * order regardless of when it connected. Once the buffer holds `capacity`
 * events the oldest is evicted; a subscriber that falls behind skips ahead
 * and counts what it missed. publish() only appends under a short lock and
 * never waits on subscribers.
 */
class EventBroadcaster : public core::IEventBroadcaster {
public:
    static constexpr size_t kDefaultCapacity = 10;

    /**
     * @brief Constructs a broadcaster.
     * @param capacity Maximum number of queued events (must be positive).
     * @throws std::invalid_argument if capacity is zero.
     */
    explicit EventBroadcaster(size_t capacity = kDefaultCapacity);

    uint64_t publish(core::Event event) override;
    std::shared_ptr<core::Subscription> subscribe() override;
    void unsubscribe(const std::shared_ptr<core::Subscription>& subscription) override;
    std::vector<core::Event> fetch(core::Subscription& subscription) override;

    /**
     * @brief Returns a copy of the events currently queued, oldest first.
     */
    std::vector<core::Event> snapshot() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t subscriberCount() const;

    /**
     * @brief Sequence number the next published event will receive.
     */
    uint64_t nextSequence() const;

private:
    size_t capacity_;
    std::deque<core::Event> events_;
    std::map<uint64_t, std::shared_ptr<core::Subscription>> subscribers_;
    uint64_t nextSequence_{1};
    std::atomic<uint64_t> nextSubscriberId_{1};
    mutable std::mutex mutex_;
};

} // namespace markflow::infra
