#include "infrastructure/events/EventBroadcaster.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace markflow::infra {

EventBroadcaster::EventBroadcaster(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Event buffer capacity must be positive");
    }
}

uint64_t EventBroadcaster::publish(core::Event event) {
    std::lock_guard lock(mutex_);

    event.sequence = nextSequence_++;
    if (event.timestamp == std::chrono::system_clock::time_point{}) {
        event.timestamp = std::chrono::system_clock::now();
    }

    events_.push_back(std::move(event));
    while (events_.size() > capacity_) {
        events_.pop_front();
    }

    spdlog::debug("Published {} event #{} to {} subscribers", events_.back().typeToString(),
                  events_.back().sequence, subscribers_.size());
    return events_.back().sequence;
}

std::shared_ptr<core::Subscription> EventBroadcaster::subscribe() {
    std::lock_guard lock(mutex_);

    auto subscription = std::make_shared<core::Subscription>();
    subscription->id = nextSubscriberId_++;
    subscription->nextSequence = events_.empty() ? nextSequence_ : events_.front().sequence;
    subscribers_[subscription->id] = subscription;

    spdlog::debug("Subscriber {} connected, replaying {} events", subscription->id,
                  events_.size());
    return subscription;
}

void EventBroadcaster::unsubscribe(const std::shared_ptr<core::Subscription>& subscription) {
    if (!subscription) {
        return;
    }

    std::lock_guard lock(mutex_);
    if (!subscription->active) {
        return;
    }

    subscription->active = false;
    subscribers_.erase(subscription->id);
    spdlog::debug("Subscriber {} disconnected", subscription->id);
}

std::vector<core::Event> EventBroadcaster::fetch(core::Subscription& subscription) {
    std::lock_guard lock(mutex_);

    std::vector<core::Event> out;
    if (!subscription.active || events_.empty()) {
        return out;
    }

    uint64_t oldest = events_.front().sequence;
    if (subscription.nextSequence < oldest) {
        subscription.missedEvents += oldest - subscription.nextSequence;
        spdlog::debug("Subscriber {} missed {} evicted events", subscription.id,
                      oldest - subscription.nextSequence);
        subscription.nextSequence = oldest;
    }

    // Queued sequence numbers are consecutive, so the cursor maps to an index.
    for (size_t i = static_cast<size_t>(subscription.nextSequence - oldest); i < events_.size();
         ++i) {
        out.push_back(events_[i]);
    }
    subscription.nextSequence = nextSequence_;
    return out;
}

std::vector<core::Event> EventBroadcaster::snapshot() const {
    std::lock_guard lock(mutex_);
    return {events_.begin(), events_.end()};
}

size_t EventBroadcaster::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

size_t EventBroadcaster::subscriberCount() const {
    std::lock_guard lock(mutex_);
    return subscribers_.size();
}

uint64_t EventBroadcaster::nextSequence() const {
    std::lock_guard lock(mutex_);
    return nextSequence_;
}

} // namespace markflow::infra
