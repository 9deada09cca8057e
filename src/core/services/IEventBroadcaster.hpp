/**
 * @file IEventBroadcaster.hpp
 * @brief Interface for the bounded, ordered push-event buffer.
 *
 * This file defines the abstract interface the mailbox monitor publishes
 * into and the push channel subscribes to.
 */

#pragma once

#include "core/types/Event.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace markflow::core {

/**
 * @brief Cursor of one live subscriber into the pending event queue.
 *
 * Fields are maintained by the broadcaster; holders treat them as read-only.
 */
struct Subscription {
    uint64_t id{0};           ///< Unique subscriber identifier
    uint64_t nextSequence{1}; ///< Sequence number of the next event to deliver
    uint64_t missedEvents{0}; ///< Events evicted before this subscriber could read them
    bool active{true};        ///< False once unsubscribed
};

/**
 * @brief Interface for the event broadcaster.
 *
 * A single producer publishes; any number of subscribers read the same
 * sequence in publish order. The buffer is bounded and evicts the oldest
 * event when full, so delivery is best-effort rather than durable.
 */
class IEventBroadcaster {
public:
    virtual ~IEventBroadcaster() = default;

    /**
     * @brief Appends an event to the queue, evicting the oldest when full.
     * @param event Event to publish; its sequence field is overwritten.
     * @return Sequence number assigned to the event.
     */
    virtual uint64_t publish(Event event) = 0;

    /**
     * @brief Registers a new subscriber positioned at the oldest queued event.
     * @return The new subscription; its first fetch replays the current queue.
     */
    virtual std::shared_ptr<Subscription> subscribe() = 0;

    /**
     * @brief Removes a subscriber. Safe to call more than once.
     * @param subscription The subscription to remove.
     */
    virtual void unsubscribe(const std::shared_ptr<Subscription>& subscription) = 0;

    /**
     * @brief Returns all events the subscriber has not yet seen and advances its cursor.
     * @param subscription The subscriber's cursor.
     * @return Events in publish order; empty when caught up or unsubscribed.
     */
    virtual std::vector<Event> fetch(Subscription& subscription) = 0;
};

} // namespace markflow::core
