#include <catch2/catch_test_macros.hpp>

#include "infrastructure/events/EventBroadcaster.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace markflow::infra;
using markflow::core::Event;

namespace {

Event numbered(int n) {
    auto name = "doc" + std::to_string(n) + ".md";
    return Event::openTab("http://127.0.0.1:5000/?file=/" + name, name, "/" + name, "");
}

std::string titleOf(const Event& event) {
    return event.payload["title"].get<std::string>();
}

} // namespace

TEST_CASE("EventBroadcaster construction", "[EventBroadcaster]") {
    SECTION("Default capacity is ten") {
        EventBroadcaster broadcaster;
        REQUIRE(broadcaster.capacity() == 10);
        REQUIRE(broadcaster.size() == 0);
        REQUIRE(broadcaster.nextSequence() == 1);
    }

    SECTION("Zero capacity is rejected") {
        REQUIRE_THROWS_AS(EventBroadcaster(0), std::invalid_argument);
    }
}

TEST_CASE("EventBroadcaster publish", "[EventBroadcaster]") {
    EventBroadcaster broadcaster(3);

    SECTION("Assigns consecutive sequence numbers from one") {
        REQUIRE(broadcaster.publish(numbered(1)) == 1);
        REQUIRE(broadcaster.publish(numbered(2)) == 2);
        REQUIRE(broadcaster.nextSequence() == 3);
    }

    SECTION("Stamps events without a timestamp") {
        Event event;
        broadcaster.publish(event);
        REQUIRE(broadcaster.snapshot().front().timestamp != std::chrono::system_clock::time_point{});
    }

    SECTION("Evicts the oldest beyond capacity") {
        for (int i = 1; i <= 5; ++i) {
            broadcaster.publish(numbered(i));
        }
        auto events = broadcaster.snapshot();
        REQUIRE(events.size() == 3);
        REQUIRE(titleOf(events[0]) == "doc3.md");
        REQUIRE(titleOf(events[2]) == "doc5.md");
        REQUIRE(events[0].sequence == 3);
    }

    SECTION("Publishing without subscribers never blocks") {
        for (int i = 0; i < 1000; ++i) {
            broadcaster.publish(numbered(i));
        }
        REQUIRE(broadcaster.size() == 3);
    }
}

TEST_CASE("EventBroadcaster replay to late subscribers", "[EventBroadcaster]") {
    SECTION("Fifteen events with capacity ten replay the last ten in order") {
        EventBroadcaster broadcaster(10);
        for (int i = 1; i <= 15; ++i) {
            broadcaster.publish(numbered(i));
        }

        auto subscription = broadcaster.subscribe();
        auto events = broadcaster.fetch(*subscription);

        REQUIRE(events.size() == 10);
        for (size_t i = 0; i < events.size(); ++i) {
            REQUIRE(titleOf(events[i]) == "doc" + std::to_string(i + 6) + ".md");
        }
        REQUIRE(subscription->missedEvents == 0);
    }

    SECTION("Subscriber on an empty queue only sees later events") {
        EventBroadcaster broadcaster;
        auto subscription = broadcaster.subscribe();
        REQUIRE(broadcaster.fetch(*subscription).empty());

        broadcaster.publish(numbered(1));
        auto events = broadcaster.fetch(*subscription);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].sequence == 1);
    }
}

TEST_CASE("EventBroadcaster subscribers", "[EventBroadcaster]") {
    EventBroadcaster broadcaster(4);

    SECTION("Each subscriber sees every event once in publish order") {
        auto a = broadcaster.subscribe();
        auto b = broadcaster.subscribe();
        REQUIRE(a->id != b->id);
        REQUIRE(broadcaster.subscriberCount() == 2);

        broadcaster.publish(numbered(1));
        broadcaster.publish(numbered(2));

        auto fromA = broadcaster.fetch(*a);
        REQUIRE(fromA.size() == 2);
        REQUIRE(broadcaster.fetch(*a).empty());

        broadcaster.publish(numbered(3));
        auto fromB = broadcaster.fetch(*b);
        REQUIRE(fromB.size() == 3);
        REQUIRE(fromB[0].sequence == 1);
        REQUIRE(fromB[2].sequence == 3);

        auto moreA = broadcaster.fetch(*a);
        REQUIRE(moreA.size() == 1);
        REQUIRE(moreA[0].sequence == 3);
    }

    SECTION("Slow subscriber skips evicted events and counts them") {
        auto slow = broadcaster.subscribe();
        for (int i = 1; i <= 7; ++i) {
            broadcaster.publish(numbered(i));
        }

        auto events = broadcaster.fetch(*slow);
        REQUIRE(events.size() == 4);
        REQUIRE(events.front().sequence == 4);
        REQUIRE(slow->missedEvents == 3);
    }

    SECTION("Unsubscribe is idempotent and stops delivery") {
        auto sub = broadcaster.subscribe();
        broadcaster.unsubscribe(sub);
        broadcaster.unsubscribe(sub);
        broadcaster.unsubscribe(nullptr);

        REQUIRE_FALSE(sub->active);
        REQUIRE(broadcaster.subscriberCount() == 0);

        broadcaster.publish(numbered(1));
        REQUIRE(broadcaster.fetch(*sub).empty());
    }
}

TEST_CASE("EventBroadcaster concurrent publish and fetch", "[EventBroadcaster]") {
    EventBroadcaster broadcaster(1000);
    auto subscription = broadcaster.subscribe();

    constexpr int kPublishers = 4;
    constexpr int kPerPublisher = 200;
    std::vector<std::thread> publishers;
    for (int p = 0; p < kPublishers; ++p) {
        publishers.emplace_back([&broadcaster, p]() {
            for (int i = 0; i < kPerPublisher; ++i) {
                broadcaster.publish(numbered(p * kPerPublisher + i));
            }
        });
    }

    std::vector<Event> received;
    while (received.size() < static_cast<size_t>(kPublishers * kPerPublisher)) {
        auto batch = broadcaster.fetch(*subscription);
        received.insert(received.end(), batch.begin(), batch.end());
        std::this_thread::yield();
    }
    for (auto& publisher : publishers) {
        publisher.join();
    }

    for (size_t i = 0; i < received.size(); ++i) {
        REQUIRE(received[i].sequence == i + 1);
    }
    REQUIRE(subscription->missedEvents == 0);
}
