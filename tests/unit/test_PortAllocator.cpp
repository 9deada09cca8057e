#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/network/PortAllocator.hpp"

#include <asio.hpp>

using namespace markflow::infra;
using markflow::core::StartupError;

namespace {

// Listens on an ephemeral loopback port for the lifetime of the object.
class OccupiedPort {
public:
    OccupiedPort() : acceptor_(io_) {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), 0);
        acceptor_.open(endpoint.protocol());
        acceptor_.bind(endpoint);
        acceptor_.listen();
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

private:
    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
};

} // namespace

TEST_CASE("PortAllocator probing", "[PortAllocator]") {
    PortAllocator allocator;

    SECTION("Occupied port is not bindable") {
        OccupiedPort occupied;
        REQUIRE_FALSE(allocator.isBindable(occupied.port()));
    }

    SECTION("Preferred port is used when free") {
        uint16_t freePort = 0;
        {
            OccupiedPort probe;
            freePort = probe.port();
        }
        REQUIRE(allocator.isBindable(freePort));
        REQUIRE(allocator.allocate(freePort, 5) == freePort);
    }

    SECTION("Busy preferred port falls back to the dynamic range") {
        OccupiedPort occupied;
        auto port = allocator.allocate(occupied.port(), 20);

        REQUIRE(port != occupied.port());
        REQUIRE(port >= PortAllocator::kDynamicRangeFirst);
        REQUIRE(port <= PortAllocator::kDynamicRangeLast);
    }

    SECTION("Zero preferred port goes straight to the dynamic range") {
        auto port = allocator.allocate(0, 20);
        REQUIRE(port >= PortAllocator::kDynamicRangeFirst);
    }

    SECTION("Exhausted attempts raise a startup error") {
        OccupiedPort occupied;
        REQUIRE_THROWS_AS(allocator.allocate(occupied.port(), 0), StartupError);
    }
}

TEST_CASE("PortAllocator with an unusable address", "[PortAllocator]") {
    PortAllocator allocator("not-an-address");
    REQUIRE_FALSE(allocator.isBindable(5000));
    REQUIRE_THROWS_AS(allocator.allocate(5000, 2), StartupError);
}
