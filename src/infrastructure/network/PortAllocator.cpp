#include "infrastructure/network/PortAllocator.hpp"

#include "core/types/Errors.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

namespace markflow::infra {

PortAllocator::PortAllocator(std::string bindAddress)
    : bindAddress_(std::move(bindAddress)), rng_(std::random_device{}()) {}

uint16_t PortAllocator::allocate(uint16_t preferredPort, int maxAttempts) {
    if (preferredPort != 0) {
        if (isBindable(preferredPort)) {
            spdlog::debug("Preferred port {} is free", preferredPort);
            return preferredPort;
        }
        spdlog::info("Preferred port {} is in use, probing dynamic range", preferredPort);
    }

    std::uniform_int_distribution<int> dist(kDynamicRangeFirst, kDynamicRangeLast);
    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        auto port = static_cast<uint16_t>(dist(rng_));
        if (isBindable(port)) {
            spdlog::debug("Found free port {} after {} attempts", port, attempt + 1);
            return port;
        }
    }

    throw core::StartupError("No bindable port found after " + std::to_string(maxAttempts) +
                             " attempts");
}

bool PortAllocator::isBindable(uint16_t port) const {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io);
    asio::error_code ec;

    auto address = asio::ip::make_address(bindAddress_, ec);
    if (ec) {
        spdlog::error("Invalid bind address {}: {}", bindAddress_, ec.message());
        return false;
    }

    asio::ip::tcp::endpoint endpoint(address, port);
    acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        return false;
    }
    acceptor.bind(endpoint, ec);
    bool bindable = !ec;

    asio::error_code closeEc;
    acceptor.close(closeEc);
    return bindable;
}

} // namespace markflow::infra
