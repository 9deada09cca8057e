#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace markflow::infra {

/**
 * @brief Finds a free local TCP port for the owner's server.
 *
 * Probing binds and immediately closes a socket on the loopback address.
 * Another process can take the port between the probe and the real bind;
 * that race surfaces as a core::StartupError from the server's start() and
 * is retried by the caller.
 */
class PortAllocator {
public:
    static constexpr uint16_t kDynamicRangeFirst = 49152;
    static constexpr uint16_t kDynamicRangeLast = 65535;

    /**
     * @brief Constructs an allocator probing the given address.
     * @param bindAddress Address to probe on (default loopback).
     */
    explicit PortAllocator(std::string bindAddress = "127.0.0.1");

    /**
     * @brief Returns the first bindable port.
     *
     * Probes preferredPort first (skipped when 0), then up to maxAttempts
     * random ports from the dynamic range.
     *
     * @param preferredPort Port to try first, or 0 for none.
     * @param maxAttempts Number of random ports to try after the preferred one.
     * @return A port that was bindable at probe time.
     * @throws core::StartupError if no probed port is bindable.
     */
    uint16_t allocate(uint16_t preferredPort, int maxAttempts);

    /**
     * @brief Checks whether a port can be bound right now. Never blocks.
     */
    bool isBindable(uint16_t port) const;

private:
    std::string bindAddress_;
    std::mt19937 rng_;
};

} // namespace markflow::infra
