#pragma once

#include "core/services/IWindowHost.hpp"
#include "infrastructure/api/ApiServer.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/events/EventBroadcaster.hpp"
#include "infrastructure/ipc/InstanceLock.hpp"
#include "infrastructure/ipc/Mailbox.hpp"
#include "infrastructure/ipc/MailboxMonitor.hpp"
#include "infrastructure/ipc/PathResolver.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <memory>
#include <optional>
#include <spdlog/common.h>
#include <string>

namespace markflow::app {

/**
 * @brief Lifecycle of the owning instance.
 *
 * Built only after the instance lock has been acquired. start() brings up
 * the API server and the mailbox monitor and publishes the server address;
 * shutdown() tears everything down in reverse order and releases the lock.
 * The destructor runs shutdown() so every exit path releases the lock.
 */
class Application {
public:
    static constexpr const char* kVersion = "1.0.0";
    static constexpr const char* kWindowTitle = "markflow";

    /**
     * @param lock Instance lock already held by this process.
     * @param config Loaded configuration; its directory is the working directory.
     * @param windowHost Host asked to show the editor once the server is up.
     * @param consoleLevel Level for the console sink; the log file always gets debug.
     */
    Application(std::unique_ptr<infra::InstanceLock> lock, const infra::ConfigManager& config,
                std::shared_ptr<core::IWindowHost> windowHost,
                spdlog::level::level_enum consoleLevel = spdlog::level::info);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Starts, blocks until SIGINT or SIGTERM, then shuts down.
     * @return Process exit code.
     * @throws core::StartupError if the server cannot be started.
     */
    int run();

    /**
     * @brief Starts contexts, server and monitor, then publishes the address.
     * @throws core::StartupError if no port could be bound.
     */
    void start();

    /**
     * @brief Blocks until a termination signal or requestShutdown().
     */
    void waitForShutdown();

    /**
     * @brief Makes waitForShutdown() return. Safe from any thread.
     */
    void requestShutdown();

    /**
     * @brief Stops monitor, server and contexts, then releases the lock.
     *
     * Idempotent.
     */
    void shutdown();

    std::string baseUrl() const;

    const infra::Mailbox& mailbox() const { return mailbox_; }
    infra::EventBroadcaster& broadcaster() { return *broadcaster_; }
    infra::ApiServer& apiServer() { return *apiServer_; }

private:
    void initializeLogging(spdlog::level::level_enum consoleLevel);
    void startServer();

    std::unique_ptr<infra::InstanceLock> lock_;
    const infra::ConfigManager& config_;
    std::shared_ptr<core::IWindowHost> windowHost_;

    infra::Mailbox mailbox_;
    infra::PathResolver resolver_;
    std::shared_ptr<infra::EventBroadcaster> broadcaster_;

    std::unique_ptr<infra::AsioContext> serverContext_;
    std::unique_ptr<infra::AsioContext> monitorContext_;
    std::shared_ptr<infra::ApiServer> apiServer_;
    std::unique_ptr<infra::MailboxMonitor> monitor_;

    asio::io_context signalContext_;
    std::optional<asio::signal_set> signals_;
    bool started_{false};
};

} // namespace markflow::app
