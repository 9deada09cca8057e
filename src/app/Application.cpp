#include "app/Application.hpp"

#include "core/types/Errors.hpp"
#include "infrastructure/network/PortAllocator.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <thread>

namespace markflow::app {

namespace {

constexpr auto kStreamCloseTimeout = std::chrono::milliseconds(500);

} // namespace

Application::Application(std::unique_ptr<infra::InstanceLock> lock,
                         const infra::ConfigManager& config,
                         std::shared_ptr<core::IWindowHost> windowHost,
                         spdlog::level::level_enum consoleLevel)
    : lock_(std::move(lock)), config_(config), windowHost_(std::move(windowHost)),
      mailbox_(config.workDir()),
      resolver_(std::make_shared<infra::XbelRecentDocuments>(
                    infra::XbelRecentDocuments::defaultPath()),
                std::chrono::milliseconds(config.config().recentLookupTimeoutMs)),
      broadcaster_(std::make_shared<infra::EventBroadcaster>(
          static_cast<size_t>(config.config().bufferCapacity))) {
    if (!lock_ || !lock_->isOwner()) {
        throw core::StartupError("Application requires the held instance lock");
    }

    initializeLogging(consoleLevel);

    const auto& cfg = config_.config();
    serverContext_ = std::make_unique<infra::AsioContext>(
        "server", static_cast<size_t>(cfg.workerThreads));
    monitorContext_ = std::make_unique<infra::AsioContext>("monitor", 1);

    infra::ApiServerOptions serverOptions;
    serverOptions.keepaliveInterval = std::chrono::milliseconds(cfg.keepaliveIntervalMs);
    serverOptions.deliveryInterval = std::chrono::milliseconds(cfg.deliveryIntervalMs);
    serverOptions.version = kVersion;
    apiServer_ = std::make_shared<infra::ApiServer>(*serverContext_, broadcaster_, serverOptions);
}

Application::~Application() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        spdlog::error("Error during shutdown: {}", e.what());
    }
}

void Application::initializeLogging(spdlog::level::level_enum consoleLevel) {
    auto logPath = config_.logPath();

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(consoleLevel);

    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(),
                                                                           5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("markflow", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("markflow {} starting as server owner", kVersion);
    spdlog::info("Log file: {}", logPath.string());
}

void Application::start() {
    if (started_) {
        return;
    }
    started_ = true;

    signals_.emplace(signalContext_, SIGINT, SIGTERM);
    signals_->async_wait([](const asio::error_code& ec, int signo) {
        if (!ec) {
            spdlog::info("Received signal {}, shutting down", signo);
        }
    });

    serverContext_->start();
    monitorContext_->start();

    startServer();

    const auto& cfg = config_.config();
    infra::MailboxMonitorOptions monitorOptions;
    monitorOptions.pollInterval = std::chrono::milliseconds(cfg.pollIntervalMs);
    monitorOptions.errorBackoff = std::chrono::milliseconds(cfg.errorBackoffMs);
    monitorOptions.drainTimeout = std::chrono::milliseconds(cfg.drainTimeoutMs);
    monitor_ = std::make_unique<infra::MailboxMonitor>(*monitorContext_, mailbox_, resolver_,
                                                       broadcaster_, apiServer_->baseUrl(),
                                                       monitorOptions);
    monitor_->start();

    lock_->publishAddress(apiServer_->baseUrl());
    windowHost_->showWindow(apiServer_->baseUrl(), kWindowTitle);

    spdlog::info("Application components initialized");
}

void Application::startServer() {
    const auto& cfg = config_.config();
    infra::PortAllocator allocator;

    for (int attempt = 1;; ++attempt) {
        // Only the first attempt honours the preferred port.
        uint16_t preferred = attempt == 1 ? cfg.preferredPort : 0;
        try {
            auto port = allocator.allocate(preferred, cfg.portProbeAttempts);
            apiServer_->start(port);
            return;
        } catch (const core::StartupError& e) {
            if (attempt >= cfg.startAttempts) {
                throw;
            }
            spdlog::warn("Server start attempt {}/{} failed: {}", attempt, cfg.startAttempts,
                         e.what());
        }
    }
}

void Application::waitForShutdown() {
    signalContext_.run();
    signalContext_.restart();
}

void Application::requestShutdown() {
    signalContext_.stop();
}

void Application::shutdown() {
    if (!started_) {
        if (lock_) {
            lock_->release();
        }
        return;
    }
    started_ = false;

    spdlog::info("Application shutting down...");

    if (signals_) {
        asio::error_code ec;
        signals_->cancel(ec);
        signals_.reset();
    }

    if (monitor_) {
        monitor_->stop();
    }
    if (apiServer_) {
        apiServer_->stop();
        // Let the server context run the posted session closes before it stops.
        auto deadline = std::chrono::steady_clock::now() + kStreamCloseTimeout;
        while (apiServer_->activeStreams() > 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    serverContext_->stop();
    monitorContext_->stop();

    lock_->release();
}

std::string Application::baseUrl() const {
    return apiServer_->baseUrl();
}

int Application::run() {
    start();
    waitForShutdown();
    shutdown();
    return 0;
}

} // namespace markflow::app
