#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <limits>

namespace markflow::infra {

namespace {

int positiveOr(const nlohmann::json& section, const char* group, const char* key, int fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    const auto& value = section[key];
    if (!value.is_number_integer() || value.get<int64_t>() <= 0 ||
        value.get<int64_t>() > std::numeric_limits<int>::max()) {
        spdlog::warn("Invalid config value {}.{} = {}, using default {}", group, key,
                     value.dump(), fallback);
        return fallback;
    }
    return value.get<int>();
}

bool isKnownLevel(const std::string& level) {
    static const std::array<const char*, 7> levels{"trace", "debug", "info",    "warn",
                                                   "error", "critical", "off"};
    for (const auto* known : levels) {
        if (level == known) {
            return true;
        }
    }
    return false;
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& workDir) : workDir_(workDir) {
    if (!std::filesystem::exists(workDir_)) {
        std::filesystem::create_directories(workDir_);
    }

    configPath_ = workDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::debug("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

std::filesystem::path ConfigManager::logPath() const {
    return workDir_ / "markflow.log";
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Server
    j["server"]["preferred_port"] = config_.preferredPort;
    j["server"]["port_probe_attempts"] = config_.portProbeAttempts;
    j["server"]["start_attempts"] = config_.startAttempts;
    j["server"]["worker_threads"] = config_.workerThreads;

    // Mailbox
    j["mailbox"]["poll_interval_ms"] = config_.pollIntervalMs;
    j["mailbox"]["error_backoff_ms"] = config_.errorBackoffMs;
    j["mailbox"]["enqueue_timeout_ms"] = config_.enqueueTimeoutMs;
    j["mailbox"]["drain_timeout_ms"] = config_.drainTimeoutMs;
    j["mailbox"]["recent_lookup_timeout_ms"] = config_.recentLookupTimeoutMs;

    // Events
    j["events"]["buffer_capacity"] = config_.bufferCapacity;
    j["events"]["keepalive_interval_ms"] = config_.keepaliveIntervalMs;
    j["events"]["delivery_interval_ms"] = config_.deliveryIntervalMs;

    // Launcher
    j["launcher"]["owner_address_wait_ms"] = config_.ownerAddressWaitMs;

    // Logging
    j["logging"]["level"] = config_.logLevel;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    const AppConfig defaults;

    // Server
    if (j.contains("server")) {
        const auto& s = j["server"];
        int port = positiveOr(s, "server", "preferred_port", defaults.preferredPort);
        if (port > std::numeric_limits<uint16_t>::max()) {
            spdlog::warn("Invalid config value server.preferred_port = {}, using default {}",
                         port, defaults.preferredPort);
            port = defaults.preferredPort;
        }
        config_.preferredPort = static_cast<uint16_t>(port);
        config_.portProbeAttempts =
            positiveOr(s, "server", "port_probe_attempts", defaults.portProbeAttempts);
        config_.startAttempts = positiveOr(s, "server", "start_attempts", defaults.startAttempts);
        config_.workerThreads = positiveOr(s, "server", "worker_threads", defaults.workerThreads);
    }

    // Mailbox
    if (j.contains("mailbox")) {
        const auto& m = j["mailbox"];
        config_.pollIntervalMs = positiveOr(m, "mailbox", "poll_interval_ms", defaults.pollIntervalMs);
        config_.errorBackoffMs = positiveOr(m, "mailbox", "error_backoff_ms", defaults.errorBackoffMs);
        config_.enqueueTimeoutMs =
            positiveOr(m, "mailbox", "enqueue_timeout_ms", defaults.enqueueTimeoutMs);
        config_.drainTimeoutMs = positiveOr(m, "mailbox", "drain_timeout_ms", defaults.drainTimeoutMs);
        config_.recentLookupTimeoutMs =
            positiveOr(m, "mailbox", "recent_lookup_timeout_ms", defaults.recentLookupTimeoutMs);
    }

    // Events
    if (j.contains("events")) {
        const auto& e = j["events"];
        config_.bufferCapacity = positiveOr(e, "events", "buffer_capacity", defaults.bufferCapacity);
        config_.keepaliveIntervalMs =
            positiveOr(e, "events", "keepalive_interval_ms", defaults.keepaliveIntervalMs);
        config_.deliveryIntervalMs =
            positiveOr(e, "events", "delivery_interval_ms", defaults.deliveryIntervalMs);
    }

    // Launcher
    if (j.contains("launcher")) {
        config_.ownerAddressWaitMs = positiveOr(j["launcher"], "launcher", "owner_address_wait_ms",
                                                defaults.ownerAddressWaitMs);
    }

    // Logging
    if (j.contains("logging") && j["logging"].contains("level")) {
        const auto& level = j["logging"]["level"];
        if (!level.is_string() || !isKnownLevel(level.get<std::string>())) {
            spdlog::warn("Invalid config value logging.level = {}, using default {}",
                         level.dump(), defaults.logLevel);
            config_.logLevel = defaults.logLevel;
        } else {
            config_.logLevel = level.get<std::string>();
        }
    }
}

} // namespace markflow::infra
