#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace markflow::infra {

/**
 * @brief Application configuration settings.
 *
 * Timing and sizing knobs for the single-instance coordination layer. All
 * durations are in milliseconds.
 */
struct AppConfig {
    // Server
    uint16_t preferredPort{5000};  ///< Port tried first by the owner.
    int portProbeAttempts{20};     ///< Ports probed before giving up.
    int startAttempts{3};          ///< Server start attempts before aborting.
    int workerThreads{2};          ///< Threads serving HTTP and event streams.

    // Mailbox
    int pollIntervalMs{500};           ///< Pause between mailbox drains.
    int errorBackoffMs{1000};          ///< Pause after a failed drain.
    int enqueueTimeoutMs{10000};       ///< Joiner wait for the mailbox lock.
    int drainTimeoutMs{1000};          ///< Owner wait for the mailbox lock.
    int recentLookupTimeoutMs{500};    ///< Budget for resolving recent:// entries.

    // Events
    int bufferCapacity{10};         ///< Events retained for replay.
    int keepaliveIntervalMs{1000};  ///< Idle time before a ping frame.
    int deliveryIntervalMs{100};    ///< Event stream poll interval.

    // Launcher
    int ownerAddressWaitMs{10000};  ///< Joiner wait for the owner's address.

    // Logging
    std::string logLevel{"info"};   ///< trace, debug, info, warn, error, critical or off.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Loads and saves `config.json` inside the working directory. Missing keys
 * keep their defaults; out-of-range values are replaced by the default and
 * reported with a warning.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified directory.
     * @param workDir Working directory; created if missing.
     */
    explicit ConfigManager(const std::filesystem::path& workDir);

    /**
     * @brief Loads configuration from disk.
     *
     * Writes a default file when none exists.
     * @return False if the file could not be read or parsed.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }

    const std::filesystem::path& workDir() const { return workDir_; }

    /**
     * @brief Returns the path of the owner's rotating log file.
     */
    std::filesystem::path logPath() const;

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path workDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace markflow::infra
