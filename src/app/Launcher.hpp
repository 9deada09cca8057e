#pragma once

#include "core/services/IWindowHost.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/common.h>

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace markflow::app {

/**
 * @brief Parsed command line.
 */
struct LaunchOptions {
    bool debug{false};                              ///< Verbose console logging.
    bool status{false};                             ///< Report the running instance and exit.
    bool help{false};                               ///< Print usage and exit.
    std::optional<std::filesystem::path> workDir;   ///< Overrides the default working directory.
    std::optional<std::string> file;                ///< Document to open.
};

/**
 * @brief Entry point logic shared by every invocation.
 *
 * Decides whether this process becomes the owner or joins a running one.
 * A joiner hands its document to the owner through the mailbox, or shows
 * the owner's window when no document was given, and exits.
 */
class Launcher {
public:
    Launcher(LaunchOptions options, std::shared_ptr<core::IWindowHost> windowHost);

    /**
     * @brief Runs the invocation to completion.
     * @return Process exit code.
     * @throws core::StartupError if the owner cannot start.
     */
    int run();

    /**
     * @brief Parses `[--debug] [--workdir DIR] [--status] [FILE]`.
     * @throws std::invalid_argument on unknown options or extra arguments.
     */
    static LaunchOptions parseArguments(const std::vector<std::string>& args);

    /**
     * @brief Per-user data directory for markflow.
     *
     * `$XDG_DATA_HOME/markflow`, else `$HOME/.local/share/markflow`, else a
     * directory under the system temp directory.
     */
    static std::filesystem::path defaultWorkDir();

    /**
     * @brief Checks that a command line document exists and is markdown.
     * @return Absolute, normalized path.
     * @throws std::invalid_argument if the document is not acceptable.
     */
    static std::filesystem::path validateDocument(const std::string& file);

    static void printUsage(std::ostream& out);

private:
    int reportStatus(const std::filesystem::path& lockPath) const;
    int join(const std::filesystem::path& workDir, const infra::AppConfig& cfg,
             const std::string& ownerUrl, const std::optional<std::filesystem::path>& document);
    void initializeConsoleLogging() const;
    spdlog::level::level_enum consoleLevel(const infra::AppConfig& cfg) const;

    LaunchOptions options_;
    std::shared_ptr<core::IWindowHost> windowHost_;
};

} // namespace markflow::app
