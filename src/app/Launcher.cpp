#include "app/Launcher.hpp"

#include "app/Application.hpp"
#include "core/types/Errors.hpp"
#include "infrastructure/ipc/InstanceLock.hpp"
#include "infrastructure/ipc/Mailbox.hpp"
#include "infrastructure/ipc/PathResolver.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace markflow::app {

Launcher::Launcher(LaunchOptions options, std::shared_ptr<core::IWindowHost> windowHost)
    : options_(std::move(options)), windowHost_(std::move(windowHost)) {}

LaunchOptions Launcher::parseArguments(const std::vector<std::string>& args) {
    LaunchOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "--status") {
            options.status = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--workdir") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("--workdir requires a directory");
            }
            options.workDir = std::filesystem::path(args[++i]);
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (options.file) {
            throw std::invalid_argument("Only one file can be opened per invocation");
        } else {
            options.file = arg;
        }
    }

    return options;
}

std::filesystem::path Launcher::defaultWorkDir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "markflow";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "markflow";
    }
    return std::filesystem::temp_directory_path() / "markflow";
}

std::filesystem::path Launcher::validateDocument(const std::string& file) {
    std::error_code ec;
    auto path = std::filesystem::absolute(file, ec);
    if (ec) {
        throw std::invalid_argument("Cannot resolve " + file + ": " + ec.message());
    }
    path = path.lexically_normal();

    if (!std::filesystem::is_regular_file(path, ec)) {
        throw std::invalid_argument("File does not exist: " + path.string());
    }
    if (!infra::PathResolver::isMarkdownFile(path)) {
        throw std::invalid_argument("Not a markdown file: " + path.string());
    }
    return path;
}

void Launcher::printUsage(std::ostream& out) {
    out << "Usage: markflow [--debug] [--workdir DIR] [--status] [FILE]\n"
        << "\n"
        << "Opens FILE (a .md document) in the running markflow instance,\n"
        << "starting one if none is running.\n"
        << "\n"
        << "  --debug          verbose console logging\n"
        << "  --workdir DIR    use DIR for the lock, mailbox, config and log\n"
        << "  --status         report whether an instance is running\n";
}

void Launcher::initializeConsoleLogging() const {
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("markflow", consoleSink);
    logger->set_level(options_.debug ? spdlog::level::debug : spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

spdlog::level::level_enum Launcher::consoleLevel(const infra::AppConfig& cfg) const {
    if (options_.debug) {
        return spdlog::level::debug;
    }
    return spdlog::level::from_str(cfg.logLevel);
}

int Launcher::run() {
    if (options_.help) {
        printUsage(std::cout);
        return 0;
    }

    initializeConsoleLogging();

    auto workDir = options_.workDir ? *options_.workDir : defaultWorkDir();
    infra::ConfigManager config(workDir);
    if (!config.load()) {
        spdlog::warn("Continuing with default configuration");
    }
    spdlog::default_logger()->set_level(consoleLevel(config.config()));
    const auto& cfg = config.config();

    auto lockPath = workDir / infra::InstanceLock::kFileName;
    if (options_.status) {
        return reportStatus(lockPath);
    }

    std::optional<std::filesystem::path> document;
    if (options_.file) {
        try {
            document = validateDocument(*options_.file);
        } catch (const std::invalid_argument& e) {
            std::cerr << "markflow: " << e.what() << std::endl;
            return 1;
        }
    }

    auto lock = std::make_unique<infra::InstanceLock>(lockPath);
    auto claim = lock->claim(std::chrono::milliseconds(cfg.ownerAddressWaitMs));
    if (claim.role == infra::InstanceLock::Role::Joiner) {
        return join(workDir, cfg, claim.ownerAddress, document);
    }
    if (claim.role == infra::InstanceLock::Role::Unresolved) {
        std::cerr << "markflow: running instance did not publish its address" << std::endl;
        return 1;
    }

    Application app(std::move(lock), config, windowHost_, consoleLevel(cfg));
    if (document) {
        app.mailbox().enqueue(document->string(),
                              std::chrono::milliseconds(cfg.enqueueTimeoutMs));
    }
    return app.run();
}

int Launcher::reportStatus(const std::filesystem::path& lockPath) const {
    if (!infra::InstanceLock::isHeld(lockPath)) {
        std::cout << "markflow is not running" << std::endl;
        return 0;
    }

    if (auto url = infra::InstanceLock::readOwnerAddress(lockPath)) {
        std::cout << "markflow is running at " << *url << std::endl;
    } else {
        std::cout << "markflow is starting" << std::endl;
    }
    return 0;
}

int Launcher::join(const std::filesystem::path& workDir, const infra::AppConfig& cfg,
                   const std::string& ownerUrl,
                   const std::optional<std::filesystem::path>& document) {
    if (document) {
        infra::Mailbox mailbox(workDir);
        try {
            mailbox.enqueue(document->string(), std::chrono::milliseconds(cfg.enqueueTimeoutMs));
        } catch (const core::MailboxTimeoutError& e) {
            spdlog::error("{}", e.what());
            std::cerr << "markflow: server busy/unreachable" << std::endl;
            return 1;
        }
        spdlog::info("Handed {} to the instance at {}", document->string(), ownerUrl);
        return 0;
    }

    windowHost_->showWindow(ownerUrl, Application::kWindowTitle);
    return 0;
}

} // namespace markflow::app
