#include <catch2/catch_test_macros.hpp>

#include "RecordingWindowHost.hpp"
#include "TestSupport.hpp"
#include "app/ConsoleWindowHost.hpp"
#include "app/Launcher.hpp"
#include "infrastructure/ipc/FileLock.hpp"
#include "infrastructure/ipc/InstanceLock.hpp"
#include "infrastructure/ipc/Mailbox.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

using namespace markflow;
using markflow::testing::RecordingWindowHost;
using markflow::testing::TempWorkDir;

namespace {

// Restores an environment variable on scope exit.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = old;
        }
        if (value) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (old_) {
            ::setenv(name_.c_str(), old_->c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::optional<std::string> old_;
};

app::LaunchOptions optionsFor(const std::filesystem::path& workDir,
                              std::optional<std::string> file = std::nullopt) {
    app::LaunchOptions options;
    options.workDir = workDir;
    options.file = std::move(file);
    return options;
}

void writeShortTimeouts(const std::filesystem::path& workDir) {
    std::ofstream file(workDir / "config.json");
    file << R"({"mailbox": {"enqueue_timeout_ms": 100},
               "launcher": {"owner_address_wait_ms": 200}})";
}

} // namespace

TEST_CASE("Launcher argument parsing", "[Launcher]") {
    SECTION("No arguments") {
        auto options = app::Launcher::parseArguments({});
        REQUIRE_FALSE(options.debug);
        REQUIRE_FALSE(options.status);
        REQUIRE_FALSE(options.file.has_value());
        REQUIRE_FALSE(options.workDir.has_value());
    }

    SECTION("All options") {
        auto options =
            app::Launcher::parseArguments({"--debug", "--workdir", "/tmp/mf", "--status", "a.md"});
        REQUIRE(options.debug);
        REQUIRE(options.status);
        REQUIRE(options.workDir == std::filesystem::path("/tmp/mf"));
        REQUIRE(options.file == std::string("a.md"));
    }

    SECTION("Help") {
        REQUIRE(app::Launcher::parseArguments({"--help"}).help);
        REQUIRE(app::Launcher::parseArguments({"-h"}).help);
    }

    SECTION("Errors") {
        REQUIRE_THROWS_AS(app::Launcher::parseArguments({"--workdir"}), std::invalid_argument);
        REQUIRE_THROWS_AS(app::Launcher::parseArguments({"--bogus"}), std::invalid_argument);
        REQUIRE_THROWS_AS(app::Launcher::parseArguments({"a.md", "b.md"}), std::invalid_argument);
    }
}

TEST_CASE("Launcher default working directory", "[Launcher]") {
    SECTION("XDG_DATA_HOME wins") {
        ScopedEnv xdg("XDG_DATA_HOME", "/xdg/data");
        REQUIRE(app::Launcher::defaultWorkDir() == std::filesystem::path("/xdg/data/markflow"));
    }

    SECTION("Falls back to HOME") {
        ScopedEnv xdg("XDG_DATA_HOME", nullptr);
        ScopedEnv home("HOME", "/home/someone");
        REQUIRE(app::Launcher::defaultWorkDir() ==
                std::filesystem::path("/home/someone/.local/share/markflow"));
    }

    SECTION("Falls back to the temp directory") {
        ScopedEnv xdg("XDG_DATA_HOME", nullptr);
        ScopedEnv home("HOME", nullptr);
        REQUIRE(app::Launcher::defaultWorkDir() ==
                std::filesystem::temp_directory_path() / "markflow");
    }
}

TEST_CASE("Launcher document validation", "[Launcher]") {
    TempWorkDir dir;

    SECTION("Existing markdown file is normalized") {
        auto file = dir.writeFile("notes.md", "x");
        auto indirect = dir.path() / "." / "sub" / ".." / "notes.md";
        std::filesystem::create_directories(dir.path() / "sub");
        REQUIRE(app::Launcher::validateDocument(indirect.string()) == file);
    }

    SECTION("Missing or non-markdown files are rejected") {
        auto txt = dir.writeFile("notes.txt", "x");
        REQUIRE_THROWS_AS(app::Launcher::validateDocument(txt.string()), std::invalid_argument);
        REQUIRE_THROWS_AS(app::Launcher::validateDocument((dir.path() / "gone.md").string()),
                          std::invalid_argument);
    }
}

TEST_CASE("Launcher status and validation exits", "[Launcher]") {
    TempWorkDir dir;
    auto host = std::make_shared<RecordingWindowHost>();

    SECTION("Status with no running instance") {
        auto options = optionsFor(dir.path());
        options.status = true;
        REQUIRE(app::Launcher(options, host).run() == 0);
    }

    SECTION("Status with a running instance") {
        infra::InstanceLock owner(dir.path() / infra::InstanceLock::kFileName);
        REQUIRE(owner.tryBecomeOwner());
        owner.publishAddress("http://127.0.0.1:5000/");

        auto options = optionsFor(dir.path());
        options.status = true;
        REQUIRE(app::Launcher(options, host).run() == 0);
        REQUIRE(owner.isOwner());
    }

    SECTION("Help exits cleanly") {
        app::LaunchOptions options;
        options.help = true;
        REQUIRE(app::Launcher(options, host).run() == 0);
    }

    SECTION("Invalid document exits with an error before touching the lock") {
        auto txt = dir.writeFile("notes.txt", "x");
        REQUIRE(app::Launcher(optionsFor(dir.path(), txt.string()), host).run() == 1);
        REQUIRE_FALSE(infra::InstanceLock::isHeld(dir.path() / infra::InstanceLock::kFileName));
    }
}

TEST_CASE("Launcher join path", "[Launcher]") {
    TempWorkDir dir;
    writeShortTimeouts(dir.path());
    auto host = std::make_shared<RecordingWindowHost>();

    infra::InstanceLock owner(dir.path() / infra::InstanceLock::kFileName);
    REQUIRE(owner.tryBecomeOwner());

    SECTION("Document is handed over through the mailbox") {
        owner.publishAddress("http://127.0.0.1:5000/");
        auto file = dir.writeFile("notes.md", "x");
        REQUIRE(app::Launcher(optionsFor(dir.path(), file.string()), host).run() == 0);

        infra::Mailbox mailbox(dir.path());
        REQUIRE(mailbox.drain() == std::vector<std::string>{file.string()});
        REQUIRE(host->shown().empty());
    }

    SECTION("Busy mailbox is reported as a failure") {
        owner.publishAddress("http://127.0.0.1:5000/");
        auto file = dir.writeFile("notes.md", "x");
        infra::FileLock mailboxLock(dir.path() / infra::Mailbox::kLockFileName);
        REQUIRE(mailboxLock.tryLock());

        REQUIRE(app::Launcher(optionsFor(dir.path(), file.string()), host).run() == 1);
    }

    SECTION("Without a document the owner's window is shown") {
        owner.publishAddress("http://127.0.0.1:5000/");
        REQUIRE(app::Launcher(optionsFor(dir.path()), host).run() == 0);

        auto shown = host->shown();
        REQUIRE(shown.size() == 1);
        REQUIRE(shown[0].first == "http://127.0.0.1:5000/");
    }

    SECTION("Without a document and no published address it gives up") {
        REQUIRE(app::Launcher(optionsFor(dir.path()), host).run() == 1);
        REQUIRE(host->shown().empty());
    }

    SECTION("A document is not queued for a holder that never publishes") {
        auto file = dir.writeFile("notes.md", "x");
        REQUIRE(app::Launcher(optionsFor(dir.path(), file.string()), host).run() == 1);

        infra::Mailbox mailbox(dir.path());
        REQUIRE(mailbox.drain().empty());
    }
}

TEST_CASE("ConsoleWindowHost", "[Launcher]") {
    std::ostringstream out;
    app::ConsoleWindowHost host(out);

    host.showWindow("http://127.0.0.1:5000/", "markflow");
    REQUIRE(out.str().find("http://127.0.0.1:5000/") != std::string::npos);
    REQUIRE_FALSE(host.showOpenDialog().has_value());
    REQUIRE_FALSE(host.showSaveDialog("untitled.md").has_value());
}
