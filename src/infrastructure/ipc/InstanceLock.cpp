#include "infrastructure/ipc/InstanceLock.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include <thread>

#include <unistd.h>

namespace markflow::infra {

namespace {

constexpr auto kInitialBackoff = std::chrono::milliseconds(50);
constexpr auto kClaimInitialBackoff = std::chrono::milliseconds(5);
constexpr auto kMaxBackoff = std::chrono::milliseconds(1000);

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

} // namespace

InstanceLock::InstanceLock(std::filesystem::path lockPath) : lock_(std::move(lockPath)) {}

InstanceLock::~InstanceLock() {
    release();
}

bool InstanceLock::tryBecomeOwner() {
    bool acquired = false;
    try {
        acquired = lock_.tryLock();
    } catch (const std::system_error& e) {
        throw core::StartupError(e.what());
    }

    if (!acquired) {
        spdlog::debug("Instance lock {} is held by another process", path().string());
        return false;
    }

    writeContent("");
    spdlog::info("Acquired instance lock {}", path().string());
    return true;
}

InstanceLock::Claim InstanceLock::claim(std::chrono::milliseconds maxWait) {
    auto deadline = std::chrono::steady_clock::now() + maxWait;
    auto backoff = kClaimInitialBackoff;

    while (true) {
        if (isOwner() || tryBecomeOwner()) {
            return {Role::Owner, {}};
        }
        if (auto url = readOwnerAddress(path())) {
            return {Role::Joiner, *url};
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            spdlog::warn("Instance lock {} held for {} ms without a published address",
                         path().string(), maxWait.count());
            return {Role::Unresolved, {}};
        }

        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(backoff, deadline - now));
        backoff = std::min(backoff * 2, kMaxBackoff);
    }
}

void InstanceLock::publishAddress(const std::string& url) {
    if (!isOwner()) {
        throw core::StartupError("Cannot publish address without holding " + path().string());
    }

    writeContent(url + "\n");
    spdlog::info("Published server address {}", url);
}

void InstanceLock::release() {
    if (!isOwner()) {
        return;
    }

    try {
        writeContent("");
    } catch (const core::StartupError& e) {
        spdlog::warn("Failed to clear instance lock content: {}", e.what());
    }
    lock_.unlock();
    spdlog::info("Released instance lock {}", path().string());
}

void InstanceLock::writeContent(const std::string& content) {
    int fd = lock_.nativeHandle();

    if (::ftruncate(fd, 0) != 0) {
        throw core::StartupError("Failed to truncate " + path().string() + ": " +
                                 std::strerror(errno));
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::pwrite(fd, content.data() + written, content.size() - written,
                             static_cast<off_t>(written));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw core::StartupError("Failed to write " + path().string() + ": " +
                                     std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        spdlog::warn("fsync of {} failed: {}", path().string(), std::strerror(errno));
    }
}

std::optional<std::string> InstanceLock::readOwnerAddress(const std::filesystem::path& lockPath) {
    std::ifstream file(lockPath);
    if (!file) {
        return std::nullopt;
    }

    std::string line;
    if (!std::getline(file, line) || file.eof()) {
        return std::nullopt;
    }

    line = trim(line);
    if (line.empty()) {
        return std::nullopt;
    }
    return line;
}

std::optional<std::string>
InstanceLock::waitForOwnerAddress(const std::filesystem::path& lockPath,
                                  std::chrono::milliseconds maxWait) {
    auto deadline = std::chrono::steady_clock::now() + maxWait;
    auto backoff = kInitialBackoff;

    while (true) {
        if (auto url = readOwnerAddress(lockPath)) {
            return url;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            spdlog::warn("No server address published in {} after {} ms", lockPath.string(),
                         maxWait.count());
            return std::nullopt;
        }

        spdlog::debug("Server address not ready, retrying in {} ms", backoff.count());
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(backoff, deadline - now));
        backoff = std::min(backoff * 2, kMaxBackoff);
    }
}

bool InstanceLock::isHeld(const std::filesystem::path& lockPath) {
    try {
        FileLock trial(lockPath);
        if (trial.tryLock()) {
            trial.unlock();
            return false;
        }
        return true;
    } catch (const std::system_error& e) {
        spdlog::warn("Could not check instance lock: {}", e.what());
        return false;
    }
}

} // namespace markflow::infra
