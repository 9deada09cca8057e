#include "infrastructure/ipc/FileLock.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace markflow::infra {

namespace {

constexpr auto kLockPollInterval = std::chrono::milliseconds(20);

} // namespace

FileLock::FileLock(std::filesystem::path path) : path_(std::move(path)) {}

FileLock::~FileLock() {
    unlock();
}

void FileLock::openFile() {
    if (fd_ >= 0) {
        return;
    }

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "Failed to open lock file " + path_.string());
    }
}

bool FileLock::tryLock() {
    if (locked_) {
        return true;
    }

    openFile();

    int rc;
    do {
        rc = ::flock(fd_, LOCK_EX | LOCK_NB);
    } while (rc != 0 && errno == EINTR);

    if (rc == 0) {
        locked_ = true;
        return true;
    }

    if (errno == EWOULDBLOCK) {
        return false;
    }

    throw std::system_error(errno, std::generic_category(),
                            "Failed to lock " + path_.string());
}

bool FileLock::tryLockFor(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (tryLock()) {
            return true;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            spdlog::debug("Timed out after {} ms waiting for {}", timeout.count(), path_.string());
            return false;
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(kLockPollInterval, deadline - now));
    }
}

void FileLock::unlock() {
    if (fd_ < 0) {
        return;
    }

    if (locked_) {
        // close() drops the lock as well, so a failed unlock is only worth a warning.
        if (::flock(fd_, LOCK_UN) != 0) {
            spdlog::warn("Failed to unlock {}: {}", path_.string(), std::strerror(errno));
        }
        locked_ = false;
    }
    ::close(fd_);
    fd_ = -1;
}

} // namespace markflow::infra
