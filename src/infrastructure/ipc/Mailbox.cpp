#include "infrastructure/ipc/Mailbox.hpp"

#include "core/types/Errors.hpp"
#include "infrastructure/ipc/FileLock.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace markflow::infra {

namespace {

// Closes the descriptor on every exit path.
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

std::string errnoMessage(const std::string& what, const std::filesystem::path& path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

} // namespace

Mailbox::Mailbox(const std::filesystem::path& workDir)
    : mailboxPath_(workDir / kFileName), lockPath_(workDir / kLockFileName) {}

void Mailbox::enqueue(const std::string& entry, std::chrono::milliseconds timeout) const {
    if (entry.empty()) {
        throw std::invalid_argument("Mailbox entry must not be empty");
    }
    if (entry.find_first_of("\r\n") != std::string::npos) {
        throw std::invalid_argument("Mailbox entry must not contain line breaks");
    }

    FileLock lock(lockPath_);
    spdlog::debug("Waiting for {} to be available...", mailboxPath_.string());
    if (!lock.tryLockFor(timeout)) {
        throw core::MailboxTimeoutError("Timed out after " + std::to_string(timeout.count()) +
                                        " ms waiting for " + lockPath_.string());
    }

    FdGuard fd(::open(mailboxPath_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644));
    if (fd.get() < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "Failed to open " + mailboxPath_.string());
    }

    const std::string line = entry + "\n";
    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = ::write(fd.get(), line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(),
                                    "Failed to append to " + mailboxPath_.string());
        }
        written += static_cast<size_t>(n);
    }

    spdlog::info("Queued {} in {}", entry, mailboxPath_.string());
}

std::vector<std::string> Mailbox::drain(std::chrono::milliseconds timeout) const {
    std::string raw;
    {
        FileLock lock(lockPath_);
        try {
            if (!lock.tryLockFor(timeout)) {
                throw core::TransientIoError("Mailbox lock busy after " +
                                             std::to_string(timeout.count()) + " ms");
            }
        } catch (const std::system_error& e) {
            throw core::TransientIoError(e.what());
        }

        FdGuard fd(::open(mailboxPath_.c_str(), O_RDWR | O_CLOEXEC));
        if (fd.get() < 0) {
            if (errno == ENOENT) {
                return {};
            }
            throw core::TransientIoError(errnoMessage("Failed to open", mailboxPath_));
        }

        char buffer[4096];
        while (true) {
            ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw core::TransientIoError(errnoMessage("Failed to read", mailboxPath_));
            }
            if (n == 0) {
                break;
            }
            raw.append(buffer, static_cast<size_t>(n));
        }

        if (raw.empty()) {
            return {};
        }

        // Truncate before the lock is released so nothing appended later is lost.
        if (::ftruncate(fd.get(), 0) != 0) {
            throw core::TransientIoError(errnoMessage("Failed to truncate", mailboxPath_));
        }
    }

    std::vector<std::string> entries;
    std::istringstream iss(raw);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") != std::string::npos) {
            entries.push_back(line);
        }
    }

    spdlog::debug("Drained {} entries from {}", entries.size(), mailboxPath_.string());
    return entries;
}

} // namespace markflow::infra
