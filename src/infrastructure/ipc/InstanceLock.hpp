#pragma once

#include "infrastructure/ipc/FileLock.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace markflow::infra {

/**
 * @brief Arbitrates which process is the single running server.
 *
 * Ownership is the exclusive advisory lock on `<workdir>/server.lock`, never
 * the file's presence or content. Once ready to serve, the owner writes its
 * base URL as the file's only line so that other invocations can find it.
 * The OS releases the lock when the owner dies, so a crashed owner leaves
 * nothing to clean up.
 *
 * @note This class is non-copyable.
 */
class InstanceLock {
public:
    static constexpr const char* kFileName = "server.lock";

    enum class Role {
        Owner,      ///< This process holds the lock.
        Joiner,     ///< Another process holds the lock and published its address.
        Unresolved  ///< The lock stayed held but no address appeared in time.
    };

    struct Claim {
        Role role{Role::Unresolved};
        std::string ownerAddress;  ///< Set only for Role::Joiner.
    };

    /**
     * @brief Creates an instance lock for the given lock file path.
     * @param lockPath Path to server.lock.
     */
    explicit InstanceLock(std::filesystem::path lockPath);

    /**
     * @brief Destructor. Releases ownership if held.
     */
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    /**
     * @brief Attempts to become the owning server without blocking.
     *
     * On success any address left behind by a previous owner is cleared, so
     * readers report "not ready" until publishAddress() is called.
     *
     * @return True if this process now owns the instance lock.
     * @throws core::StartupError if the lock file cannot be opened or locked
     *         for a reason other than another process holding it.
     */
    bool tryBecomeOwner();

    /**
     * @brief Becomes the owner, or confirms that another process is one.
     *
     * A failed tryBecomeOwner() alone does not prove an owner exists: the
     * lock may be held for an instant by isHeld() or by an owner that is
     * shutting down. This alternates between taking the lock and reading
     * the published address, with backoff, until one of them succeeds or
     * maxWait elapses.
     *
     * @param maxWait Total time to keep retrying.
     * @throws core::StartupError as tryBecomeOwner().
     */
    Claim claim(std::chrono::milliseconds maxWait);

    /**
     * @brief Publishes the owner's base URL. Call only once fully ready to serve.
     * @param url Base URL, e.g. "http://127.0.0.1:5000/".
     * @throws core::StartupError if not the owner or the write fails.
     */
    void publishAddress(const std::string& url);

    /**
     * @brief Gives up ownership. Idempotent and safe if never acquired.
     */
    void release();

    bool isOwner() const { return lock_.isLocked(); }

    const std::filesystem::path& path() const { return lock_.path(); }

    /**
     * @brief Reads the published owner address.
     * @param lockPath Path to server.lock.
     * @return The URL, or nullopt if the file is missing, unreadable or holds
     *         no complete newline-terminated line. Nullopt means "not ready",
     *         not "no owner"; callers retry.
     */
    static std::optional<std::string> readOwnerAddress(const std::filesystem::path& lockPath);

    /**
     * @brief Polls readOwnerAddress() with exponential backoff.
     * @param lockPath Path to server.lock.
     * @param maxWait Total time to keep retrying.
     * @return The URL once published, or nullopt when maxWait elapses.
     */
    static std::optional<std::string> waitForOwnerAddress(const std::filesystem::path& lockPath,
                                                          std::chrono::milliseconds maxWait);

    /**
     * @brief Best-effort check whether another process holds the lock.
     *
     * Briefly takes the lock when it is free, so it must not be used to
     * decide ownership; tryBecomeOwner() is the only authority.
     */
    static bool isHeld(const std::filesystem::path& lockPath);

private:
    void writeContent(const std::string& content);

    FileLock lock_;
};

} // namespace markflow::infra
