#pragma once

#include <chrono>
#include <filesystem>

namespace markflow::infra {

/**
 * @brief RAII advisory exclusive lock on a file.
 *
 * Uses flock(), which binds the lock to the open file description: two
 * FileLock objects on the same path exclude each other even inside one
 * process, and the OS drops the lock when the holder dies.
 *
 * @note This class is non-copyable. The lock file is created if missing
 *       and is never deleted.
 */
class FileLock {
public:
    /**
     * @brief Creates a lock object for the given path. Nothing is opened yet.
     * @param path Path of the lock file.
     */
    explicit FileLock(std::filesystem::path path);

    /**
     * @brief Destructor. Releases the lock and closes the file.
     */
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    /**
     * @brief Attempts to take the lock without waiting.
     * @return True if the lock is now held by this object.
     * @throws std::system_error if the lock file cannot be opened or the
     *         lock call fails for a reason other than contention.
     */
    bool tryLock();

    /**
     * @brief Attempts to take the lock, polling until the timeout elapses.
     * @param timeout Maximum time to wait.
     * @return True if the lock is now held by this object.
     * @throws std::system_error as for tryLock().
     */
    bool tryLockFor(std::chrono::milliseconds timeout);

    /**
     * @brief Releases the lock and closes the file. Safe to call when not held.
     */
    void unlock();

    bool isLocked() const { return locked_; }

    /**
     * @brief Returns the descriptor of the open lock file, or -1.
     */
    int nativeHandle() const { return fd_; }

    const std::filesystem::path& path() const { return path_; }

private:
    void openFile();

    std::filesystem::path path_;
    int fd_{-1};
    bool locked_{false};
};

} // namespace markflow::infra
