#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace markflow::infra {

/**
 * @brief Cross-process queue of file-open requests.
 *
 * Joining invocations append one line per request to `<workdir>/opening.txt`;
 * the owner drains it. Both sides hold `<workdir>/opening.txt.lock`, which is
 * distinct from the instance lock, for the whole append or read-and-truncate,
 * so lines are never split and an append racing a drain lands in the next one.
 *
 * The object holds no open files between calls and may be shared by threads.
 */
class Mailbox {
public:
    static constexpr const char* kFileName = "opening.txt";
    static constexpr const char* kLockFileName = "opening.txt.lock";
    static constexpr auto kDefaultEnqueueTimeout = std::chrono::milliseconds(10000);
    static constexpr auto kDefaultDrainTimeout = std::chrono::milliseconds(1000);

    /**
     * @brief Creates a mailbox rooted in the given working directory.
     * @param workDir Directory holding opening.txt and its lock file.
     */
    explicit Mailbox(const std::filesystem::path& workDir);

    /**
     * @brief Appends one entry (path or URI) as a single line.
     * @param entry Non-empty entry without line breaks.
     * @param timeout Maximum wait for the mailbox lock.
     * @throws std::invalid_argument if the entry is empty or contains a line break.
     * @throws core::MailboxTimeoutError if the lock is not acquired in time.
     * @throws std::system_error if the mailbox cannot be written.
     */
    void enqueue(const std::string& entry,
                 std::chrono::milliseconds timeout = kDefaultEnqueueTimeout) const;

    /**
     * @brief Atomically reads and clears all queued entries.
     *
     * The lock is released before returning, so slow per-entry work done by
     * the caller never blocks producers. Draining an empty or missing mailbox
     * returns an empty vector.
     *
     * @param timeout Maximum wait for the mailbox lock.
     * @return Entries in append order, blank lines skipped.
     * @throws core::TransientIoError on lock timeout or I/O failure.
     */
    std::vector<std::string> drain(std::chrono::milliseconds timeout = kDefaultDrainTimeout) const;

    const std::filesystem::path& mailboxPath() const { return mailboxPath_; }
    const std::filesystem::path& lockPath() const { return lockPath_; }

private:
    std::filesystem::path mailboxPath_;
    std::filesystem::path lockPath_;
};

} // namespace markflow::infra
