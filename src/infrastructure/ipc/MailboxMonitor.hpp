#pragma once

#include "core/services/IEventBroadcaster.hpp"
#include "infrastructure/ipc/Mailbox.hpp"
#include "infrastructure/ipc/PathResolver.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace markflow::infra {

struct MailboxMonitorOptions {
    std::chrono::milliseconds pollInterval{500};
    std::chrono::milliseconds errorBackoff{1000};
    std::chrono::milliseconds drainTimeout{Mailbox::kDefaultDrainTimeout};
};

/**
 * @brief Owner-side loop that turns mailbox entries into open-tab events.
 *
 * Every poll interval the monitor drains the mailbox, resolves each entry
 * and publishes an open_tab event for every markdown file found. A failing
 * tick is logged and retried after the error backoff; nothing thrown inside
 * the loop escapes it.
 *
 * @note The monitor runs on the given context's threads. Give it a context
 *       of its own so file I/O never delays request handling.
 */
class MailboxMonitor {
public:
    /**
     * @brief Constructs a monitor.
     * @param context Context whose threads run the poll loop.
     * @param mailbox Mailbox to drain.
     * @param resolver Resolver applied to each drained entry.
     * @param broadcaster Destination for open_tab events.
     * @param baseUrl Owner base URL used to build each event's url field.
     * @param options Poll interval, backoff and drain lock bound.
     */
    MailboxMonitor(AsioContext& context, const Mailbox& mailbox, const PathResolver& resolver,
                   std::shared_ptr<core::IEventBroadcaster> broadcaster, std::string baseUrl,
                   MailboxMonitorOptions options = {});

    /**
     * @brief Destructor. Stops the loop.
     */
    ~MailboxMonitor();

    MailboxMonitor(const MailboxMonitor&) = delete;
    MailboxMonitor& operator=(const MailboxMonitor&) = delete;

    /**
     * @brief Starts polling; the first tick runs immediately.
     */
    void start();

    /**
     * @brief Stops polling. Waits for an in-flight tick to finish.
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief Runs a single drain-resolve-publish cycle on the calling thread.
     * @return Number of open_tab events published.
     * @throws core::TransientIoError if the mailbox could not be drained.
     */
    size_t pollOnce();

    /**
     * @brief Total number of open_tab events published since construction.
     */
    uint64_t publishedCount() const { return publishedCount_.load(); }

private:
    struct LoopState {
        explicit LoopState(asio::io_context& io) : timer(io) {}

        std::mutex mutex;
        bool running{false};
        asio::steady_timer timer;
    };

    void scheduleNextPoll(std::chrono::milliseconds delay);
    void onTimer();

    const Mailbox& mailbox_;
    const PathResolver& resolver_;
    std::shared_ptr<core::IEventBroadcaster> broadcaster_;
    std::string baseUrl_;
    MailboxMonitorOptions options_;
    std::shared_ptr<LoopState> state_;
    std::atomic<uint64_t> publishedCount_{0};
};

} // namespace markflow::infra
