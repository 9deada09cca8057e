#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace markflow::infra {

/**
 * @brief An Asio I/O context driven by its own pool of worker threads.
 *
 * The owner runs one context for the API server and its event stream
 * sessions and a separate single-thread context for the mailbox monitor, so
 * slow work in one never delays the other.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext.
     * @param name Label used in log messages.
     * @param threadCount Number of worker threads (at least one).
     */
    explicit AsioContext(std::string name, size_t threadCount = 1);

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the io_context and joins all worker threads.
     *
     * Pending handlers are discarded; the context can be started again.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    asio::io_context& getContext() { return ioContext_; }

    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    const std::string& name() const { return name_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    std::string name_;
    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace markflow::infra
