#include "infrastructure/ipc/MailboxMonitor.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

namespace markflow::infra {

MailboxMonitor::MailboxMonitor(AsioContext& context, const Mailbox& mailbox,
                               const PathResolver& resolver,
                               std::shared_ptr<core::IEventBroadcaster> broadcaster,
                               std::string baseUrl, MailboxMonitorOptions options)
    : mailbox_(mailbox), resolver_(resolver), broadcaster_(std::move(broadcaster)),
      baseUrl_(std::move(baseUrl)), options_(options),
      state_(std::make_shared<LoopState>(context.getContext())) {}

MailboxMonitor::~MailboxMonitor() {
    stop();
}

void MailboxMonitor::start() {
    std::lock_guard lock(state_->mutex);
    if (state_->running) {
        return;
    }

    state_->running = true;
    scheduleNextPoll(std::chrono::milliseconds(0));
    spdlog::info("Watching {} every {} ms", mailbox_.mailboxPath().string(),
                 options_.pollInterval.count());
}

void MailboxMonitor::stop() {
    std::lock_guard lock(state_->mutex);
    if (!state_->running) {
        return;
    }

    state_->running = false;
    state_->timer.cancel();
    spdlog::info("Mailbox monitor stopped");
}

bool MailboxMonitor::isRunning() const {
    std::lock_guard lock(state_->mutex);
    return state_->running;
}

// Called with state_->mutex held.
void MailboxMonitor::scheduleNextPoll(std::chrono::milliseconds delay) {
    auto state = state_;
    state->timer.expires_after(delay);
    state->timer.async_wait([this, state](const asio::error_code& ec) {
        std::lock_guard lock(state->mutex);
        if (ec || !state->running) {
            return;
        }
        onTimer();
    });
}

void MailboxMonitor::onTimer() {
    auto delay = options_.pollInterval;

    try {
        pollOnce();
    } catch (const core::TransientIoError& e) {
        spdlog::warn("Mailbox poll failed, retrying in {} ms: {}", options_.errorBackoff.count(),
                     e.what());
        delay = options_.errorBackoff;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected mailbox monitor error, retrying in {} ms: {}",
                      options_.errorBackoff.count(), e.what());
        delay = options_.errorBackoff;
    }

    scheduleNextPoll(delay);
}

size_t MailboxMonitor::pollOnce() {
    auto entries = mailbox_.drain(options_.drainTimeout);
    if (entries.empty()) {
        return 0;
    }

    size_t published = 0;
    for (const auto& entry : entries) {
        auto document = resolver_.load(entry);
        if (!document) {
            continue;
        }

        auto filePath = document->path.string();
        auto url = baseUrl_ + "?file=" + PathResolver::percentEncode(filePath);
        broadcaster_->publish(
            core::Event::openTab(url, document->title, filePath, document->content));
        ++published;
        spdlog::info("Opening {} in a new tab", filePath);
    }

    publishedCount_ += published;
    return published;
}

} // namespace markflow::infra
