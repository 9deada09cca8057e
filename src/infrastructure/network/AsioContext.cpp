#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace markflow::infra {

AsioContext::AsioContext(std::string name, size_t threadCount)
    : name_(std::move(name)), threadCount_(threadCount > 0 ? threadCount : 1) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() {
            spdlog::debug("{} worker thread {} started", name_, i);
            ioContext_.run();
            spdlog::debug("{} worker thread {} stopped", name_, i);
        });
    }

    spdlog::debug("{} context started with {} worker threads", name_, threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    ioContext_.restart();
    spdlog::debug("{} context stopped", name_);
}

} // namespace markflow::infra
