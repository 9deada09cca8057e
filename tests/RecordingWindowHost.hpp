#pragma once

#include "core/services/IWindowHost.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace markflow::testing {

/**
 * @brief Window host that remembers every showWindow() call.
 */
class RecordingWindowHost : public core::IWindowHost {
public:
    void showWindow(const std::string& url, const std::string& title) override {
        std::lock_guard lock(mutex_);
        shown_.push_back({url, title});
    }

    std::optional<std::filesystem::path> showOpenDialog() override { return std::nullopt; }

    std::optional<std::filesystem::path> showSaveDialog(const std::string&) override {
        return std::nullopt;
    }

    std::vector<std::pair<std::string, std::string>> shown() const {
        std::lock_guard lock(mutex_);
        return shown_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, std::string>> shown_;
};

} // namespace markflow::testing
