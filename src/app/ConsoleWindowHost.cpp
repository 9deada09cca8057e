#include "app/ConsoleWindowHost.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

namespace markflow::app {

ConsoleWindowHost::ConsoleWindowHost(std::ostream& out) : out_(out) {}

ConsoleWindowHost::ConsoleWindowHost() : ConsoleWindowHost(std::cout) {}

void ConsoleWindowHost::showWindow(const std::string& url, const std::string& title) {
    spdlog::debug("Showing window '{}' for {}", title, url);
    out_ << title << " is running at " << url << "\n"
         << "Open this address in your browser." << std::endl;
}

std::optional<std::filesystem::path> ConsoleWindowHost::showOpenDialog() {
    spdlog::warn("Open dialog is not available without a native window host");
    return std::nullopt;
}

std::optional<std::filesystem::path>
ConsoleWindowHost::showSaveDialog(const std::string& defaultName) {
    spdlog::warn("Save dialog for '{}' is not available without a native window host",
                 defaultName);
    return std::nullopt;
}

} // namespace markflow::app
