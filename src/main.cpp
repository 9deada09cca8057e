#include "app/ConsoleWindowHost.hpp"
#include "app/Launcher.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    markflow::app::LaunchOptions options;
    try {
        options = markflow::app::Launcher::parseArguments(
            std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "markflow: " << e.what() << "\n\n";
        markflow::app::Launcher::printUsage(std::cerr);
        return 1;
    }

    try {
        markflow::app::Launcher launcher(std::move(options),
                                         std::make_shared<markflow::app::ConsoleWindowHost>());
        return launcher.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
