#pragma once

#include "core/services/IWindowHost.hpp"

#include <iosfwd>

namespace markflow::app {

/**
 * @brief Window host for builds without a native UI toolkit.
 *
 * Prints the editor URL so the user can open it in a browser. Dialogs are
 * not available and always report cancellation.
 */
class ConsoleWindowHost : public core::IWindowHost {
public:
    /**
     * @param out Stream the URL is written to (default std::cout).
     */
    explicit ConsoleWindowHost(std::ostream& out);
    ConsoleWindowHost();

    void showWindow(const std::string& url, const std::string& title) override;
    std::optional<std::filesystem::path> showOpenDialog() override;
    std::optional<std::filesystem::path> showSaveDialog(const std::string& defaultName) override;

private:
    std::ostream& out_;
};

} // namespace markflow::app
