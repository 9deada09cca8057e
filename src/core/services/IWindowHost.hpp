/**
 * @file IWindowHost.hpp
 * @brief Capability interface for the desktop window host.
 *
 * The coordination layer never creates windows itself; it asks a host to
 * show the running instance's URL and, when needed, native file dialogs.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace markflow::core {

class IWindowHost {
public:
    virtual ~IWindowHost() = default;

    /**
     * @brief Presents the editor UI served at the given URL.
     * @param url Base URL of the owning instance.
     * @param title Window title.
     */
    virtual void showWindow(const std::string& url, const std::string& title) = 0;

    /**
     * @brief Asks the user for a document to open.
     * @return Selected path, or nullopt when cancelled or unsupported.
     */
    virtual std::optional<std::filesystem::path> showOpenDialog() = 0;

    /**
     * @brief Asks the user where to save a document.
     * @param defaultName Suggested file name.
     * @return Selected path, or nullopt when cancelled or unsupported.
     */
    virtual std::optional<std::filesystem::path> showSaveDialog(const std::string& defaultName) = 0;
};

} // namespace markflow::core
