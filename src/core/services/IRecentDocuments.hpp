/**
 * @file IRecentDocuments.hpp
 * @brief Interface for looking up "recent document" references.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace markflow::core {

/**
 * @brief Best-effort lookup of opaque recent-document references.
 *
 * Implementations consult an external source (e.g. the desktop's recently
 * used list) and must give up once the deadline passes.
 */
class IRecentDocuments {
public:
    virtual ~IRecentDocuments() = default;

    /**
     * @brief Maps a reference to a local file path.
     * @param reference Opaque reference taken from a mailbox entry.
     * @param deadline Point in time after which the lookup gives up.
     * @return Local path if found in time, nullopt otherwise.
     */
    virtual std::optional<std::filesystem::path>
    lookup(const std::string& reference, std::chrono::steady_clock::time_point deadline) = 0;
};

} // namespace markflow::core
