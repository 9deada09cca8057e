#pragma once

#include "core/services/IRecentDocuments.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace markflow::infra {

/**
 * @brief A mailbox entry resolved to a readable markdown document.
 */
struct ResolvedDocument {
    std::filesystem::path path; ///< Absolute, normalized file path.
    std::string title;          ///< File name shown as the tab title.
    std::string content;        ///< Raw file content.
};

/**
 * @brief Maps mailbox entries to markdown files.
 *
 * Entries may be plain paths, `file://` URIs or `recent://<name>` references.
 * Anything that does not end up as an existing `.md` file is dropped and
 * logged; the enqueuer is never told.
 */
class PathResolver {
public:
    static constexpr const char* kFileScheme = "file://";
    static constexpr const char* kRecentScheme = "recent://";

    /**
     * @brief Constructs a resolver.
     * @param recentDocuments Lookup for `recent://` references; may be null.
     * @param recentLookupTimeout Bound on each recent-document lookup.
     */
    explicit PathResolver(std::shared_ptr<core::IRecentDocuments> recentDocuments = nullptr,
                          std::chrono::milliseconds recentLookupTimeout =
                              std::chrono::milliseconds(500));

    /**
     * @brief Converts an entry to an absolute path without checking the file.
     * @param entry Raw mailbox entry.
     * @return The path, or nullopt if the entry cannot be interpreted.
     */
    std::optional<std::filesystem::path> resolve(const std::string& entry) const;

    /**
     * @brief Resolves an entry, applies the markdown policy and reads the file.
     * @param entry Raw mailbox entry.
     * @return The document, or nullopt if it was dropped.
     */
    std::optional<ResolvedDocument> load(const std::string& entry) const;

    /**
     * @brief Checks that a path is an existing regular file with a `.md` extension.
     */
    static bool isMarkdownFile(const std::filesystem::path& path);

    static std::string percentDecode(const std::string& str);
    static std::string percentEncode(const std::string& str);

    /**
     * @brief Converts a `file://` URI to a local path.
     * @return The path, or nullopt for a non-local authority.
     */
    static std::optional<std::filesystem::path> fileUriToPath(const std::string& uri);

private:
    std::shared_ptr<core::IRecentDocuments> recentDocuments_;
    std::chrono::milliseconds recentLookupTimeout_;
};

/**
 * @brief Recent-document lookup backed by the freedesktop recently-used list.
 *
 * Scans `recently-used.xbel` for bookmarks whose file name matches the
 * reference. The match with the latest `modified` time wins (`added` when a
 * bookmark has no `modified`); ties go to the later bookmark in the file.
 */
class XbelRecentDocuments : public core::IRecentDocuments {
public:
    /**
     * @brief Constructs a lookup over the given xbel file.
     * @param xbelPath Path to recently-used.xbel.
     */
    explicit XbelRecentDocuments(std::filesystem::path xbelPath);

    std::optional<std::filesystem::path>
    lookup(const std::string& reference, std::chrono::steady_clock::time_point deadline) override;

    /**
     * @brief Returns the per-user default xbel location.
     *
     * `$XDG_DATA_HOME/recently-used.xbel`, else `$HOME/.local/share/recently-used.xbel`.
     */
    static std::filesystem::path defaultPath();

private:
    std::filesystem::path xbelPath_;
};

} // namespace markflow::infra
