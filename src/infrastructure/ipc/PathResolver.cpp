#include "infrastructure/ipc/PathResolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace markflow::infra {

namespace {

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::filesystem::path normalize(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path.lexically_normal();
    }
    return absolute.lexically_normal();
}

// Value of `name="..."` in an xbel element line, still entity-encoded.
std::optional<std::string> attributeValue(const std::string& line, const std::string& name) {
    const std::string key = " " + name + "=\"";
    auto pos = line.find(key);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    auto start = pos + key.size();
    auto end = line.find('"', start);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    return line.substr(start, end - start);
}

std::string decodeXmlEntities(const std::string& value) {
    static const std::pair<const char*, char> kEntities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}};

    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size();) {
        bool decoded = false;
        if (value[i] == '&') {
            for (const auto& [entity, ch] : kEntities) {
                if (value.compare(i, std::char_traits<char>::length(entity), entity) == 0) {
                    result += ch;
                    i += std::char_traits<char>::length(entity);
                    decoded = true;
                    break;
                }
            }
        }
        if (!decoded) {
            result += value[i++];
        }
    }
    return result;
}

} // namespace

PathResolver::PathResolver(std::shared_ptr<core::IRecentDocuments> recentDocuments,
                           std::chrono::milliseconds recentLookupTimeout)
    : recentDocuments_(std::move(recentDocuments)), recentLookupTimeout_(recentLookupTimeout) {}

std::optional<std::filesystem::path> PathResolver::resolve(const std::string& entry) const {
    if (entry.empty()) {
        return std::nullopt;
    }

    if (startsWith(entry, kFileScheme)) {
        auto path = fileUriToPath(entry);
        if (!path) {
            spdlog::warn("Dropping non-local file URI: {}", entry);
            return std::nullopt;
        }
        return normalize(*path);
    }

    if (startsWith(entry, kRecentScheme)) {
        if (!recentDocuments_) {
            spdlog::warn("No recent-document lookup available for {}", entry);
            return std::nullopt;
        }

        auto reference = percentDecode(entry.substr(std::string(kRecentScheme).size()));
        auto deadline = std::chrono::steady_clock::now() + recentLookupTimeout_;
        try {
            auto path = recentDocuments_->lookup(reference, deadline);
            if (!path) {
                spdlog::warn("Recent document not found: {}", reference);
                return std::nullopt;
            }
            return normalize(*path);
        } catch (const std::exception& e) {
            spdlog::warn("Recent document lookup for {} failed: {}", reference, e.what());
            return std::nullopt;
        }
    }

    return normalize(entry);
}

std::optional<ResolvedDocument> PathResolver::load(const std::string& entry) const {
    auto path = resolve(entry);
    if (!path) {
        return std::nullopt;
    }

    if (!isMarkdownFile(*path)) {
        spdlog::warn("Ignoring open request for {}: not an existing .md file", path->string());
        return std::nullopt;
    }

    std::ifstream file(*path, std::ios::binary);
    if (!file) {
        spdlog::warn("Failed to open {}", path->string());
        return std::nullopt;
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        spdlog::warn("Failed to read {}", path->string());
        return std::nullopt;
    }

    ResolvedDocument document;
    document.path = *path;
    document.title = path->filename().string();
    document.content = ss.str();
    return document;
}

bool PathResolver::isMarkdownFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }

    auto extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension == ".md";
}

std::string PathResolver::percentDecode(const std::string& str) {
    std::string out;
    out.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hexValue(str[i + 1]);
            int lo = hexValue(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(str[i]);
    }
    return out;
}

std::string PathResolver::percentEncode(const std::string& str) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size());

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::optional<std::filesystem::path> PathResolver::fileUriToPath(const std::string& uri) {
    if (!startsWith(uri, kFileScheme)) {
        return std::nullopt;
    }

    auto rest = uri.substr(std::string(kFileScheme).size());

    // file:///abs, file://localhost/abs
    auto slash = rest.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    auto authority = rest.substr(0, slash);
    if (!authority.empty() && authority != "localhost") {
        return std::nullopt;
    }

    auto path = rest.substr(slash);
    auto query = path.find_first_of("?#");
    if (query != std::string::npos) {
        path = path.substr(0, query);
    }
    return std::filesystem::path(percentDecode(path));
}

XbelRecentDocuments::XbelRecentDocuments(std::filesystem::path xbelPath)
    : xbelPath_(std::move(xbelPath)) {}

std::optional<std::filesystem::path>
XbelRecentDocuments::lookup(const std::string& reference,
                            std::chrono::steady_clock::time_point deadline) {
    std::ifstream file(xbelPath_);
    if (!file) {
        spdlog::debug("Recently used list {} not readable", xbelPath_.string());
        return std::nullopt;
    }

    std::optional<std::filesystem::path> match;
    std::string matchModified;
    std::string line;

    while (std::getline(file, line)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("Recent document lookup for {} timed out", reference);
            return std::nullopt;
        }

        auto href = attributeValue(line, "href");
        if (!href) {
            continue;
        }

        auto path = PathResolver::fileUriToPath(decodeXmlEntities(*href));
        if (!path || (path->filename().string() != reference && path->string() != reference)) {
            continue;
        }

        // ISO 8601 timestamps order correctly as strings.
        auto modified = attributeValue(line, "modified");
        if (!modified) {
            modified = attributeValue(line, "added");
        }
        auto stamp = modified.value_or("");
        if (!match || stamp >= matchModified) {
            match = *path;
            matchModified = stamp;
        }
    }

    return match;
}

std::filesystem::path XbelRecentDocuments::defaultPath() {
    if (const char* dataHome = std::getenv("XDG_DATA_HOME"); dataHome && *dataHome) {
        return std::filesystem::path(dataHome) / "recently-used.xbel";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "recently-used.xbel";
    }
    return {};
}

} // namespace markflow::infra
