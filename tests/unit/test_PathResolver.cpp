#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"
#include "infrastructure/ipc/PathResolver.hpp"

#include <stdexcept>
#include <thread>

using namespace markflow::infra;
using markflow::testing::TempWorkDir;

namespace {

class FakeRecentDocuments : public markflow::core::IRecentDocuments {
public:
    std::optional<std::filesystem::path> result;
    bool throwOnLookup{false};
    std::string lastReference;

    std::optional<std::filesystem::path>
    lookup(const std::string& reference, std::chrono::steady_clock::time_point) override {
        lastReference = reference;
        if (throwOnLookup) {
            throw std::runtime_error("lookup failed");
        }
        return result;
    }
};

} // namespace

TEST_CASE("PathResolver percent encoding", "[PathResolver]") {
    SECTION("Decodes escapes") {
        REQUIRE(PathResolver::percentDecode("/a%20b/c%2Fd.md") == "/a b/c/d.md");
        REQUIRE(PathResolver::percentDecode("%41%62") == "Ab");
    }

    SECTION("Leaves malformed escapes alone") {
        REQUIRE(PathResolver::percentDecode("100%") == "100%");
        REQUIRE(PathResolver::percentDecode("%zz.md") == "%zz.md");
        REQUIRE(PathResolver::percentDecode("a%2") == "a%2");
    }

    SECTION("Encodes everything outside the unreserved set except slashes") {
        REQUIRE(PathResolver::percentEncode("/home/user/My Notes.md") ==
                "/home/user/My%20Notes.md");
        REQUIRE(PathResolver::percentEncode("/a&b?c=d#e.md") == "/a%26b%3Fc%3Dd%23e.md");
        REQUIRE(PathResolver::percentEncode("/plain-file_1.~md") == "/plain-file_1.~md");
    }

    SECTION("Encodes UTF-8 bytes individually") {
        REQUIRE(PathResolver::percentEncode("/\xC3\xA9.md") == "/%C3%A9.md");
        REQUIRE(PathResolver::percentDecode("/%C3%A9.md") == "/\xC3\xA9.md");
    }
}

TEST_CASE("PathResolver file URIs", "[PathResolver]") {
    SECTION("Empty authority") {
        auto path = PathResolver::fileUriToPath("file:///home/user/notes.md");
        REQUIRE(path.has_value());
        REQUIRE(*path == "/home/user/notes.md");
    }

    SECTION("localhost authority") {
        auto path = PathResolver::fileUriToPath("file://localhost/tmp/a%20b.md");
        REQUIRE(path.has_value());
        REQUIRE(*path == "/tmp/a b.md");
    }

    SECTION("Query and fragment are dropped") {
        auto path = PathResolver::fileUriToPath("file:///tmp/a.md?x=1#top");
        REQUIRE(path.has_value());
        REQUIRE(*path == "/tmp/a.md");
    }

    SECTION("Remote authority is rejected") {
        REQUIRE_FALSE(PathResolver::fileUriToPath("file://server/share/a.md").has_value());
        REQUIRE_FALSE(PathResolver::fileUriToPath("file://server").has_value());
    }

    SECTION("Other schemes are rejected") {
        REQUIRE_FALSE(PathResolver::fileUriToPath("http://localhost/a.md").has_value());
    }
}

TEST_CASE("PathResolver resolve", "[PathResolver]") {
    PathResolver resolver;

    SECTION("Absolute paths are normalized") {
        auto path = resolver.resolve("/tmp/x/../y/./notes.md");
        REQUIRE(path.has_value());
        REQUIRE(*path == "/tmp/y/notes.md");
    }

    SECTION("Relative paths become absolute") {
        auto path = resolver.resolve("notes.md");
        REQUIRE(path.has_value());
        REQUIRE(path->is_absolute());
        REQUIRE(path->filename() == "notes.md");
    }

    SECTION("Empty entry resolves to nothing") {
        REQUIRE_FALSE(resolver.resolve("").has_value());
    }

    SECTION("recent:// without a lookup resolves to nothing") {
        REQUIRE_FALSE(resolver.resolve("recent://notes.md").has_value());
    }
}

TEST_CASE("PathResolver recent references", "[PathResolver]") {
    auto recent = std::make_shared<FakeRecentDocuments>();
    PathResolver resolver(recent);

    SECTION("Reference is percent-decoded and passed to the lookup") {
        recent->result = std::filesystem::path("/docs/My Notes.md");
        auto path = resolver.resolve("recent://My%20Notes.md");

        REQUIRE(recent->lastReference == "My Notes.md");
        REQUIRE(path.has_value());
        REQUIRE(*path == "/docs/My Notes.md");
    }

    SECTION("Unknown reference resolves to nothing") {
        REQUIRE_FALSE(resolver.resolve("recent://missing.md").has_value());
    }

    SECTION("Lookup failures are contained") {
        recent->throwOnLookup = true;
        REQUIRE_FALSE(resolver.resolve("recent://notes.md").has_value());
    }
}

TEST_CASE("PathResolver load applies the markdown policy", "[PathResolver]") {
    TempWorkDir dir;
    PathResolver resolver;

    SECTION("Existing markdown file is read verbatim") {
        auto file = dir.writeFile("notes.md", "# Title\n\nBody \xC3\xA9\n");
        auto doc = resolver.load(file.string());

        REQUIRE(doc.has_value());
        REQUIRE(doc->path == file);
        REQUIRE(doc->title == "notes.md");
        REQUIRE(doc->content == "# Title\n\nBody \xC3\xA9\n");
    }

    SECTION("Extension check is case-insensitive") {
        auto file = dir.writeFile("README.MD", "upper");
        auto doc = resolver.load(file.string());
        REQUIRE(doc.has_value());
        REQUIRE(doc->content == "upper");
    }

    SECTION("File URI to an existing markdown file") {
        auto file = dir.writeFile("with space.md", "x");
        auto uri = "file://" + PathResolver::percentEncode(file.string());
        auto doc = resolver.load(uri);

        REQUIRE(doc.has_value());
        REQUIRE(doc->path == file);
    }

    SECTION("Non-markdown files are dropped") {
        auto file = dir.writeFile("notes.txt", "text");
        REQUIRE_FALSE(resolver.load(file.string()).has_value());
    }

    SECTION("Missing files are dropped") {
        REQUIRE_FALSE(resolver.load((dir.path() / "missing.md").string()).has_value());
    }

    SECTION("Directories named like markdown files are dropped") {
        std::filesystem::create_directories(dir.path() / "folder.md");
        REQUIRE_FALSE(resolver.load((dir.path() / "folder.md").string()).has_value());
    }

    SECTION("Empty markdown file is accepted") {
        auto file = dir.writeFile("empty.md", "");
        auto doc = resolver.load(file.string());
        REQUIRE(doc.has_value());
        REQUIRE(doc->content.empty());
    }
}

TEST_CASE("XbelRecentDocuments lookup", "[PathResolver]") {
    TempWorkDir dir;
    auto xbel = dir.writeFile(
        "recently-used.xbel",
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<xbel version=\"1.0\">\n"
        "  <bookmark href=\"file:///old/notes.md\" added=\"2024-01-01T00:00:00Z\">\n"
        "  </bookmark>\n"
        "  <bookmark href=\"file:///docs/other.md\" added=\"2024-01-02T00:00:00Z\">\n"
        "  </bookmark>\n"
        "  <bookmark href=\"file:///new/notes.md\" added=\"2024-01-03T00:00:00Z\">\n"
        "  </bookmark>\n"
        "  <bookmark href=\"https://example.com/notes.md\" added=\"2024-01-04T00:00:00Z\">\n"
        "  </bookmark>\n"
        "</xbel>\n");

    XbelRecentDocuments recent(xbel);
    auto farDeadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);

    SECTION("Newest local match wins") {
        auto path = recent.lookup("notes.md", farDeadline);
        REQUIRE(path.has_value());
        REQUIRE(*path == "/new/notes.md");
    }

    SECTION("Unknown name is not found") {
        REQUIRE_FALSE(recent.lookup("absent.md", farDeadline).has_value());
    }

    SECTION("Expired deadline gives up") {
        auto expired = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
        REQUIRE_FALSE(recent.lookup("notes.md", expired).has_value());
    }

    SECTION("Missing list is not found") {
        XbelRecentDocuments none(dir.path() / "missing.xbel");
        REQUIRE_FALSE(none.lookup("notes.md", farDeadline).has_value());
    }
}

TEST_CASE("XbelRecentDocuments ordering and escaping", "[PathResolver]") {
    TempWorkDir dir;
    auto farDeadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);

    SECTION("Latest modified time wins regardless of file order") {
        auto xbel = dir.writeFile(
            "recently-used.xbel",
            "<xbel version=\"1.0\">\n"
            "  <bookmark href=\"file:///recent/notes.md\" added=\"2024-01-01T00:00:00Z\" "
            "modified=\"2024-03-01T12:00:00Z\">\n"
            "  </bookmark>\n"
            "  <bookmark href=\"file:///stale/notes.md\" added=\"2024-02-01T00:00:00Z\" "
            "modified=\"2024-02-01T00:00:00Z\">\n"
            "  </bookmark>\n"
            "</xbel>\n");

        auto path = XbelRecentDocuments(xbel).lookup("notes.md", farDeadline);
        REQUIRE(path.has_value());
        REQUIRE(*path == "/recent/notes.md");
    }

    SECTION("XML entities in the href are decoded") {
        auto xbel = dir.writeFile(
            "recently-used.xbel",
            "<xbel version=\"1.0\">\n"
            "  <bookmark href=\"file:///docs/R&amp;D%20notes.md\" "
            "modified=\"2024-01-01T00:00:00Z\">\n"
            "  </bookmark>\n"
            "  <bookmark href=\"file:///docs/&lt;draft&gt;.md\" "
            "modified=\"2024-01-01T00:00:00Z\">\n"
            "  </bookmark>\n"
            "</xbel>\n");

        XbelRecentDocuments recent(xbel);
        auto path = recent.lookup("R&D notes.md", farDeadline);
        REQUIRE(path.has_value());
        REQUIRE(*path == "/docs/R&D notes.md");

        auto angled = recent.lookup("<draft>.md", farDeadline);
        REQUIRE(angled.has_value());
        REQUIRE(*angled == "/docs/<draft>.md");
    }
}
