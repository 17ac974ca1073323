#include <catch2/catch.hpp>
#include "errors.hpp"
#include "included_file.hpp"
#include "test_helpers.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace incfile;
using namespace incfile::testing;

// Builds a logger appending into collector.
static Logger collect(LogCollector& collector) {
    return [&collector](const std::string& message) { collector(message); };
}

// ============================================================================
// Reachability
// ============================================================================

TEST_CASE("Existing local file is reachable", "[reach]") {
    ScratchDir dir;
    std::string path = dir.write("a.txt", "x");
    Reachability reach = IncludedFile::check_reachable(path);
    REQUIRE(reach.ok);
    REQUIRE(reach.reason.empty());
}

TEST_CASE("Missing local file is unreachable with a reason", "[reach]") {
    ScratchDir dir;
    std::string path = (dir.path() / "missing.txt").string();
    Reachability reach = IncludedFile::check_reachable(path);
    REQUIRE_FALSE(reach.ok);
    REQUIRE(reach.reason == "Could not open file '" + path + "'");
    REQUIRE_THROWS_AS(IncludedFile::require_reachable(path), UnreachableError);
}

TEST_CASE("Directory is unreachable", "[reach]") {
    ScratchDir dir;
    REQUIRE_FALSE(IncludedFile::check_reachable(dir.mkdir("sub")).ok);
}

TEST_CASE("Remote URIs are reachable without a lookup", "[reach]") {
    REQUIRE(IncludedFile::check_reachable("s3://bucket/does/not/exist").ok);
}

// ============================================================================
// Local resolution
// ============================================================================

TEST_CASE("Text file of 5000 bytes resolves to 5000 characters", "[resolve]") {
    ScratchDir dir;
    std::string path = dir.write("five.txt", std::string(5000, 'q'));
    LogCollector logs;
    IncludedFile file(collect(logs), true, std::nullopt, path, ResolveOptions{});

    REQUIRE(file.size() == 0);
    FileContent content = file.resolve();

    REQUIRE(std::holds_alternative<std::string>(content));
    REQUIRE(std::get<std::string>(content).size() == 5000);
    REQUIRE(file.size() == 5000);
    REQUIRE(file.name() == path);
    REQUIRE(logs.contains("Including file " + path + " of size 4KB"));
}

TEST_CASE("Construction does not read the file", "[resolve]") {
    ScratchDir dir;
    std::string path = dir.write("lazy.txt", "before");
    IncludedFile file(Logger{}, true, std::nullopt, path, ResolveOptions{});
    dir.write("lazy.txt", "after!");
    REQUIRE(std::get<std::string>(file.resolve()) == "after!");
}

TEST_CASE("Binary file resolves to raw bytes", "[resolve]") {
    ScratchDir dir;
    std::string data("\x00\x01\xff\r\n", 5);
    std::string path = dir.write("blob.bin", data);
    IncludedFile file(Logger{}, false, std::nullopt, path, ResolveOptions{});

    FileContent content = file.resolve();
    REQUIRE(std::holds_alternative<std::vector<std::uint8_t>>(content));
    const auto& bytes = std::get<std::vector<std::uint8_t>>(content);
    REQUIRE(bytes == std::vector<std::uint8_t>{0x00, 0x01, 0xff, '\r', '\n'});
    REQUIRE(file.size() == 5);
}

TEST_CASE("Empty file resolves to empty content", "[resolve][edge]") {
    ScratchDir dir;
    std::string path = dir.write("empty.txt", "");
    IncludedFile file(Logger{}, true, std::nullopt, path, ResolveOptions{});
    REQUIRE(std::get<std::string>(file.resolve()).empty());
    REQUIRE(file.size() == 0);
}

TEST_CASE("Text in the wrong encoding raises a decode error", "[resolve]") {
    ScratchDir dir;
    std::string path = dir.write("latin.txt", "caf\xe9");
    IncludedFile file(Logger{}, true, std::string("utf-8"), path, ResolveOptions{});
    try {
        file.resolve();
        FAIL("expected ResolutionError");
    } catch (const ResolutionError& e) {
        REQUIRE(e.kind() == ResolutionError::Kind::Decode);
        REQUIRE(std::string(e.what()).find(path) != std::string::npos);
    }
}

TEST_CASE("Explicit encoding is honored", "[resolve]") {
    ScratchDir dir;
    std::string path = dir.write("latin.txt", "caf\xe9");
    IncludedFile file(Logger{}, true, std::string("latin-1"), path, ResolveOptions{});
    REQUIRE(std::get<std::string>(file.resolve()) == "caf\xc3\xa9");
}

TEST_CASE("Throwing logger does not abort resolution", "[resolve]") {
    ScratchDir dir;
    std::string path = dir.write("a.txt", "ok");
    Logger broken = [](const std::string&) { throw std::runtime_error("log sink down"); };
    IncludedFile file(broken, true, std::nullopt, path, ResolveOptions{});
    REQUIRE(std::get<std::string>(file.resolve()) == "ok");
}

TEST_CASE("Resolving twice reads the file again", "[resolve]") {
    ScratchDir dir;
    std::string path = dir.write("grow.txt", "abc");
    IncludedFile file(Logger{}, true, std::nullopt, path, ResolveOptions{});
    file.resolve();
    REQUIRE(file.size() == 3);
    dir.write("grow.txt", "abcdef");
    file.resolve();
    REQUIRE(file.size() == 6);
}

TEST_CASE("procfs file is read to end of file despite a zero stat size", "[resolve][edge]") {
    if (!fs::exists("/proc/self/status")) {
        return;
    }
    IncludedFile file(Logger{}, true, std::nullopt, "/proc/self/status", ResolveOptions{});
    std::string text = std::get<std::string>(file.resolve());
    REQUIRE_FALSE(text.empty());
    REQUIRE(text.find("Name:") != std::string::npos);
}

TEST_CASE("Pipe resolves to the bytes written into it", "[resolve][edge]") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    REQUIRE(::write(fds[1], "hello\n", 6) == 6);
    ::close(fds[1]);

    std::string path = "/dev/fd/" + std::to_string(fds[0]);
    REQUIRE(IncludedFile::check_reachable(path).ok);

    LogCollector logs;
    IncludedFile file(collect(logs), true, std::nullopt, path, ResolveOptions{});
    std::string text = std::get<std::string>(file.resolve());
    ::close(fds[0]);

    REQUIRE(text == "hello\n");
    REQUIRE(file.size() == 6);
    REQUIRE(logs.contains("Including file " + path + " of size 6B"));
}

// ============================================================================
// Remote resolution
// ============================================================================

TEST_CASE("Remote file is staged, read, and its temp copy removed", "[remote]") {
    ScratchDir staging;
    ScratchDir downloads;
    auto storage = std::make_shared<FakeStorage>();
    storage->download_dir = downloads.path().string();
    storage->objects["s3://bucket/key.txt"] = "remote text";

    LogCollector logs;
    IncludedFile file(collect(logs), true, std::nullopt, "s3://bucket/key.txt",
                      ResolveOptions{staging.path().string(), fake_storage_factory(storage)});

    REQUIRE(std::get<std::string>(file.resolve()) == "remote text");
    REQUIRE(file.size() == 11);
    REQUIRE(file.name() == "s3://bucket/key.txt");

    REQUIRE(storage->gets == 1);
    REQUIRE(storage->sessions_opened == 1);
    REQUIRE(storage->sessions_closed == 1);
    REQUIRE(logs.contains("Fetching s3://bucket/key.txt from S3 to temporary file " +
                          staging.path().string()));
    REQUIRE(logs.contains("Including file s3://bucket/key.txt of size 11B"));

    // Both the staged copy and the client's download are gone.
    REQUIRE(staging.count() == 0);
    REQUIRE(downloads.count() == 0);
}

TEST_CASE("Remote temp file is removed when decoding fails", "[remote]") {
    ScratchDir staging;
    ScratchDir downloads;
    auto storage = std::make_shared<FakeStorage>();
    storage->download_dir = downloads.path().string();
    storage->objects["s3://bucket/bad.txt"] = "\xff\xfe\xfd";

    IncludedFile file(Logger{}, true, std::nullopt, "s3://bucket/bad.txt",
                      ResolveOptions{staging.path().string(), fake_storage_factory(storage)});

    REQUIRE_THROWS_AS(file.resolve(), ResolutionError);
    REQUIRE(staging.count() == 0);
    REQUIRE(downloads.count() == 0);
}

TEST_CASE("Remote temp file is removed when the fetch fails", "[remote]") {
    ScratchDir staging;
    ScratchDir downloads;
    auto storage = std::make_shared<FakeStorage>();
    storage->download_dir = downloads.path().string();

    IncludedFile file(Logger{}, false, std::nullopt, "s3://bucket/missing.bin",
                      ResolveOptions{staging.path().string(), fake_storage_factory(storage)});

    REQUIRE_THROWS_AS(file.resolve(), StorageError);
    REQUIRE(staging.count() == 0);
    REQUIRE(storage->sessions_closed == storage->sessions_opened);
    REQUIRE(file.size() == 0);
}

TEST_CASE("Each remote resolution fetches again", "[remote]") {
    ScratchDir staging;
    ScratchDir downloads;
    auto storage = std::make_shared<FakeStorage>();
    storage->download_dir = downloads.path().string();
    storage->objects["s3://b/k"] = "v1";

    IncludedFile file(Logger{}, true, std::nullopt, "s3://b/k",
                      ResolveOptions{staging.path().string(), fake_storage_factory(storage)});
    REQUIRE(std::get<std::string>(file.resolve()) == "v1");
    storage->objects["s3://b/k"] = "v2!";
    REQUIRE(std::get<std::string>(file.resolve()) == "v2!");
    REQUIRE(storage->gets == 2);
    REQUIRE(staging.count() == 0);
}

TEST_CASE("Remote path without a storage client fails", "[remote]") {
    IncludedFile file(Logger{}, true, std::nullopt, "s3://b/k", ResolveOptions{});
    REQUIRE_THROWS_AS(file.resolve(), StorageError);
}

// Storage session whose download is a dangling symlink, so the staged file
// cannot be opened once the download is moved into place.
class DanglingLinkClient : public StorageClient {
public:
    explicit DanglingLinkClient(std::string dir) : dir_(std::move(dir)) {}

    std::string get(const std::string&) override {
        fs::path link = fs::path(dir_) / "download-link";
        fs::create_symlink(fs::path(dir_) / "no-such-target", link);
        return link.string();
    }

private:
    std::string dir_;
};

TEST_CASE("Unreadable remote download raises Oversized and is cleaned up", "[remote][edge]") {
    ScratchDir staging;
    ScratchDir downloads;
    std::string download_dir = downloads.path().string();
    StorageClientFactory factory = [download_dir]() -> std::unique_ptr<StorageClient> {
        return std::make_unique<DanglingLinkClient>(download_dir);
    };

    IncludedFile file(Logger{}, false, std::nullopt, "s3://bucket/blob.bin",
                      ResolveOptions{staging.path().string(), factory});

    try {
        file.resolve();
        FAIL("expected ResolutionError");
    } catch (const ResolutionError& e) {
        REQUIRE(e.kind() == ResolutionError::Kind::Oversized);
        REQUIRE(std::string(e.what()).find("file too large or unreadable") != std::string::npos);
    }
    REQUIRE(staging.count() == 0);
    REQUIRE(downloads.count() == 0);
    REQUIRE(file.size() == 0);
}
