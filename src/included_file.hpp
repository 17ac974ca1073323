#pragma once

/**
 * Resolution of a single user-supplied file into in-memory content.
 *
 * The path may be local or an s3:// URI. Remote objects are staged into a
 * private temporary file for the duration of one resolve() call and read
 * exactly like local files.
 */

#include "storage_client.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace incfile {

// Receives one formatted progress message.
using Logger = std::function<void(const std::string&)>;

// Decoded UTF-8 text, or raw bytes for binary inclusion.
using FileContent = std::variant<std::string, std::vector<std::uint8_t>>;

/**
 * Collaborators and locations used while resolving files.
 */
struct ResolveOptions {
    std::string temp_dir;          // Staging directory for remote objects.
    StorageClientFactory storage;  // Opens a storage session; required for s3:// paths.
};

// Outcome of the pre-flight check on a path.
struct Reachability {
    bool ok;
    std::string reason;  // Empty when ok.
};

class IncludedFile {
public:
    IncludedFile(Logger logger, bool is_text, std::optional<std::string> encoding,
                 std::string path, ResolveOptions options);

    // Remote URIs always pass; local paths must open for reading.
    static Reachability check_reachable(const std::string& path);

    // Same as check_reachable, but throws UnreachableError on failure.
    static void require_reachable(const std::string& path);

    /**
     * Reads the file and returns its content.
     *
     * Throws ResolutionError on decode or read failures and StorageError
     * when a remote fetch fails. A staged temporary copy never outlives
     * the call.
     */
    FileContent resolve();

    // Origin path as given by the user.
    const std::string& name() const { return path_; }

    // Size in bytes from the last successful resolve(); 0 before.
    std::uint64_t size() const { return size_; }

private:
    Logger logger_;
    bool is_text_;
    std::optional<std::string> encoding_;
    std::string path_;
    ResolveOptions options_;
    std::uint64_t size_ = 0;

    FileContent read_local(const std::string& local_path);
    void log(const std::string& message) const;
};

} // namespace incfile
