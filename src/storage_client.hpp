#pragma once

/**
 * Remote object storage seen by the file resolver.
 *
 * A StorageClient object is one client session: it is acquired right before
 * a remote object is fetched and released by destroying it.
 */

#include <functional>
#include <memory>
#include <string>

namespace incfile {

class StorageClient {
public:
    virtual ~StorageClient() = default;

    // Downloads the object at uri to a local file and returns the file's path.
    // The caller takes over the file. Throws StorageError on failure.
    virtual std::string get(const std::string& uri) = 0;
};

// Opens a new storage session.
using StorageClientFactory = std::function<std::unique_ptr<StorageClient>()>;

// Returns true if path names an object in remote storage (s3://...).
bool is_remote_path(const std::string& path);

} // namespace incfile
