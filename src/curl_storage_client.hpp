#pragma once

/**
 * S3 object download over HTTP(S) using libcurl.
 *
 * s3://bucket/key is fetched from "<endpoint>/bucket/key" (path-style
 * addressing), which serves public objects and S3-compatible gateways.
 */

#include "storage_client.hpp"
#include <string>

namespace incfile {

struct CurlStorageOptions {
    std::string endpoint;      // Base URL, without trailing slash.
    std::string download_dir;  // Directory where downloads are written.
    long timeout_seconds;      // Whole-transfer timeout; 0 disables it.
};

/**
 * Storage session backed by a single CURL easy handle.
 *
 * Each session calls curl_global_init() on construction and
 * curl_global_cleanup() on destruction, which is only safe while one session
 * exists at a time on one thread. IncludedFile::resolve() opens a session per
 * fetch and destroys it before returning, so sessions never overlap.
 */
class CurlStorageClient : public StorageClient {
public:
    // Initializes CURL global state and the easy handle.
    explicit CurlStorageClient(CurlStorageOptions options);

    // Releases the easy handle and CURL global state.
    ~CurlStorageClient() override;

    CurlStorageClient(const CurlStorageClient&) = delete;
    CurlStorageClient& operator=(const CurlStorageClient&) = delete;

    std::string get(const std::string& uri) override;

private:
    CurlStorageOptions options_;
    void* curl_;  // CURL* handle; kept opaque to avoid leaking curl.h.
};

/**
 * Splits s3://bucket/key into its parts.
 * Throws StorageError when the URI has no bucket or no key.
 */
void parse_s3_uri(const std::string& uri, std::string& bucket, std::string& key);

// Builds the HTTP(S) URL for an object under a path-style endpoint.
std::string object_url(const std::string& endpoint, const std::string& bucket, const std::string& key);

// Returns a factory opening CurlStorageClient sessions with the given options.
StorageClientFactory curl_storage_factory(CurlStorageOptions options);

} // namespace incfile
