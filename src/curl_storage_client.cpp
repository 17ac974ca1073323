#include "curl_storage_client.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "temp_file.hpp"
#include "verbose.hpp"
#include <curl/curl.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace incfile {

// CURL write callback streaming the response body into a FILE*.
static size_t file_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* file = static_cast<std::FILE*>(userdata);
    return std::fwrite(ptr, size, nmemb, file) * size;
}

// Percent-encodes everything except RFC 3986 unreserved characters and '/'.
static std::string escape_key(const std::string& key) {
    static const char* HEX = "0123456789ABCDEF";
    std::string escaped;
    escaped.reserve(key.size());
    for (unsigned char c : key) {
        bool unreserved = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                          c == '.' || c == '~' || c == '/';
        if (unreserved) {
            escaped += static_cast<char>(c);
        } else {
            escaped += '%';
            escaped += HEX[c >> 4];
            escaped += HEX[c & 0x0F];
        }
    }
    return escaped;
}

void parse_s3_uri(const std::string& uri, std::string& bucket, std::string& key) {
    std::string scheme = REMOTE_SCHEME;
    if (uri.compare(0, scheme.size(), scheme) != 0) {
        throw StorageError("Not an S3 URI: " + uri);
    }
    std::string rest = uri.substr(scheme.size());
    size_t slash = rest.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= rest.size()) {
        throw StorageError("S3 URI must name a bucket and a key: " + uri);
    }
    bucket = rest.substr(0, slash);
    key = rest.substr(slash + 1);
}

std::string object_url(const std::string& endpoint, const std::string& bucket, const std::string& key) {
    std::string base = endpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + escape_key(bucket) + "/" + escape_key(key);
}

CurlStorageClient::CurlStorageClient(CurlStorageOptions options)
    : options_(std::move(options)), curl_(nullptr) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    curl_ = curl_easy_init();
    if (!curl_) {
        verbose_err("CURL", "Failed to initialize CURL");
        curl_global_cleanup();
        throw StorageError("Failed to initialize CURL");
    }
}

CurlStorageClient::~CurlStorageClient() {
    curl_easy_cleanup(static_cast<CURL*>(curl_));
    curl_global_cleanup();
}

std::string CurlStorageClient::get(const std::string& uri) {
    std::string bucket;
    std::string key;
    parse_s3_uri(uri, bucket, key);
    std::string url = object_url(options_.endpoint, bucket, key);

    verbose_out("CURL", "GET " + url);

    // Removed automatically unless the download succeeds.
    TempFile download(options_.download_dir);
    std::FILE* file = std::fopen(download.path().c_str(), "wb");
    if (!file) {
        throw StorageError("Cannot open download file " + download.path() + ": " +
                           std::strerror(errno));
    }

    CURL* curl = static_cast<CURL*>(curl_);
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, file_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, file);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    if (options_.timeout_seconds > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_seconds);
    }

    if (is_verbose()) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    bool write_failed = std::fclose(file) != 0;

    if (res != CURLE_OK) {
        verbose_err("CURL", std::string("GET failed: ") + curl_easy_strerror(res));
        throw StorageError("Failed to fetch " + uri + ": " + curl_easy_strerror(res));
    }
    if (http_code >= 400) {
        verbose_err("CURL", "HTTP " + std::to_string(http_code) + " for " + url);
        throw StorageError("Failed to fetch " + uri + ": HTTP " + std::to_string(http_code));
    }
    if (write_failed) {
        throw StorageError("Failed to write download of " + uri + " to " + download.path());
    }

    verbose_in("CURL", "HTTP " + std::to_string(http_code) + " - saved to " + download.path());
    return download.release();
}

StorageClientFactory curl_storage_factory(CurlStorageOptions options) {
    return [options]() -> std::unique_ptr<StorageClient> {
        return std::make_unique<CurlStorageClient>(options);
    };
}

} // namespace incfile
