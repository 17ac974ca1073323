#pragma once

/**
 * Application configuration constants.
 *
 * Defines file paths, remote storage defaults, and size reporting units for
 * the incfile CLI.
 */

#include <array>
#include <cstddef>

namespace incfile {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".incfile.json";      // Local settings file.
constexpr const char* TEMP_FILE_PREFIX = "incfile-";        // Prefix for staged temp files.

// ========== Remote Storage ==========

constexpr const char* REMOTE_SCHEME = "s3://";                        // Remote object URI scheme.
constexpr const char* DEFAULT_S3_ENDPOINT = "https://s3.amazonaws.com";  // Path-style endpoint.
constexpr const char* S3_ENDPOINT_ENV = "INCFILE_S3_ENDPOINT";        // Endpoint override.
constexpr long DEFAULT_TIMEOUT_SECONDS = 300;                         // Transfer timeout.

// ========== Size Reporting ==========

// Units used when reporting the size of an included file.
inline constexpr std::array<const char*, 5> SIZE_UNITS = {"B", "KB", "MB", "GB", "TB"};

// Unit index from which an inclusion is reported as slow.
constexpr std::size_t LARGE_SIZE_UNIT = 3;

constexpr const char* LARGE_SIZE_HINT = "(this may take a while)";

// ========== Generated Names ==========

constexpr int NAME_SUFFIX_DIGITS = 2;  // Digits drawn per collision retry.

} // namespace incfile
