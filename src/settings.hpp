#pragma once

/**
 * Settings persistence for the incfile CLI.
 *
 * Handles loading and saving of defaults for decoding, staging and remote
 * storage access to a local JSON file.
 */

#include <optional>
#include <string>

namespace incfile {

/**
 * Application settings stored in .incfile.json.
 */
struct Settings {
    std::optional<std::string> encoding;  // Default text encoding; UTF-8 when unset.
    std::string temp_dir;                 // Staging directory; system default when empty.
    std::string s3_endpoint;              // Path-style endpoint for s3:// URIs.
    long timeout_seconds;                 // Remote transfer timeout.
    bool recursive = false;               // Let ** match across directories.
    bool verbose = false;                 // Enable verbose logging.

    Settings();
};

// Loads settings from path. Returns empty optional if the file doesn't exist
// or is not valid JSON.
std::optional<Settings> load_settings(const std::string& path);

// Saves settings to path.
void save_settings(const Settings& settings, const std::string& path);

// Returns the endpoint to use, honoring the environment override.
std::string effective_s3_endpoint(const Settings& settings);

} // namespace incfile
