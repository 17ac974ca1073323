#include "settings.hpp"
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <stdexcept>

namespace incfile {

using json = nlohmann::json;

Settings::Settings()
    : s3_endpoint(DEFAULT_S3_ENDPOINT),
      timeout_seconds(DEFAULT_TIMEOUT_SECONDS) {}

std::optional<Settings> load_settings(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        json j;
        file >> j;

        Settings settings;
        if (j.contains("encoding") && j["encoding"].is_string()) {
            settings.encoding = j["encoding"].get<std::string>();
        }
        settings.temp_dir = j.value("temp_dir", "");
        settings.s3_endpoint = j.value("s3_endpoint", DEFAULT_S3_ENDPOINT);
        settings.timeout_seconds = j.value("timeout_seconds", DEFAULT_TIMEOUT_SECONDS);
        settings.recursive = j.value("recursive", false);
        settings.verbose = j.value("verbose", false);
        return settings;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

void save_settings(const Settings& settings, const std::string& path) {
    json j;
    if (settings.encoding) {
        j["encoding"] = *settings.encoding;
    }
    j["temp_dir"] = settings.temp_dir;
    j["s3_endpoint"] = settings.s3_endpoint;
    j["timeout_seconds"] = settings.timeout_seconds;
    j["recursive"] = settings.recursive;
    j["verbose"] = settings.verbose;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write settings to " + path);
    }
    file << j.dump(2) << std::endl;
}

std::string effective_s3_endpoint(const Settings& settings) {
    const char* env = std::getenv(S3_ENDPOINT_ENV);
    if (env && *env) {
        return env;
    }
    return settings.s3_endpoint;
}

} // namespace incfile
