#pragma once

/**
 * Verbose tracing for the incfile CLI, enabled by -v/--verbose or the
 * "verbose" setting. Everything goes to stderr so --print output stays clean.
 *
 * Categories in use:
 *   CURL   S3 object transfers
 *   TEMP   temp file creation, renames and removal
 *   GLOB   pattern expansion and matches dropped as unreadable
 *   STAGE  downloads that could not be moved into the staging file
 *   LOG    exceptions thrown by a user-supplied logger
 */

#include <string>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <ctime>

namespace incfile {

/**
 * Set once from main() after settings and flags are merged.
 */
inline bool g_verbose = false;

inline void set_verbose(bool enabled) {
    g_verbose = enabled;
}

/**
 * Lets callers skip building expensive trace messages.
 */
inline bool is_verbose() {
    return g_verbose;
}

/**
 * Wall-clock time as HH:MM:SS.mmm.
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

/**
 * Plain trace line, e.g. TEMP file created or GLOB entry skipped.
 */
inline void verbose_log(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    std::cerr << "\033[90m[" << timestamp() << "] \033[36m[" << category << "]\033[0m " << message << std::endl;
}

/**
 * Outgoing S3 request (CURL >>>).
 */
inline void verbose_out(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    std::cerr << "\033[90m[" << timestamp() << "] \033[33m[" << category << " >>>]\033[0m " << message << std::endl;
}

/**
 * S3 response status and transfer size (CURL <<<).
 */
inline void verbose_in(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    std::cerr << "\033[90m[" << timestamp() << "] \033[32m[" << category << " <<<]\033[0m " << message << std::endl;
}

/**
 * Failure that is handled or rethrown elsewhere, traced here for context:
 * transfer errors, temp files that could not be removed, logger exceptions.
 */
inline void verbose_err(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    std::cerr << "\033[90m[" << timestamp() << "] \033[31m[" << category << " ERR]\033[0m " << message << std::endl;
}

} // namespace incfile
