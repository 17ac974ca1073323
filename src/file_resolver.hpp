#pragma once

/**
 * File pattern resolution for glob-style input.
 *
 * Expands user-provided patterns over the local filesystem. Remote URIs are
 * never expanded.
 */

#include <string>
#include <vector>

namespace incfile {

// Expands a leading "~" or "~user" to the corresponding home directory.
// Returns path unchanged when it has no tilde prefix or the user is unknown.
std::string expand_home(const std::string& path);

// Returns true if pattern contains glob wildcard characters.
bool is_glob_pattern(const std::string& pattern);

// Converts a glob pattern to an equivalent ECMAScript regex.
std::string glob_to_regex(const std::string& glob, bool recursive);

/**
 * Expands a glob pattern to the sorted list of matching paths.
 *
 * Supports:
 *   - Literal paths (returned as-is when they exist)
 *   - * and ? within one path component, never matching a leading '.'
 *   - [...] character classes
 *   - ** matching any directory depth when recursive is set
 *
 * Directories are returned as well as files. Unreadable directories are
 * skipped silently.
 */
std::vector<std::string> expand_glob(const std::string& pattern, bool recursive);

} // namespace incfile
