#pragma once

/**
 * Generation of identifier-safe names for files matched by a glob.
 *
 * Each matched file is exposed downstream under "<base>_<filename>" with every
 * character outside [A-Za-z0-9_] replaced by '_'. Collisions are resolved by
 * appending a random two-digit suffix, so the generated name is not stable
 * across runs when two files share a sanitized basename.
 */

#include <functional>
#include <string>
#include <unordered_set>

namespace incfile {

// Produces the suffix tried after a name collision.
using SuffixGenerator = std::function<std::string()>;

// Returns a generator drawing NAME_SUFFIX_DIGITS random decimal digits.
SuffixGenerator random_suffix_generator();

// Replaces every character outside [A-Za-z0-9_] with '_'.
std::string sanitize_identifier(const std::string& text);

/**
 * Builds a unique name for the file at path and registers it in used.
 *
 * The directory component of path is dropped before sanitizing. While the
 * candidate is taken, a fresh suffix from suffixes is appended to the base
 * candidate and tried again.
 */
std::string make_unique_name(
    const std::string& path,
    const std::string& base_name,
    std::unordered_set<std::string>& used,
    const SuffixGenerator& suffixes
);

} // namespace incfile
