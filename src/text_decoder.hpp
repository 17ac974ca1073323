#pragma once

/**
 * Conversion of raw file bytes into UTF-8 text.
 */

#include <optional>
#include <string>

namespace incfile {

/**
 * Decodes bytes in the given encoding (UTF-8 when unset) to UTF-8.
 *
 * Line endings are normalized: "\r\n" and lone "\r" become "\n".
 * Throws DecodeError for an unknown encoding or an invalid byte sequence.
 */
std::string decode_text(const std::string& bytes, const std::optional<std::string>& encoding);

// Replaces "\r\n" and lone "\r" with "\n".
std::string normalize_newlines(const std::string& text);

} // namespace incfile
