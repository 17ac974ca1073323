#pragma once

/**
 * Error types raised while checking and resolving included files.
 */

#include <stdexcept>
#include <string>

namespace incfile {

// A local path failed the pre-flight open check.
class UnreachableError : public std::runtime_error {
public:
    explicit UnreachableError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Failure while turning an already located file into content.
 *
 * Decode covers text that is not valid in the requested encoding; Oversized
 * covers a raw read that failed even though the file exists.
 */
class ResolutionError : public std::runtime_error {
public:
    enum class Kind {
        Decode,
        Oversized
    };

    ResolutionError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Raised by storage clients when a remote object cannot be fetched.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised by the text decoder; wrapped into ResolutionError by the resolver.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace incfile
