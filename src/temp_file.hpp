#pragma once

/**
 * Scoped ownership of a temporary file on local disk.
 */

#include <string>

namespace incfile {

/**
 * A uniquely named file created with mkstemp and removed on destruction.
 *
 * Neither copyable nor movable. The file is created empty; callers may
 * replace its contents (for example by renaming another file over it) as
 * long as the path stays the same.
 */
class TempFile {
public:
    // Creates an empty file in dir. Throws std::runtime_error on failure.
    explicit TempFile(const std::string& dir);

    // Removes the file if it still exists.
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&&) = delete;
    TempFile& operator=(TempFile&&) = delete;

    const std::string& path() const { return path_; }

    // Moves the file at source over this temp file, copying across filesystems.
    void replace_with(const std::string& source);

    // Gives up ownership and returns the path; the file is no longer removed.
    std::string release();

private:
    std::string path_;

    void remove();
};

// Directory used for staging when no explicit one is configured.
std::string default_temp_dir();

} // namespace incfile
