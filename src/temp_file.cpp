#include "temp_file.hpp"
#include "config.hpp"
#include "verbose.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace incfile {

TempFile::TempFile(const std::string& dir) {
    std::string pattern = (fs::path(dir) / (std::string(TEMP_FILE_PREFIX) + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = ::mkstemp(buffer.data());
    if (fd < 0) {
        throw std::runtime_error("Failed to create temporary file in " + dir + ": " +
                                 std::strerror(errno));
    }
    ::close(fd);

    path_ = buffer.data();
    verbose_log("TEMP", "Created " + path_);
}

TempFile::~TempFile() {
    remove();
}

void TempFile::replace_with(const std::string& source) {
    std::error_code ec;
    fs::rename(source, path_, ec);
    if (!ec) {
        return;
    }

    // rename() cannot cross filesystems; fall back to copy and delete.
    verbose_log("TEMP", "rename failed (" + ec.message() + "), copying " + source);
    fs::copy_file(source, path_, fs::copy_options::overwrite_existing);
    fs::remove(source, ec);
    if (ec) {
        verbose_err("TEMP", "Could not remove " + source + ": " + ec.message());
    }
}

std::string TempFile::release() {
    std::string path = std::move(path_);
    path_.clear();
    return path;
}

void TempFile::remove() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        verbose_err("TEMP", "Could not remove " + path_ + ": " + ec.message());
    } else {
        verbose_log("TEMP", "Removed " + path_);
    }
    path_.clear();
}

std::string default_temp_dir() {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) {
        return "/tmp";
    }
    return dir.string();
}

} // namespace incfile
