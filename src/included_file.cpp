#include "included_file.hpp"
#include "errors.hpp"
#include "size_format.hpp"
#include "temp_file.hpp"
#include "text_decoder.hpp"
#include "verbose.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <new>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace incfile {

static constexpr std::size_t READ_CHUNK = 64 * 1024;

// Reads path to end of file into buffer, reserving expected bytes up front.
// The stat size is only a hint: procfs reports 0 and pipes report nothing.
// Returns false when the file cannot be opened, the stream goes bad, or the
// buffer cannot grow.
template <typename Buffer>
static bool read_all(const std::string& path, std::uint64_t expected, Buffer& buffer) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    try {
        buffer.clear();
        buffer.reserve(static_cast<size_t>(expected));
        size_t filled = 0;
        while (file) {
            buffer.resize(filled + READ_CHUNK);
            file.read(reinterpret_cast<char*>(&buffer[filled]), static_cast<std::streamsize>(READ_CHUNK));
            filled += static_cast<size_t>(file.gcount());
        }
        buffer.resize(filled);
    } catch (const std::bad_alloc&) {
        return false;
    } catch (const std::length_error&) {
        return false;
    }
    return !file.bad();
}

IncludedFile::IncludedFile(Logger logger, bool is_text, std::optional<std::string> encoding,
                           std::string path, ResolveOptions options)
    : logger_(std::move(logger)),
      is_text_(is_text),
      encoding_(std::move(encoding)),
      path_(std::move(path)),
      options_(std::move(options)) {}

Reachability IncludedFile::check_reachable(const std::string& path) {
    if (is_remote_path(path)) {
        // Existence is left to the storage client at resolution time.
        return {true, ""};
    }

    std::error_code ec;
    bool is_dir = fs::is_directory(path, ec);
    std::ifstream file(path);
    if (is_dir || !file) {
        return {false, "Could not open file '" + path + "'"};
    }
    return {true, ""};
}

void IncludedFile::require_reachable(const std::string& path) {
    Reachability reach = check_reachable(path);
    if (!reach.ok) {
        throw UnreachableError(reach.reason);
    }
}

FileContent IncludedFile::resolve() {
    if (!is_remote_path(path_)) {
        return read_local(path_);
    }

    if (!options_.storage) {
        throw StorageError("No storage client configured to fetch " + path_);
    }

    std::string dir = options_.temp_dir.empty() ? default_temp_dir() : options_.temp_dir;
    TempFile staged(dir);
    log("Fetching " + path_ + " from S3 to temporary file " + staged.path());

    {
        std::unique_ptr<StorageClient> session = options_.storage();
        std::string fetched = session->get(path_);
        try {
            staged.replace_with(fetched);
        } catch (const std::exception& e) {
            std::error_code ec;
            fs::remove(fetched, ec);
            verbose_err("STAGE", "Could not stage " + fetched + ": " + e.what());
            throw;
        }
    }

    return read_local(staged.path());
}

FileContent IncludedFile::read_local(const std::string& local_path) {
    std::error_code ec;
    std::uint64_t stat_size = fs::file_size(local_path, ec);
    if (ec) {
        stat_size = 0;
    }

    std::string raw;
    std::vector<std::uint8_t> bytes;
    bool ok = is_text_ ? read_all(local_path, stat_size, raw) : read_all(local_path, stat_size, bytes);
    if (!ok) {
        throw ResolutionError(ResolutionError::Kind::Oversized,
                              "Cannot read file at " + path_ + ": file too large or unreadable");
    }

    // Pipes and character devices have no stat size; report what was read.
    size_ = ec ? (is_text_ ? raw.size() : bytes.size()) : stat_size;
    log("Including file " + path_ + " of size " + describe_size(size_));

    if (!is_text_) {
        return bytes;
    }
    try {
        return decode_text(raw, encoding_);
    } catch (const DecodeError& e) {
        throw ResolutionError(ResolutionError::Kind::Decode,
                              "Cannot decode file at " + path_ + ": " + e.what());
    }
}

void IncludedFile::log(const std::string& message) const {
    if (!logger_) {
        return;
    }
    try {
        logger_(message);
    } catch (const std::exception& e) {
        verbose_err("LOG", std::string("Logger failed: ") + e.what());
    }
}

} // namespace incfile
