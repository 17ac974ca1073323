#pragma once

/**
 * A set of files matched by one glob pattern, each under a generated name.
 */

#include "included_file.hpp"
#include "name_sanitizer.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace incfile {

/**
 * One resolved member of a collection.
 */
struct ResolvedEntry {
    std::string name;      // Generated identifier.
    FileContent content;   // Text or bytes.
    std::uint64_t size;    // Size in bytes of the resolved file.
};

/**
 * Maps generated identifiers to unresolved files.
 *
 * Names are "<base_name>_<sanitized filename>", deduplicated with a random
 * suffix. Members are kept in insertion order. Matches that cannot be opened
 * are dropped without any diagnostic; this is a best-effort policy, so an
 * empty collection is a valid result.
 */
class FileCollection {
public:
    /**
     * One-pass, lazy resolution over a collection.
     *
     * Each next() resolves one more entry; resolution errors propagate to the
     * caller. Starting another pass re-resolves (and re-fetches) every file.
     */
    class Producer {
    public:
        explicit Producer(FileCollection& collection) : collection_(collection) {}

        // Resolves the next entry, or returns nullopt after the last one.
        std::optional<ResolvedEntry> next();

    private:
        FileCollection& collection_;
        size_t index_ = 0;
    };

    FileCollection(std::string base_name, Logger logger, bool is_text,
                   std::optional<std::string> encoding, ResolveOptions options,
                   SuffixGenerator suffixes = random_suffix_generator());

    // Adds path under a new generated name. Returns false, leaving the
    // collection unchanged, when path cannot be opened.
    bool add_match(const std::string& path);

    // Generated name to origin path, without resolving anything.
    std::map<std::string, std::string> reference_map() const;

    // Starts a resolution pass over all entries.
    Producer produce_all() { return Producer(*this); }

    // Returns the member registered under name, or nullptr.
    IncludedFile* find(const std::string& name);

    const std::string& base_name() const { return base_name_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::string base_name_;
    Logger logger_;
    bool is_text_;
    std::optional<std::string> encoding_;
    ResolveOptions options_;
    SuffixGenerator suffixes_;

    std::vector<std::pair<std::string, IncludedFile>> entries_;
    std::unordered_set<std::string> used_names_;
};

} // namespace incfile
