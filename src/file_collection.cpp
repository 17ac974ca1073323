#include "file_collection.hpp"
#include "verbose.hpp"

namespace incfile {

FileCollection::FileCollection(std::string base_name, Logger logger, bool is_text,
                               std::optional<std::string> encoding, ResolveOptions options,
                               SuffixGenerator suffixes)
    : base_name_(std::move(base_name)),
      logger_(std::move(logger)),
      is_text_(is_text),
      encoding_(std::move(encoding)),
      options_(std::move(options)),
      suffixes_(std::move(suffixes)) {}

bool FileCollection::add_match(const std::string& path) {
    // Glob expansion is local only, so this is a plain open check.
    Reachability reach = IncludedFile::check_reachable(path);
    if (!reach.ok) {
        verbose_log("GLOB", "Skipping " + path + ": " + reach.reason);
        return false;
    }

    std::string name = make_unique_name(path, base_name_, used_names_, suffixes_);
    entries_.emplace_back(name, IncludedFile(logger_, is_text_, encoding_, path, options_));
    return true;
}

std::map<std::string, std::string> FileCollection::reference_map() const {
    std::map<std::string, std::string> result;
    for (const auto& [name, file] : entries_) {
        result[name] = file.name();
    }
    return result;
}

IncludedFile* FileCollection::find(const std::string& name) {
    for (auto& entry : entries_) {
        if (entry.first == name) {
            return &entry.second;
        }
    }
    return nullptr;
}

std::optional<ResolvedEntry> FileCollection::Producer::next() {
    if (index_ >= collection_.entries_.size()) {
        return std::nullopt;
    }
    auto& [name, file] = collection_.entries_[index_++];
    FileContent content = file.resolve();
    return ResolvedEntry{name, std::move(content), file.size()};
}

} // namespace incfile
