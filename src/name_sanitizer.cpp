#include "name_sanitizer.hpp"
#include "config.hpp"
#include <filesystem>
#include <memory>
#include <random>

namespace fs = std::filesystem;

namespace incfile {

SuffixGenerator random_suffix_generator() {
    auto rng = std::make_shared<std::mt19937>(std::random_device{}());
    return [rng]() {
        std::uniform_int_distribution<int> digit(0, 9);
        std::string suffix;
        for (int i = 0; i < NAME_SUFFIX_DIGITS; ++i) {
            suffix += static_cast<char>('0' + digit(*rng));
        }
        return suffix;
    };
}

std::string sanitize_identifier(const std::string& text) {
    std::string result = text;
    for (char& c : result) {
        bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_';
        if (!keep) {
            c = '_';
        }
    }
    return result;
}

std::string make_unique_name(
    const std::string& path,
    const std::string& base_name,
    std::unordered_set<std::string>& used,
    const SuffixGenerator& suffixes
) {
    std::string filename = fs::path(path).filename().string();
    std::string name = sanitize_identifier(base_name) + "_" + sanitize_identifier(filename);

    std::string ending;
    while (used.count(name + ending) > 0) {
        ending = sanitize_identifier(suffixes());
    }
    name += ending;
    used.insert(name);
    return name;
}

} // namespace incfile
