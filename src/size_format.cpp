#include "size_format.hpp"
#include "config.hpp"

namespace incfile {

SizeBucket format_size(std::uint64_t bytes) {
    std::size_t pos = 0;
    while (pos < SIZE_UNITS.size() - 1 && bytes >= 1024) {
        bytes /= 1024;
        ++pos;
    }
    return SizeBucket{bytes, SIZE_UNITS[pos], pos >= LARGE_SIZE_UNIT};
}

std::string describe_size(std::uint64_t bytes) {
    SizeBucket bucket = format_size(bytes);
    std::string text = std::to_string(bucket.value) + bucket.unit;
    if (bucket.large) {
        text += " ";
        text += LARGE_SIZE_HINT;
    }
    return text;
}

} // namespace incfile
