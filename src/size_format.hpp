#pragma once

/**
 * Human-readable reporting of file sizes.
 */

#include <cstdint>
#include <string>

namespace incfile {

/**
 * A byte count reduced to a display unit.
 */
struct SizeBucket {
    std::uint64_t value;  // Integer value in the chosen unit.
    const char* unit;     // One of B, KB, MB, GB, TB.
    bool large;           // True for GB and above.
};

// Divides by 1024 until the value drops below 1024 or the unit reaches TB.
SizeBucket format_size(std::uint64_t bytes);

// Renders a size as "<value><unit>", followed by a slowness hint when large.
std::string describe_size(std::uint64_t bytes);

} // namespace incfile
