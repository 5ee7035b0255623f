#pragma once

#include <cstdint>

namespace rangeget {

// Half-open span [start, end) of the remote resource. index is the 1-based
// worker identity and names the scratch file.
struct ByteRange {
    int index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t size() const { return end - start; }
};

inline bool operator==(const ByteRange& lhs, const ByteRange& rhs) {
    return lhs.index == rhs.index && lhs.start == rhs.start && lhs.end == rhs.end;
}

inline bool operator!=(const ByteRange& lhs, const ByteRange& rhs) { return !(lhs == rhs); }

} // namespace rangeget
