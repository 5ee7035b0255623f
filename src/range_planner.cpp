#include "rangeget/range_planner.hpp"

#include <algorithm>
#include <stdexcept>

namespace rangeget {

namespace {

// floor(i * length / parts) without overflowing 64 bits.
std::uint64_t boundary(std::uint64_t length, std::uint64_t parts, std::uint64_t i) {
    return (length / parts) * i + (length % parts) * i / parts;
}

} // namespace

std::vector<ByteRange> planRanges(std::uint64_t content_length, int worker_count) {
    if (worker_count < 1) {
        throw std::invalid_argument("worker count must be at least 1");
    }

    const std::uint64_t parts = std::min<std::uint64_t>(static_cast<std::uint64_t>(worker_count), content_length);

    std::vector<ByteRange> ranges;
    ranges.reserve(parts);
    for (std::uint64_t i = 1; i <= parts; ++i) {
        ranges.push_back({static_cast<int>(i), boundary(content_length, parts, i - 1),
                          boundary(content_length, parts, i)});
    }
    return ranges;
}

} // namespace rangeget
