#pragma once

#include "byte_range.hpp"

#include <cstdint>
#include <vector>

namespace rangeget {

/// Splits [0, content_length) into at most worker_count contiguous ranges.
///
/// Boundaries are floor(i * content_length / k) with k = min(worker_count,
/// content_length), so every range is non-empty and the last one ends exactly
/// at content_length. A zero length yields no ranges.
///
/// Throws std::invalid_argument when worker_count < 1.
[[nodiscard]] std::vector<ByteRange> planRanges(std::uint64_t content_length, int worker_count);

} // namespace rangeget
