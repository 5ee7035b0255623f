#pragma once

#include "byte_range.hpp"
#include "download_job.hpp"

#include <filesystem>
#include <vector>

namespace rangeget {

/// Concatenates the scratch files of ranges, in ascending index order, into
/// job.finalPath(). Throws MergeError and leaves no final file behind on
/// failure. Scratch files are left untouched.
std::filesystem::path mergeScratchFiles(const DownloadJob& job, std::vector<ByteRange> ranges);

/// Deletes every scratch file the job can produce. Missing files are ignored,
/// files that cannot be removed are logged; never throws.
void removeScratchFiles(const DownloadJob& job) noexcept;

} // namespace rangeget
