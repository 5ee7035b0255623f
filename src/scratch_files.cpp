#include "rangeget/scratch_files.hpp"
#include "rangeget/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <memory>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangeget {

namespace {

constexpr std::size_t kMergeBlockSize = 1024 * 1024;

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

void appendFile(FILE* out, const std::filesystem::path& source, std::vector<char>& buffer) {
    FilePtr in{std::fopen(source.c_str(), "rb")};
    if (!in) {
        throw MergeError(fmt::format("Cannot open scratch file {}", source.string()));
    }

    while (true) {
        const size_t read = std::fread(buffer.data(), 1, buffer.size(), in.get());
        if (read > 0 && std::fwrite(buffer.data(), 1, read, out) != read) {
            throw MergeError(fmt::format("Failed to append {} to output file", source.string()));
        }
        if (read < buffer.size()) {
            if (std::ferror(in.get())) {
                throw MergeError(fmt::format("Failed to read scratch file {}", source.string()));
            }
            break;
        }
    }
}

void removeQuietly(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

} // namespace

std::filesystem::path mergeScratchFiles(const DownloadJob& job, std::vector<ByteRange> ranges) {
    std::sort(ranges.begin(), ranges.end(),
              [](const ByteRange& lhs, const ByteRange& rhs) { return lhs.index < rhs.index; });

    const auto destination = job.finalPath();
    FilePtr out{std::fopen(destination.c_str(), "wb")};
    if (!out) {
        throw MergeError(fmt::format("Cannot create output file {}", destination.string()));
    }

    try {
        std::vector<char> buffer(kMergeBlockSize);
        for (const auto& range : ranges) {
            appendFile(out.get(), job.scratchPath(range.index), buffer);
        }

        FILE* file = out.release();
        if (std::fclose(file) != 0) {
            throw MergeError(fmt::format("Failed to close output file {}", destination.string()));
        }
    } catch (...) {
        out.reset();
        removeQuietly(destination);
        throw;
    }

    spdlog::debug("Merged {} scratch files into {}", ranges.size(), destination.string());
    return destination;
}

void removeScratchFiles(const DownloadJob& job) noexcept {
    for (const auto& path : job.scratchPaths()) {
        std::error_code ec;
        if (std::filesystem::remove(path, ec)) {
            spdlog::debug("Removed scratch file {}", path.string());
        } else if (ec) {
            spdlog::warn("Could not remove scratch file {}: {}", path.string(), ec.message());
        }
    }
}

} // namespace rangeget
