#pragma once

#include "http_client.hpp"
#include "progress.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rangeget {

struct JobOptions {
    static constexpr int kDefaultWorkers = 4;
    static constexpr std::size_t kDefaultChunkSize = 1024;

    int workers{kDefaultWorkers};
    std::size_t chunk_size{kDefaultChunkSize};
    ProgressCallback progress;
    std::string proxy;
    std::optional<Credentials> credentials;
    std::chrono::milliseconds request_timeout{0};
};

/// Immutable description of one download.
///
/// The constructor validates everything that can be checked locally and
/// throws ConfigurationError, so a constructed job never fails for a bad
/// destination later on.
class DownloadJob {
public:
    DownloadJob(std::string url, std::filesystem::path directory, std::string file_name,
                JobOptions options = {});

    [[nodiscard]] const std::string& url() const { return url_; }
    [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }
    [[nodiscard]] const std::string& fileName() const { return file_name_; }
    [[nodiscard]] int workers() const { return options_.workers; }
    [[nodiscard]] std::size_t chunkSize() const { return options_.chunk_size; }
    [[nodiscard]] const ProgressCallback& progressCallback() const { return options_.progress; }

    [[nodiscard]] RequestOptions request() const;

    // <directory>/<index>_<file name>.temp
    [[nodiscard]] std::filesystem::path scratchPath(int index) const;
    // Every scratch path this job can produce, index 1..workers().
    [[nodiscard]] std::vector<std::filesystem::path> scratchPaths() const;
    [[nodiscard]] std::filesystem::path finalPath() const;

private:
    std::string url_;
    std::filesystem::path directory_;
    std::string file_name_;
    JobOptions options_;
};

} // namespace rangeget
