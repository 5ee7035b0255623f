#include "rangeget/download_job.hpp"
#include "rangeget/errors.hpp"

#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace rangeget {

DownloadJob::DownloadJob(std::string url, std::filesystem::path directory, std::string file_name,
                         JobOptions options)
    : url_(std::move(url)),
      directory_(std::move(directory)),
      file_name_(std::move(file_name)),
      options_(std::move(options)) {
    if (directory_.empty()) {
        throw ConfigurationError("Destination directory is empty");
    }

    std::error_code ec;
    const auto status = std::filesystem::status(directory_, ec);
    if (!std::filesystem::exists(status)) {
        throw ConfigurationError(fmt::format("Destination directory does not exist: {}", directory_.string()));
    }
    if (!std::filesystem::is_directory(status)) {
        throw ConfigurationError(fmt::format("Destination must be a directory: {}", directory_.string()));
    }

    if (file_name_.empty()) {
        throw ConfigurationError("Destination file name is empty");
    }
    if (std::filesystem::path{file_name_}.has_parent_path()) {
        throw ConfigurationError(fmt::format("Destination file name must not contain a directory: {}", file_name_));
    }
    if (options_.workers < 1) {
        throw ConfigurationError(fmt::format("Invalid worker count: {}", options_.workers));
    }
    if (options_.chunk_size == 0) {
        throw ConfigurationError("Chunk size must be positive");
    }
    if (options_.request_timeout.count() < 0) {
        throw ConfigurationError("Request timeout must not be negative");
    }

    directory_ = std::filesystem::absolute(directory_, ec);
    if (ec) {
        throw ConfigurationError(fmt::format("Cannot resolve destination directory: {}", ec.message()));
    }
}

RequestOptions DownloadJob::request() const {
    return {url_, options_.proxy, options_.credentials, options_.request_timeout};
}

std::filesystem::path DownloadJob::scratchPath(int index) const {
    return directory_ / fmt::format("{}_{}.temp", index, file_name_);
}

std::vector<std::filesystem::path> DownloadJob::scratchPaths() const {
    std::vector<std::filesystem::path> paths;
    paths.reserve(static_cast<std::size_t>(options_.workers));
    for (int i = 1; i <= options_.workers; ++i) {
        paths.push_back(scratchPath(i));
    }
    return paths;
}

std::filesystem::path DownloadJob::finalPath() const { return directory_ / file_name_; }

} // namespace rangeget
