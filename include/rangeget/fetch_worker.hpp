#pragma once

#include "byte_range.hpp"
#include "download_job.hpp"
#include "failure_signal.hpp"
#include "http_client.hpp"
#include "progress.hpp"

#include <filesystem>

namespace rangeget {

// Downloads one range of a job into its scratch file.
class FetchWorker {
public:
    FetchWorker(HttpClient& client, const DownloadJob& job, ProgressState& progress,
                const FailureSignal& failure)
        : client_(client), job_(job), progress_(progress), failure_(failure) {}

    /// Returns the scratch file path. Throws FetchError; the scratch file may
    /// be left partially written.
    std::filesystem::path fetch(const ByteRange& range);

private:
    HttpClient& client_;
    const DownloadJob& job_;
    ProgressState& progress_;
    const FailureSignal& failure_;
};

} // namespace rangeget
