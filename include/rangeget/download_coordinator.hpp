#pragma once

#include "download_job.hpp"
#include "http_client.hpp"

#include <filesystem>

namespace rangeget {

class DownloadCoordinator {
public:
    explicit DownloadCoordinator(HttpClientPtr client);

    /// Downloads job with one thread per range and returns the absolute path
    /// of the reassembled file.
    ///
    /// Throws ProbeError when the content length cannot be determined,
    /// ConnectionError when any range fails and MergeError when reassembly
    /// fails. Scratch files never outlive the call.
    std::filesystem::path run(const DownloadJob& job);

private:
    HttpClientPtr client_;
};

} // namespace rangeget
