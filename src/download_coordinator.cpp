#include "rangeget/download_coordinator.hpp"
#include "rangeget/errors.hpp"
#include "rangeget/failure_signal.hpp"
#include "rangeget/fetch_worker.hpp"
#include "rangeget/progress.hpp"
#include "rangeget/range_planner.hpp"
#include "rangeget/scratch_files.hpp"

#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangeget {

DownloadCoordinator::DownloadCoordinator(HttpClientPtr client) : client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("DownloadCoordinator requires an HTTP client");
    }
}

std::filesystem::path DownloadCoordinator::run(const DownloadJob& job) {
    const std::uint64_t content_length = client_->contentLength(job.request());
    const auto ranges = planRanges(content_length, job.workers());
    spdlog::info("Downloading {} ({} bytes) into {} with {} ranges", job.url(), content_length,
                 job.finalPath().string(), ranges.size());

    //清理上次失败留下的临时文件
    removeScratchFiles(job);

    ProgressState progress(content_length, job.progressCallback());
    FailureSignal failure;

    std::vector<std::thread> workers;
    workers.reserve(ranges.size());
    try {
        for (const auto& range : ranges) {
            workers.emplace_back([this, &job, &progress, &failure, range]() {
                try {
                    FetchWorker(*client_, job, progress, failure).fetch(range);
                } catch (const std::exception& ex) {
                    if (failure.raise(fmt::format("range {} [{}, {}): {}", range.index, range.start, range.end,
                                                  ex.what()))) {
                        spdlog::error("Worker {} failed: {}", range.index, ex.what());
                    }
                } catch (...) {
                    if (failure.raise(fmt::format("range {} [{}, {}): unknown error", range.index, range.start,
                                                  range.end))) {
                        spdlog::error("Worker {} failed with an unknown error", range.index);
                    }
                }
            });
        }
    } catch (const std::system_error& ex) {
        failure.raise(fmt::format("cannot start worker thread: {}", ex.what()));
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();

    if (failure.raised()) {
        removeScratchFiles(job);
        throw ConnectionError(fmt::format("Connection failed, scratch files deleted: {}", failure.message()));
    }

    std::filesystem::path destination;
    try {
        destination = mergeScratchFiles(job, ranges);
    } catch (...) {
        removeScratchFiles(job);
        throw;
    }
    removeScratchFiles(job);

    spdlog::info("Saved {} ({} bytes)", destination.string(), progress.receivedBytes());
    return destination;
}

} // namespace rangeget
