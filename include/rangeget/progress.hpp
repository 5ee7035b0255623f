#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>

namespace rangeget {

/// (bytes received so far across all ranges, content length, bytes in this chunk)
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t, std::size_t)>;

/// Wraps fn so that it receives args... after the three progress arguments.
template <typename Fn, typename... Args>
ProgressCallback bindProgressArgs(Fn fn, Args... args) {
    return [fn = std::move(fn), args...](std::uint64_t received, std::uint64_t total, std::size_t chunk) {
        fn(received, total, chunk, args...);
    };
}

// Byte counter shared by every worker of one job.
class ProgressState {
public:
    ProgressState(std::uint64_t total_bytes, ProgressCallback callback)
        : total_bytes_(total_bytes), callback_(std::move(callback)) {}

    ProgressState(const ProgressState&) = delete;
    ProgressState& operator=(const ProgressState&) = delete;

    // The callback runs under the lock so observed totals never go backwards.
    void add(std::size_t chunk) {
        std::lock_guard<std::mutex> lock(mutex_);
        received_bytes_ += chunk;
        if (callback_) {
            callback_(received_bytes_, total_bytes_, chunk);
        }
    }

    [[nodiscard]] std::uint64_t receivedBytes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_bytes_;
    }

    [[nodiscard]] std::uint64_t totalBytes() const { return total_bytes_; }

private:
    const std::uint64_t total_bytes_;
    ProgressCallback callback_;

    mutable std::mutex mutex_;
    std::uint64_t received_bytes_{0};
};

} // namespace rangeget
