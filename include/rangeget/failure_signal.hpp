#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <utility>

namespace rangeget {

// First-error-wins abort flag shared by the workers of one job.
class FailureSignal {
public:
    // Returns true if this call was the first failure.
    bool raise(std::string message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (raised_.load(std::memory_order_relaxed)) {
            return false;
        }
        message_ = std::move(message);
        raised_.store(true, std::memory_order_release);
        return true;
    }

    [[nodiscard]] bool raised() const { return raised_.load(std::memory_order_acquire); }

    [[nodiscard]] std::string message() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return message_;
    }

private:
    std::atomic<bool> raised_{false};
    mutable std::mutex mutex_;
    std::string message_;
};

} // namespace rangeget
