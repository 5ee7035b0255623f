#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace rangeget {

// Single-line terminal progress display for the CLI.
class ProgressBar {
public:
    ProgressBar(std::ostream& out, std::string name);

    void update(std::uint64_t received, std::uint64_t total);
    void finish();

    static std::string formatLine(const std::string& name, std::uint64_t received, std::uint64_t total);
    static std::string formatSize(std::uint64_t bytes);

private:
    void redraw(std::uint64_t received, std::uint64_t total);

    std::ostream& out_;
    std::string name_;
    std::chrono::steady_clock::time_point last_draw_{};
    std::uint64_t received_{0};
    std::uint64_t total_{0};
    bool drawn_{false};
};

} // namespace rangeget
