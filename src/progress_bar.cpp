#include "rangeget/progress_bar.hpp"

#include <filesystem>
#include <utility>

#include <fmt/format.h>

namespace rangeget {

namespace {

constexpr auto kRedrawInterval = std::chrono::milliseconds(200);
constexpr int kBarWidth = 30;
constexpr std::size_t kNameWidth = 20;

} // namespace

ProgressBar::ProgressBar(std::ostream& out, std::string name) : out_(out), name_(std::move(name)) {
    std::string display_name = std::filesystem::path{name_}.filename().string();
    if (display_name.empty()) {
        display_name = name_;
    }
    if (display_name.size() > kNameWidth) {
        display_name = display_name.substr(0, kNameWidth);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }
    name_ = std::move(display_name);
}

void ProgressBar::update(std::uint64_t received, std::uint64_t total) {
    received_ = received;
    total_ = total;

    const auto now = std::chrono::steady_clock::now();
    if (drawn_ && now - last_draw_ < kRedrawInterval && received < total) {
        return;
    }
    last_draw_ = now;
    redraw(received, total);
}

void ProgressBar::finish() {
    redraw(received_, total_);
    out_ << '\n' << std::flush;
}

void ProgressBar::redraw(std::uint64_t received, std::uint64_t total) {
    out_ << '\r' << formatLine(name_, received, total) << "\033[K" << std::flush;
    drawn_ = true;
}

std::string ProgressBar::formatLine(const std::string& name, std::uint64_t received, std::uint64_t total) {
    if (total == 0) {
        return fmt::format("{:<20} [{}] {}", name, std::string(kBarWidth, ' '), formatSize(received));
    }

    const double ratio = static_cast<double>(received) / static_cast<double>(total);
    const int percent = static_cast<int>(ratio * 100.0);
    const int bar_pos = static_cast<int>(ratio * kBarWidth);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
    for (int i = 0; i < kBarWidth; ++i) {
        bar += (i < bar_pos) ? "█" : "░";
    }

    return fmt::format("{:<20} [{}] {:>3}% ({}/{})", name, bar, percent, formatSize(received), formatSize(total));
}

std::string ProgressBar::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

} // namespace rangeget
