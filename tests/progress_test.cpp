#include "rangeget/progress.hpp"
#include "rangeget/progress_bar.hpp"

#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace rangeget {

TEST(ProgressStateTest, ReportsRunningTotal) {
    std::vector<std::uint64_t> totals;
    ProgressState progress(10, [&totals](std::uint64_t received, std::uint64_t total, std::size_t) {
        EXPECT_EQ(total, 10u);
        totals.push_back(received);
    });

    progress.add(4);
    progress.add(4);
    progress.add(2);

    EXPECT_EQ(totals, (std::vector<std::uint64_t>{4, 8, 10}));
    EXPECT_EQ(progress.receivedBytes(), 10u);
}

TEST(ProgressStateTest, ConcurrentAddsAreNotLost) {
    constexpr int kThreads = 8;
    constexpr int kAdds = 10000;
    std::uint64_t last_seen = 0;
    bool monotonic = true;
    ProgressState progress(kThreads * kAdds * 3, [&](std::uint64_t received, std::uint64_t, std::size_t) {
        monotonic = monotonic && received > last_seen;
        last_seen = received;
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&progress] {
            for (int i = 0; i < kAdds; ++i) {
                progress.add(3);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(progress.receivedBytes(), static_cast<std::uint64_t>(kThreads * kAdds * 3));
    EXPECT_TRUE(monotonic);
}

TEST(ProgressStateTest, WorksWithoutCallback) {
    ProgressState progress(5, {});
    progress.add(5);
    EXPECT_EQ(progress.receivedBytes(), 5u);
}

TEST(ProgressStateTest, BindProgressArgsAppendsExtraArguments) {
    std::string seen;
    auto callback = bindProgressArgs(
        [](std::uint64_t received, std::uint64_t total, std::size_t chunk, const std::string& label,
           std::string* out) { *out = label + ":" + std::to_string(received) + "/" + std::to_string(total) + "+" +
                                      std::to_string(chunk); },
        std::string("bar"), &seen);

    callback(3, 9, 3);
    EXPECT_EQ(seen, "bar:3/9+3");
}

TEST(ProgressBarTest, FormatSize) {
    EXPECT_EQ(ProgressBar::formatSize(512), "512 B");
    EXPECT_EQ(ProgressBar::formatSize(1536), "1.5 KB");
    EXPECT_EQ(ProgressBar::formatSize(5 * 1024 * 1024), "5.0 MB");
    EXPECT_EQ(ProgressBar::formatSize(3ULL * 1024 * 1024 * 1024), "3.0 GB");
}

TEST(ProgressBarTest, FormatLineShowsPercentAndSizes) {
    const auto line = ProgressBar::formatLine("a.rar", 512, 1024);
    EXPECT_NE(line.find(" 50%"), std::string::npos);
    EXPECT_NE(line.find("(512 B/1.0 KB)"), std::string::npos);
    EXPECT_EQ(line.rfind("a.rar", 0), 0u);
}

TEST(ProgressBarTest, FinishDrawsFinalState) {
    std::ostringstream out;
    ProgressBar bar(out, "/tmp/downloads/a.rar");
    bar.update(1024, 1024);
    bar.finish();

    const auto text = out.str();
    EXPECT_NE(text.find("100%"), std::string::npos);
    EXPECT_EQ(text.back(), '\n');
}

} // namespace rangeget
