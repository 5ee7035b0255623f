#include "rangeget/download_job.hpp"
#include "rangeget/errors.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

namespace rangeget {

class DownloadJobTest : public test::TempDirTest {};

TEST_F(DownloadJobTest, AppliesDefaults) {
    const DownloadJob job("http://example.com/a.rar", tempDir, "a.rar");

    EXPECT_EQ(job.workers(), 4);
    EXPECT_EQ(job.chunkSize(), 1024u);
    EXPECT_FALSE(job.progressCallback());
    EXPECT_EQ(job.request().url, "http://example.com/a.rar");
    EXPECT_TRUE(job.request().proxy.empty());
    EXPECT_FALSE(job.request().credentials);
}

TEST_F(DownloadJobTest, NamesScratchFilesByIndexAndFileName) {
    JobOptions options;
    options.workers = 3;
    const DownloadJob job("http://example.com/a.rar", tempDir, "a.rar", options);

    EXPECT_EQ(job.scratchPath(2), job.directory() / "2_a.rar.temp");
    EXPECT_EQ(job.finalPath(), job.directory() / "a.rar");
    EXPECT_TRUE(job.finalPath().is_absolute());

    const std::vector<std::filesystem::path> expected{job.directory() / "1_a.rar.temp",
                                                      job.directory() / "2_a.rar.temp",
                                                      job.directory() / "3_a.rar.temp"};
    EXPECT_EQ(job.scratchPaths(), expected);
}

TEST_F(DownloadJobTest, PassesProxyCredentialsAndTimeoutToRequests) {
    JobOptions options;
    options.proxy = "socks5://127.0.0.1:10808";
    options.credentials = Credentials{"user", "secret"};
    options.request_timeout = std::chrono::seconds(30);
    const DownloadJob job("http://example.com/a.rar", tempDir, "a.rar", options);

    const auto request = job.request();
    EXPECT_EQ(request.proxy, "socks5://127.0.0.1:10808");
    ASSERT_TRUE(request.credentials);
    EXPECT_EQ(request.credentials->username, "user");
    EXPECT_EQ(request.credentials->password, "secret");
    EXPECT_EQ(request.timeout, std::chrono::milliseconds(30000));
}

TEST_F(DownloadJobTest, RejectsMissingDirectory) {
    EXPECT_THROW(DownloadJob("http://example.com/a", tempDir / "nope", "a"), ConfigurationError);
    EXPECT_THROW(DownloadJob("http://example.com/a", "", "a"), ConfigurationError);
}

TEST_F(DownloadJobTest, RejectsRegularFileAsDirectory) {
    const auto file = tempDir / "plain.txt";
    test::writeFile(file, "x");
    EXPECT_THROW(DownloadJob("http://example.com/a", file, "a"), ConfigurationError);
}

TEST_F(DownloadJobTest, RejectsBadFileNameAndOptions) {
    EXPECT_THROW(DownloadJob("http://example.com/a", tempDir, ""), ConfigurationError);
    EXPECT_THROW(DownloadJob("http://example.com/a", tempDir, "sub/a"), ConfigurationError);

    JobOptions no_workers;
    no_workers.workers = 0;
    EXPECT_THROW(DownloadJob("http://example.com/a", tempDir, "a", no_workers), ConfigurationError);

    JobOptions no_chunk;
    no_chunk.chunk_size = 0;
    EXPECT_THROW(DownloadJob("http://example.com/a", tempDir, "a", no_chunk), ConfigurationError);
}

} // namespace rangeget
