#include "rangeget/curl_http_client.hpp"
#include "rangeget/download_coordinator.hpp"
#include "rangeget/download_job.hpp"
#include "rangeget/progress_bar.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <url> <file>" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Set download directory (default: current directory)\n"
              << "  -t <workers>     Number of concurrent ranges (default: 4)\n"
              << "  -c <bytes>       Chunk size for writes and progress (default: 1024)\n"
              << "  -x <proxy>       Proxy URL, e.g. socks5://127.0.0.1:1080\n"
              << "  -u <user:pass>   Basic authentication credentials\n"
              << "  -T <seconds>     Per-request timeout (default: none)\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

void setupLogging(bool verbose) {
    //进度条占用stdout, 日志输出到stderr
    auto logger = spdlog::stderr_color_mt("rangeget");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
    spdlog::cfg::load_env_levels();
}

long parseNumber(const std::string& option, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const long number = std::stol(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return number;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + value);
    }
}

void renderProgress(std::uint64_t received, std::uint64_t total, std::size_t /*chunk*/,
                    rangeget::ProgressBar* bar) {
    bar->update(received, total);
}

} // namespace

int main(int argc, char** argv) {
    try {
        rangeget::JobOptions options;
        std::filesystem::path download_dir = std::filesystem::current_path();   // 默认下载路径为当前路径下
        bool verbose = false;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (option == "-v") {
                verbose = true;
                arg_index += 1;
                continue;
            }
            if (option != "-d" && option != "-t" && option != "-c" && option != "-x" && option != "-u" &&
                option != "-T") {
                printUsage(argv[0]);
                return 1;
            }
            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }

            const std::string value = argv[arg_index + 1];
            if (option == "-d") {
                download_dir = value;
                std::error_code ec;
                std::filesystem::create_directories(download_dir, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: "
                         + download_dir.string() + " - " + ec.message());
                }
            } else if (option == "-t") {
                const long workers = parseNumber(option, value);
                if (workers <= 0 || workers > 64) {
                    throw std::runtime_error("Worker count must be between 1 and 64.");
                }
                options.workers = static_cast<int>(workers);
            } else if (option == "-c") {
                const long chunk = parseNumber(option, value);
                if (chunk <= 0) {
                    throw std::runtime_error("Chunk size must be positive.");
                }
                options.chunk_size = static_cast<std::size_t>(chunk);
            } else if (option == "-x") {
                options.proxy = value;
            } else if (option == "-u") {
                const auto colon = value.find(':');
                if (colon == std::string::npos) {
                    throw std::runtime_error("Credentials must be given as user:password");
                }
                options.credentials = rangeget::Credentials{value.substr(0, colon), value.substr(colon + 1)};
            } else {
                const long seconds = parseNumber(option, value);
                if (seconds < 0) {
                    throw std::runtime_error("Timeout must not be negative.");
                }
                options.request_timeout = std::chrono::seconds(seconds);
            }
            arg_index += 2;
        }

        if (argc - arg_index != 2) {
            printUsage(argv[0]);
            return 1;
        }

        setupLogging(verbose);

        const std::string url = argv[arg_index];
        const std::string file_name = argv[arg_index + 1];

        rangeget::ProgressBar bar(std::cout, file_name);
        options.progress = rangeget::bindProgressArgs(&renderProgress, &bar);

        const rangeget::DownloadJob job(url, download_dir, file_name, std::move(options));
        rangeget::DownloadCoordinator coordinator(std::make_shared<rangeget::CurlHttpClient>());

        const auto saved = coordinator.run(job);
        bar.finish();
        std::cout << saved.string() << std::endl;

    } catch (const std::exception& ex) {
        std::cerr << "\nFatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
