#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace rangeget {

/// Writes one range to its scratch file in fixed-size chunks.
///
/// Incoming data is regrouped so that every chunk handed to the file (and to
/// the chunk hook) is exactly chunk_size bytes, except the last one flushed by
/// close(). Failures throw FetchError.
class TempFileSink {
public:
    using ChunkHook = std::function<void(std::size_t)>;

    TempFileSink(std::filesystem::path path, std::size_t chunk_size, ChunkHook on_chunk = {});
    ~TempFileSink();

    TempFileSink(const TempFileSink&) = delete;
    TempFileSink& operator=(const TempFileSink&) = delete;

    void write(const char* data, std::size_t size);
    void close();

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] std::uint64_t bytesWritten() const { return bytes_written_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    void flushPending();

    std::filesystem::path path_;
    std::size_t chunk_size_;
    ChunkHook on_chunk_;
    std::unique_ptr<FILE, FileDeleter> file_;
    std::string pending_;
    std::uint64_t bytes_written_{0};
};

} // namespace rangeget
