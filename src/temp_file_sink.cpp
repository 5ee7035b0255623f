#include "rangeget/temp_file_sink.hpp"
#include "rangeget/errors.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace rangeget {

TempFileSink::TempFileSink(std::filesystem::path path, std::size_t chunk_size, ChunkHook on_chunk)
    : path_(std::move(path)), chunk_size_(std::max<std::size_t>(1, chunk_size)), on_chunk_(std::move(on_chunk)) {
    file_.reset(std::fopen(path_.c_str(), "wb"));
    if (!file_) {
        throw FetchError(fmt::format("Cannot create scratch file {}", path_.string()));
    }
    pending_.reserve(chunk_size_);
}

TempFileSink::~TempFileSink() = default;

void TempFileSink::write(const char* data, std::size_t size) {
    if (!file_) {
        throw FetchError(fmt::format("Scratch file {} is already closed", path_.string()));
    }

    while (size > 0) {
        const std::size_t take = std::min(size, chunk_size_ - pending_.size());
        pending_.append(data, take);
        data += take;
        size -= take;

        if (pending_.size() == chunk_size_) {
            flushPending();
        }
    }
}

void TempFileSink::close() {
    if (!file_) {
        return;
    }

    flushPending();
    FILE* file = file_.release();
    if (std::fclose(file) != 0) {
        throw FetchError(fmt::format("Failed to close scratch file {}", path_.string()));
    }
}

void TempFileSink::flushPending() {
    if (pending_.empty()) {
        return;
    }

    const size_t written = std::fwrite(pending_.data(), 1, pending_.size(), file_.get());
    if (written != pending_.size()) {
        throw FetchError(fmt::format("Failed to write scratch file {}", path_.string()));
    }

    bytes_written_ += written;
    pending_.clear();
    if (on_chunk_) {
        on_chunk_(written);
    }
}

} // namespace rangeget
