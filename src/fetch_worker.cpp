#include "rangeget/fetch_worker.hpp"
#include "rangeget/errors.hpp"
#include "rangeget/temp_file_sink.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangeget {

std::filesystem::path FetchWorker::fetch(const ByteRange& range) {
    spdlog::debug("Worker {} fetching bytes [{}, {})", range.index, range.start, range.end);

    TempFileSink sink(job_.scratchPath(range.index), job_.chunkSize(),
                      [this](std::size_t chunk) { progress_.add(chunk); });

    std::uint64_t received = 0;
    client_.fetchRange(job_.request(), range, [this, &sink, &range, &received](const char* data, std::size_t size) {
        //其他worker失败后停止接收
        if (failure_.raised()) {
            return false;
        }
        received += size;
        if (received > range.size()) {
            throw FetchError(fmt::format("Origin sent more than {} bytes for range {}", range.size(), range.index));
        }
        sink.write(data, size);
        return true;
    }, [this] { return failure_.raised(); });
    sink.close();

    if (sink.bytesWritten() != range.size()) {
        throw FetchError(fmt::format("Range {} incomplete: received {} of {} bytes", range.index,
                                     sink.bytesWritten(), range.size()));
    }

    spdlog::debug("Worker {} finished {} bytes", range.index, sink.bytesWritten());
    return sink.path();
}

} // namespace rangeget
