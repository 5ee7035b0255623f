#pragma once

#include "byte_range.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace rangeget {

struct Credentials {
    std::string username;
    std::string password;
};

struct RequestOptions {
    std::string url;
    std::string proxy;                        // empty: direct connection
    std::optional<Credentials> credentials;
    std::chrono::milliseconds timeout{0};     // zero: no deadline
};

// Receives each piece of a response body as it arrives. Returning false
// aborts the transfer.
using BodyHandler = std::function<bool(const char* data, std::size_t size)>;

// Polled while a transfer is in flight, including while it waits for headers
// or stalls. Returning true aborts the transfer.
using CancelCheck = std::function<bool()>;

class HttpClient {
public:
    virtual ~HttpClient() = default;

    /// Content length of the resource at request.url. Throws ProbeError.
    [[nodiscard]] virtual std::uint64_t contentLength(const RequestOptions& request) = 0;

    /// GET restricted to range, body streamed to on_body. Must be safe to call
    /// from several threads at once, and must return soon after cancelled()
    /// turns true. Throws FetchError on anything but a complete 206 response,
    /// including an abort requested by on_body or cancelled.
    virtual void fetchRange(const RequestOptions& request, const ByteRange& range,
                            const BodyHandler& on_body, const CancelCheck& cancelled) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

} // namespace rangeget
