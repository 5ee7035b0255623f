#pragma once

#include "http_client.hpp"

#include <memory>
#include <string>

namespace rangeget {

class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent = "rangeget/1.0");
    ~CurlHttpClient() override;

    [[nodiscard]] std::uint64_t contentLength(const RequestOptions& request) override;
    void fetchRange(const RequestOptions& request, const ByteRange& range,
                    const BodyHandler& on_body, const CancelCheck& cancelled) override;

private:
    //使用impl类避免在公共头文件中引入curl.h
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangeget
