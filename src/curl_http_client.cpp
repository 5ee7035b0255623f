#include "rangeget/curl_http_client.hpp"
#include "rangeget/detail/curl_utils.hpp"
#include "rangeget/errors.hpp"

#include <exception>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangeget {

namespace {

constexpr long kPartialContent = 206;

} // namespace

class CurlHttpClient::Impl {
public:
    explicit Impl(std::string user_agent) : user_agent_(std::move(user_agent)) {
        detail::ensureCurlInitialized();
    }

    // GET whose body is dropped as soon as the first bytes arrive.
    [[nodiscard]] std::uint64_t contentLength(const RequestOptions& request) const {
        auto curl = detail::makeCurlHandle();
        if (!curl) {
            throw ProbeError("Failed to allocate curl handle");
        }

        ProbeContext ctx;
        applyRequestOptions(curl.get(), request);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::probeHeaderCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::probeWriteCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

        const CURLcode res = curl_easy_perform(curl.get());
        //收到响应体后主动中断, 此时返回CURLE_WRITE_ERROR
        const bool aborted_on_body = res == CURLE_WRITE_ERROR && ctx.body_started;
        if (res != CURLE_OK && !aborted_on_body) {
            throw ProbeError(fmt::format("curl error while probing {}: {}", request.url, curl_easy_strerror(res)));
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (code < 200 || code >= 300) {
            throw ProbeError(fmt::format("Unexpected HTTP status {} while probing {}", code, request.url));
        }

        curl_off_t length = ctx.content_length;
        if (length < 0) {
            curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        }
        if (length < 0) {
            throw ProbeError(fmt::format("Origin did not report a Content-Length for {}", request.url));
        }

        spdlog::debug("Probe of {} answered {} with {} bytes", request.url, code, length);
        return static_cast<std::uint64_t>(length);
    }

    void fetchRange(const RequestOptions& request, const ByteRange& range, const BodyHandler& on_body,
                    const CancelCheck& cancelled) const {
        auto curl = detail::makeCurlHandle();
        if (!curl) {
            throw FetchError("Failed to allocate curl handle");
        }

        TransferContext ctx{curl.get(), &on_body, &cancelled};
        const std::string bytes = fmt::format("{}-{}", range.start, range.end - 1);

        applyRequestOptions(curl.get(), request);
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, bytes.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        // libcurl calls this about once a second even on a silent connection
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

        const CURLcode res = curl_easy_perform(curl.get());
        if (ctx.error) {
            std::rethrow_exception(ctx.error);
        }
        if (ctx.rejected_status != 0) {
            throw FetchError(fmt::format("Origin answered HTTP {} instead of 206 for bytes {}",
                                         ctx.rejected_status, bytes));
        }
        if (ctx.cancelled) {
            throw FetchError(fmt::format("Transfer of bytes {} cancelled", bytes));
        }
        if (res != CURLE_OK) {
            throw FetchError(fmt::format("curl error for bytes {}: {}", bytes, curl_easy_strerror(res)));
        }

        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (code != kPartialContent) {
            throw FetchError(fmt::format("Origin answered HTTP {} instead of 206 for bytes {}", code, bytes));
        }
    }

private:
    struct ProbeContext {
        curl_off_t content_length{-1};
        bool body_started{false};
    };

    struct TransferContext {
        CURL* curl{nullptr};
        const BodyHandler* on_body{nullptr};
        const CancelCheck* cancelled_check{nullptr};
        bool status_checked{false};
        long rejected_status{0};
        bool cancelled{false};
        std::exception_ptr error;
    };

    void applyRequestOptions(CURL* curl, const RequestOptions& request) const {
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
        // required when worker threads use timeouts
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());

        if (!request.proxy.empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, request.proxy.c_str());
        }
        if (request.credentials) {
            curl_easy_setopt(curl, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
            curl_easy_setopt(curl, CURLOPT_USERNAME, request.credentials->username.c_str());
            curl_easy_setopt(curl, CURLOPT_PASSWORD, request.credentials->password.c_str());
        }
        if (request.timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        }
    }

    // Every redirect hop starts with a status line; only the last response counts.
    static size_t probeHeaderCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<ProbeContext*>(userdata);
        const size_t total = size * nmemb;
        if (!ctx) {
            return total;
        }

        detail::trackContentLength(std::string(ptr, total), ctx->content_length);
        return total;
    }

    static size_t probeWriteCallback(char* /*ptr*/, size_t /*size*/, size_t /*nmemb*/, void* userdata) {
        auto* ctx = static_cast<ProbeContext*>(userdata);
        if (ctx) {
            ctx->body_started = true;
        }
        return 0;
    }

    static int progressCallback(void* userdata, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                                curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (!ctx || !ctx->cancelled_check || !*ctx->cancelled_check) {
            return 0;
        }

        try {
            if ((*ctx->cancelled_check)()) {
                ctx->cancelled = true;
                return 1;
            }
        } catch (...) {
            ctx->error = std::current_exception();
            return 1;
        }
        return 0;
    }

    // Exceptions must not cross libcurl; they are stored and rethrown after perform.
    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (!ctx || !ctx->on_body) {
            return 0;
        }

        const size_t total = size * nmemb;
        if (!ctx->status_checked) {
            ctx->status_checked = true;
            long code = 0;
            curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
            if (code != kPartialContent) {
                ctx->rejected_status = code;
                return 0;
            }
        }

        try {
            if (!(*ctx->on_body)(ptr, total)) {
                ctx->cancelled = true;
                return 0;
            }
        } catch (...) {
            ctx->error = std::current_exception();
            return 0;
        }
        return total;
    }

    std::string user_agent_;
};

CurlHttpClient::CurlHttpClient(std::string user_agent)
    : impl_(std::make_unique<Impl>(std::move(user_agent))) {}

CurlHttpClient::~CurlHttpClient() = default;

std::uint64_t CurlHttpClient::contentLength(const RequestOptions& request) { return impl_->contentLength(request); }

void CurlHttpClient::fetchRange(const RequestOptions& request, const ByteRange& range, const BodyHandler& on_body,
                                const CancelCheck& cancelled) {
    impl_->fetchRange(request, range, on_body, cancelled);
}

} // namespace rangeget
