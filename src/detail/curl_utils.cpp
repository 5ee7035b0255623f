#include "rangeget/detail/curl_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>

namespace rangeget::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() { return CurlHandle{curl_easy_init(), &curl_easy_cleanup}; }

namespace {

bool startsWithNoCase(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), text.begin(), [](char lhs, char rhs) {
               return std::tolower(static_cast<unsigned char>(lhs)) == std::tolower(static_cast<unsigned char>(rhs));
           });
}

} // namespace

void trackContentLength(const std::string& header_line, curl_off_t& content_length) {
    static const std::string kContentLength = "Content-Length:";

    if (startsWithNoCase(header_line, "HTTP/")) {
        content_length = -1;
    } else if (startsWithNoCase(header_line, kContentLength)) {
        try {
            const long long value = std::stoll(header_line.substr(kContentLength.size()));
            content_length = value < 0 ? -1 : static_cast<curl_off_t>(value);
        } catch (const std::exception&) {
            content_length = -1;
        }
    }
}

} // namespace rangeget::detail
