#pragma once

#include <memory>
#include <string>

#include <curl/curl.h>

namespace rangeget::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Runs curl_global_init once per process. Throws std::runtime_error on failure.
void ensureCurlInitialized();

[[nodiscard]] CurlHandle makeCurlHandle();

// Tracks Content-Length across the header lines of a response chain. A status
// line starts a new response and resets content_length to -1.
void trackContentLength(const std::string& header_line, curl_off_t& content_length);

} // namespace rangeget::detail
