#pragma once

#include "ps3update/config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <curl/curl.h>

namespace ps3update::detail {

void ensureCurlInitialized();

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Throws Error(NetworkError) when libcurl cannot allocate a handle.
[[nodiscard]] CurlHandle makeCurlHandle();

// Redirects, user agent, TLS policy, connect timeout and the low-speed abort window.
void applyCommonOptions(CURL* curl, const Config& config);

struct HttpResponse {
    long status{0};
    std::string headers;
    std::string body;
};

// Blocking GET/HEAD bounded by timeout_seconds. Throws Error(NetworkError) on transport failure;
// HTTP error statuses are returned, not thrown.
[[nodiscard]] HttpResponse httpGet(const std::string& url, const Config& config, long timeout_seconds);
[[nodiscard]] HttpResponse httpHead(const std::string& url, const Config& config, long timeout_seconds);

[[nodiscard]] bool isTransientCurlError(CURLcode code) noexcept;
[[nodiscard]] bool isTransientHttpStatus(long status) noexcept;

// Case-insensitive header lookup in the final response of a raw header block
// (earlier blocks belong to redirects).
[[nodiscard]] std::optional<std::string> findHeader(const std::string& headers, std::string_view name);

// Appends raw header lines to the std::string passed as CURLOPT_HEADERDATA.
size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata);

} // namespace ps3update::detail
