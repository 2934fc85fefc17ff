#include "ps3update/detail/curl_utils.hpp"
#include "ps3update/errors.hpp"

#include <cctype>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace ps3update::detail {

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

HttpResponse perform(const std::string& url, const Config& config, long timeout_seconds, bool head) {
    ensureCurlInitialized();
    CurlHandle curl = makeCurlHandle();

    HttpResponse response;
    applyCommonOptions(curl.get(), config);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &appendToString);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
    if (head) {
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &appendToString);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw Error(ErrorKind::NetworkError, curl_easy_strerror(res));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw Error(ErrorKind::NetworkError, "Failed to allocate curl handle");
    }
    return curl;
}

void applyCommonOptions(CURL* curl, const Config& config) {
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, config.low_speed_limit_bytes);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, config.low_speed_time_seconds);
    const long verify = config.verify_tls ? 1L : 0L;
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config.verify_tls ? 2L : 0L);
}

HttpResponse httpGet(const std::string& url, const Config& config, long timeout_seconds) {
    return perform(url, config, timeout_seconds, false);
}

HttpResponse httpHead(const std::string& url, const Config& config, long timeout_seconds) {
    return perform(url, config, timeout_seconds, true);
}

bool isTransientCurlError(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return true;
        default:
            return false;
    }
}

bool isTransientHttpStatus(long status) noexcept {
    return status == 408 || status == 429 || (status >= 500 && status < 600);
}

std::optional<std::string> findHeader(const std::string& headers, std::string_view name) {
    std::optional<std::string> found;
    std::size_t pos = 0;
    while (pos < headers.size()) {
        auto end = headers.find('\n', pos);
        if (end == std::string::npos) {
            end = headers.size();
        }
        std::string_view line(headers.data() + pos, end - pos);
        pos = end + 1;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (line.size() >= 5 && line.substr(0, 5) == "HTTP/") {
            found.reset();
            continue;
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || !equalsIgnoreCase(line.substr(0, colon), name)) {
            continue;
        }
        auto value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
            value.remove_suffix(1);
        }
        found = std::string(value);
    }
    return found;
}

size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    if (!out) {
        return 0;
    }
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace ps3update::detail
