#include "ps3update/config.hpp"
#include "ps3update/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>

#include <spdlog/spdlog.h>

namespace ps3update {

namespace {

constexpr std::array<const char*, 14> kKeys{
    "update_base_url",       "user_agent",          "verify_tls",
    "connect_timeout_seconds", "fetch_timeout_seconds", "status_timeout_seconds",
    "low_speed_limit_bytes", "low_speed_time_seconds", "max_retries",
    "retry_backoff_ms",      "default_parts",       "min_multipart_bytes",
    "log_level",             "download_dir"};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return s;
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

long parseLong(const std::string& key, const std::string& value, long min_value) {
    std::size_t used = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &used);
    } catch (const std::exception&) {
        throw makeError(ErrorKind::Config, "{} expects a number, got '{}'", key, value);
    }
    if (used != value.size() || parsed < min_value) {
        throw makeError(ErrorKind::Config, "{} expects a number >= {}, got '{}'", key, min_value, value);
    }
    return parsed;
}

std::uint64_t parseUnsigned(const std::string& key, const std::string& value) {
    std::size_t used = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &used);
    } catch (const std::exception&) {
        throw makeError(ErrorKind::Config, "{} expects a byte count, got '{}'", key, value);
    }
    if (used != value.size() || value.front() == '-') {
        throw makeError(ErrorKind::Config, "{} expects a byte count, got '{}'", key, value);
    }
    return static_cast<std::uint64_t>(parsed);
}

bool parseBool(const std::string& key, const std::string& value) {
    const auto v = toLower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    throw makeError(ErrorKind::Config, "{} expects a boolean, got '{}'", key, value);
}

} // namespace

bool applyConfigValue(Config& config, const std::string& key, const std::string& value) {
    const auto k = toLower(key);
    if (k == "update_base_url") {
        std::string url = value;
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        config.update_base_url = url;
    } else if (k == "user_agent") {
        config.user_agent = value;
    } else if (k == "verify_tls") {
        config.verify_tls = parseBool(k, value);
    } else if (k == "connect_timeout_seconds") {
        config.connect_timeout_seconds = parseLong(k, value, 1);
    } else if (k == "fetch_timeout_seconds") {
        config.fetch_timeout_seconds = parseLong(k, value, 1);
    } else if (k == "status_timeout_seconds") {
        config.status_timeout_seconds = parseLong(k, value, 1);
    } else if (k == "low_speed_limit_bytes") {
        config.low_speed_limit_bytes = parseLong(k, value, 0);
    } else if (k == "low_speed_time_seconds") {
        config.low_speed_time_seconds = parseLong(k, value, 1);
    } else if (k == "max_retries") {
        config.max_retries = static_cast<int>(parseLong(k, value, 0));
    } else if (k == "retry_backoff_ms") {
        config.retry_backoff_ms = static_cast<int>(parseLong(k, value, 0));
    } else if (k == "default_parts") {
        config.default_parts = static_cast<int>(parseLong(k, value, 1));
    } else if (k == "min_multipart_bytes") {
        config.min_multipart_bytes = parseUnsigned(k, value);
    } else if (k == "log_level") {
        config.log_level = toLower(value);
    } else if (k == "download_dir") {
        config.download_dir = value;
    } else {
        return false;
    }
    return true;
}

void parseConfigString(const std::string& contents, Config& config) {
    std::istringstream in(contents);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        const std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        if (!applyConfigValue(config, key, value)) {
            spdlog::warn("Config: ignoring unknown key '{}'", key);
        }
    }
}

Config loadConfig(const std::string& path) {
    Config config;

    if (!path.empty()) {
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file) {
            throw makeError(ErrorKind::Config, "cannot open config file '{}'", path);
        }
        const std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        parseConfigString(contents, config);
    }

    for (const char* key : kKeys) {
        const std::string name = "PS3UPDATE_" + toUpper(key);
        if (const char* value = std::getenv(name.c_str())) {
            applyConfigValue(config, key, value);
        }
    }

    return config;
}

} // namespace ps3update
