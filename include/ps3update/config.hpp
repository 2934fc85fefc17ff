#pragma once

#include <cstdint>
#include <string>

namespace ps3update {

struct Config {
    // Title-patch service; metadata lives under <base>/tpl/np/<ID>/<ID>-ver.xml
    std::string update_base_url{"https://a0.ww.np.dl.playstation.net"};
    std::string user_agent{"ps3update/1.0"};
    // The vendor signs with its own CA, so peer verification is off unless asked for.
    bool verify_tls{false};

    long connect_timeout_seconds{10};
    long fetch_timeout_seconds{20};
    long status_timeout_seconds{5};
    // A transfer slower than low_speed_limit_bytes/s for low_speed_time_seconds times out.
    long low_speed_limit_bytes{1};
    long low_speed_time_seconds{30};

    int max_retries{3};
    int retry_backoff_ms{500};

    int default_parts{4};
    // Smaller resources are always fetched with a single stream.
    std::uint64_t min_multipart_bytes{1024 * 1024};

    std::string log_level{"warn"};
    // Empty means defaultDownloadPath().
    std::string download_dir;
};

// Defaults, then the key=value file at `path` (skipped when empty), then PS3UPDATE_* variables.
// Throws Error(Config) when a named file cannot be read or a value does not parse.
[[nodiscard]] Config loadConfig(const std::string& path = {});

// Applies one key=value pair; returns false for unknown keys.
bool applyConfigValue(Config& config, const std::string& key, const std::string& value);

// Parses .env-style content (comments with '#' or ';', optional double quotes).
void parseConfigString(const std::string& contents, Config& config);

} // namespace ps3update
