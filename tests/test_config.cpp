#include <catch2/catch.hpp>

#include "ps3update/config.hpp"
#include "ps3update/errors.hpp"
#include "support/temp_dir.hpp"

#include <cstdlib>
#include <fstream>
#include <string>

using ps3update::Config;

namespace {

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST_CASE("Config defaults point at the title-patch service") {
    const Config cfg;
    REQUIRE(cfg.update_base_url == "https://a0.ww.np.dl.playstation.net");
    REQUIRE_FALSE(cfg.verify_tls);
    REQUIRE(cfg.default_parts == 4);
    REQUIRE(cfg.max_retries == 3);
    REQUIRE(cfg.log_level == "warn");
}

TEST_CASE("parseConfigString reads keys, comments and quotes") {
    const std::string env =
        "# comment\n"
        "; another comment\n"
        "update_base_url = \"http://127.0.0.1:8080/\"\n"
        "verify_tls=yes\n"
        "max_retries=5\n"
        "default_parts=8\n"
        "min_multipart_bytes=4096\n"
        "LOG_LEVEL=Debug\n"
        "download_dir=/tmp/ps3\n"
        "not a pair\n";

    Config cfg;
    ps3update::parseConfigString(env, cfg);
    REQUIRE(cfg.update_base_url == "http://127.0.0.1:8080");
    REQUIRE(cfg.verify_tls);
    REQUIRE(cfg.max_retries == 5);
    REQUIRE(cfg.default_parts == 8);
    REQUIRE(cfg.min_multipart_bytes == 4096);
    REQUIRE(cfg.log_level == "debug");
    REQUIRE(cfg.download_dir == "/tmp/ps3");
}

TEST_CASE("parseConfigString ignores unknown keys") {
    Config cfg;
    ps3update::parseConfigString("colour=blue\nmax_retries=1\n", cfg);
    REQUIRE(cfg.max_retries == 1);

    REQUIRE_FALSE(ps3update::applyConfigValue(cfg, "colour", "blue"));
}

TEST_CASE("invalid values raise configuration errors") {
    Config cfg;
    REQUIRE_THROWS_AS(ps3update::applyConfigValue(cfg, "max_retries", "many"), ps3update::Error);
    REQUIRE_THROWS_AS(ps3update::applyConfigValue(cfg, "default_parts", "0"), ps3update::Error);
    REQUIRE_THROWS_AS(ps3update::applyConfigValue(cfg, "verify_tls", "maybe"), ps3update::Error);
    REQUIRE_THROWS_AS(ps3update::applyConfigValue(cfg, "min_multipart_bytes", "-1"), ps3update::Error);

    try {
        ps3update::applyConfigValue(cfg, "retry_backoff_ms", "10x");
        FAIL("expected a Config error");
    } catch (const ps3update::Error& ex) {
        REQUIRE(ex.kind() == ps3update::ErrorKind::Config);
    }
}

TEST_CASE("loadConfig fails for a missing file") {
    REQUIRE_THROWS_AS(ps3update::loadConfig("/nonexistent/ps3update.env"), ps3update::Error);
}

TEST_CASE("environment overrides the config file") {
    ps3update::test::TempDir dir;
    const auto path = dir.path() / "ps3update.env";
    {
        std::ofstream out(path);
        out << "max_retries=7\nretry_backoff_ms=50\nuser_agent=from-file\n";
    }

    ScopedEnv retries("PS3UPDATE_MAX_RETRIES", "2");
    ScopedEnv agent("PS3UPDATE_USER_AGENT", "from-env");

    const Config cfg = ps3update::loadConfig(path.string());
    REQUIRE(cfg.max_retries == 2);
    REQUIRE(cfg.user_agent == "from-env");
    REQUIRE(cfg.retry_backoff_ms == 50);
}
