#include "ps3update/logging.hpp"

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ps3update {

void setupLogging(const std::string& level) {
    auto logger = spdlog::get("ps3update");
    if (!logger) {
        logger = spdlog::stderr_color_mt("ps3update");
    }
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    logger->set_level(parsed);
    spdlog::set_default_logger(std::move(logger));
}

} // namespace ps3update
