#pragma once

#include <string>

namespace ps3update {

// Installs the "ps3update" stderr logger as spdlog's default logger.
// Unknown level names fall back to "info".
void setupLogging(const std::string& level);

} // namespace ps3update
