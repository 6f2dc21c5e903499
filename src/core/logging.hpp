#pragma once

#include <string>

namespace riskwatch {

/// Install the asynchronous stdout logger as spdlog's default logger
/// Safe to call again; later calls only change the level
/// @param level spdlog level name ("trace" ... "off"); unknown names mean info
void setup_logging(const std::string& level = "info");

}  // namespace riskwatch
