#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace cachekit {

// Shared "cachekit" logger, created on first use.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
// "critical", "off"). Unknown names leave the level unchanged.
void set_log_level(const std::string &level);

} // namespace cachekit
