#include "cachekit/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>

namespace cachekit {
namespace {
std::shared_ptr<spdlog::logger> make_logger() {
  auto l = spdlog::get("cachekit");
  if (l)
    return l;
  try {
    l = spdlog::stdout_color_mt("cachekit");
  } catch (const spdlog::spdlog_ex &e) {
    std::cerr << "cachekit logger init failed: " << e.what() << std::endl;
    l = spdlog::get("cachekit");
    if (!l)
      l = spdlog::default_logger();
  }
  l->set_level(spdlog::level::info);
  return l;
}
} // namespace

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = make_logger();
  return instance;
}

void set_log_level(const std::string &level) {
  const auto lvl = spdlog::level::from_str(level);
  if (lvl == spdlog::level::off && level != "off")
    return;
  logger()->set_level(lvl);
}

} // namespace cachekit
