#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>

void init_logging(const std::string& level) {
  auto logger = spdlog::get("ck");
  if (!logger) logger = spdlog::stderr_color_mt("ck");
  logger->set_pattern("[ck] [%^%l%$] %v");
  spdlog::set_default_logger(logger);

  const char* env = std::getenv("CK_LOG_LEVEL");
  set_log_level(env && *env ? std::string(env) : level);
}

void set_log_level(const std::string& level) {
  // from_str maps unknown names to "off"; keep warn instead
  auto lvl = spdlog::level::from_str(level);
  if (lvl == spdlog::level::off && level != "off") lvl = spdlog::level::warn;
  spdlog::set_level(lvl);
}
