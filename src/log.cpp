#include "ringchan/log.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ringchan {

static std::shared_ptr<spdlog::logger> make_logger() {
  auto log = spdlog::get("ringchan");
  if (log) {
    return log;
  }

  log = spdlog::stdout_color_mt("ringchan");
  log->set_level(spdlog::level::info);
  log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");

  // Re-applies levels from SPDLOG_LEVEL now that the logger is registered.
  spdlog::cfg::load_env_levels();
  return log;
}

spdlog::logger &logger() {
  static std::shared_ptr<spdlog::logger> instance = make_logger();
  return *instance;
}

void set_log_level(spdlog::level::level_enum level) {
  logger().set_level(level);
}

} // namespace ringchan
