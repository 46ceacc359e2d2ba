#include "stagecraft/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace stagecraft {

static std::shared_ptr<spdlog::logger> make_logger() {
  if (auto existing = spdlog::get("stagecraft")) {
    return existing;
  }
  auto log = spdlog::stdout_color_mt("stagecraft");
  log->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");
  return log;
}

std::shared_ptr<spdlog::logger> const& logger() {
  static std::shared_ptr<spdlog::logger> instance = make_logger();
  return instance;
}

void set_log_level(spdlog::level::level_enum Level) {
  logger()->set_level(Level);
}

} // namespace stagecraft
