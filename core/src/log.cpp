#include "reel/log.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace reel::log {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;

  std::call_once(once, [] {
    // A host may have registered "reel" itself before first use.
    instance = spdlog::get(LOGGER_NAME);
    if (!instance) {
      instance = spdlog::stderr_color_mt(LOGGER_NAME);
      instance->set_level(spdlog::level::warn);
      instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    }
  });
  return instance;
}

void set_level(spdlog::level::level_enum level) { logger()->set_level(level); }

spdlog::level::level_enum level() { return logger()->level(); }

} // namespace reel::log
