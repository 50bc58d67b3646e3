#pragma once

/**
 * @file log.hpp
 * @brief Library-wide spdlog logger.
 *
 * All Reel components log through one named logger ("reel") writing to a
 * coloured stderr sink. The logger is created on first use and registered
 * with spdlog so host applications can reconfigure it via spdlog::get().
 */

#include <memory>
#include <spdlog/spdlog.h>

namespace reel::log {

/// Name under which the logger is registered with spdlog.
inline constexpr const char *LOGGER_NAME = "reel";

/// Returns the shared "reel" logger, creating it on first call.
std::shared_ptr<spdlog::logger> logger();

/// Sets the verbosity of the "reel" logger.
void set_level(spdlog::level::level_enum level);

spdlog::level::level_enum level();

} // namespace reel::log
