#pragma once

#include "reel/schema.hpp"
#include <spdlog/common.h>
#include <string>

namespace reel {

/**
 * @brief Construction-time settings for a Catalog.
 *
 * Aggregate so callers can use designated initializers:
 *   reel::Catalog catalog(reel::CatalogOptions{.name = "Archive"});
 */
struct CatalogOptions {
  /// Reported by QueryEngine::database_name().
  std::string name{DEFAULT_DATABASE_NAME};
  /// Joins names/titles in movie_casts() and movies_by_decade().
  std::string list_separator{DEFAULT_LIST_SEPARATOR};
  /// Applied to the "reel" logger when the Catalog is constructed.
  spdlog::level::level_enum log_level = spdlog::level::warn;
};

} // namespace reel
