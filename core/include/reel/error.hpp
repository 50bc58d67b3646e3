#pragma once

#include <expected>
#include <string_view>

namespace reel {

/// Failure taxonomy for every mutating catalog operation. Queries never fail.
enum class CatalogError {
  Validation, ///< Required field missing or empty on insert
  NotFound,   ///< Lookup, delete or link referenced a nonexistent id
  Duplicate   ///< Link of an already-linked (movie, actor) pair
};

template <typename T> using Result = std::expected<T, CatalogError>;

constexpr std::string_view to_string(CatalogError err) noexcept {
  switch (err) {
  case CatalogError::Validation:
    return "validation error";
  case CatalogError::NotFound:
    return "not found";
  case CatalogError::Duplicate:
    return "duplicate";
  }
  return "unknown";
}

} // namespace reel
