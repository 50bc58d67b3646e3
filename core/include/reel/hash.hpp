#pragma once

/**
 * @file hash.hpp
 * @brief Header-only FNV-1a 64-bit hash used to key Movie_Actors rows.
 */

#include "reel/schema.hpp"
#include <cstddef>
#include <cstdint>

namespace reel::hash {

inline constexpr uint64_t FNV1A_OFFSET_BASIS = 14695981039346656037ULL;
inline constexpr uint64_t FNV1A_PRIME = 1099511628211ULL;

/// Folds `value` into `hash` one byte at a time, low byte first.
constexpr uint64_t fnv1a_mix(uint64_t hash, uint64_t value) noexcept {
  for (int i = 0; i < 8; ++i) {
    hash ^= (value >> (i * 8)) & 0xFFu;
    hash *= FNV1A_PRIME;
  }
  return hash;
}

/// Hash of a composite (movie_id, actor_id) key.
constexpr uint64_t role_key(MovieId movie_id, ActorId actor_id) noexcept {
  uint64_t hash = FNV1A_OFFSET_BASIS;
  hash = fnv1a_mix(hash, static_cast<uint64_t>(movie_id));
  hash = fnv1a_mix(hash, static_cast<uint64_t>(actor_id));
  return hash;
}

/// Hasher for unordered containers keyed by Role.
struct RoleHash {
  size_t operator()(const Role &role) const noexcept {
    return static_cast<size_t>(role_key(role.movie_id, role.actor_id));
  }
};

} // namespace reel::hash
