#pragma once

/**
 * @file relation_index.hpp
 * @brief Movie_Actors association set with bidirectional lookup.
 *
 * Four structures are kept mutually consistent on every link/unlink:
 *
 *   rows_            std::list<Role>      global link order
 *   row_slots_       Role → list node     duplicate check + O(1) erase
 *   actors_by_movie_ movie → [actor...]   per-movie link order
 *   movies_by_actor_ actor → [movie...]   per-actor link order
 *
 * INVARIANT: a Role is present in all four or in none of them.
 */

#include "reel/error.hpp"
#include "reel/hash.hpp"
#include "reel/schema.hpp"
#include <list>
#include <optional>
#include <unordered_map>
#include <vector>

namespace reel {

class EntityStore;

class RelationIndex {
public:
  RelationIndex() = default;

  RelationIndex(const RelationIndex &) = delete;
  RelationIndex &operator=(const RelationIndex &) = delete;

  /**
   * @brief Adds the (movie_id, actor_id) row.
   *
   * @return CatalogError::NotFound if either id is absent from `store`,
   *         CatalogError::Duplicate if the pair is already linked.
   *         State is untouched on failure.
   */
  Result<void> link(const EntityStore &store, MovieId movie_id,
                    ActorId actor_id);

  /**
   * @brief Removes every row matching the given id(s).
   *
   * Both ids set removes that single pair; one id set removes all rows of
   * that movie or actor; neither set removes nothing. Idempotent.
   *
   * @return Number of rows removed.
   */
  size_t unlink_all(std::optional<MovieId> movie_id = std::nullopt,
                    std::optional<ActorId> actor_id = std::nullopt);

  /// Actors linked to `movie_id`, in link order. Empty if none.
  const std::vector<ActorId> &actors_of(MovieId movie_id) const noexcept;

  /// Movies linked to `actor_id`, in link order. Empty if none.
  const std::vector<MovieId> &movies_of(ActorId actor_id) const noexcept;

  bool contains(MovieId movie_id, ActorId actor_id) const noexcept {
    return row_slots_.contains(Role{movie_id, actor_id});
  }

  /// Total number of rows.
  size_t size() const noexcept { return rows_.size(); }

  /// Snapshot of all rows in link order.
  std::vector<Role> roles() const {
    return std::vector<Role>(rows_.begin(), rows_.end());
  }

private:
  /// Drops one row from all structures. Row must exist.
  void erase_row(const Role &role);

  std::list<Role> rows_;
  std::unordered_map<Role, std::list<Role>::iterator, hash::RoleHash>
      row_slots_;
  std::unordered_map<MovieId, std::vector<ActorId>> actors_by_movie_;
  std::unordered_map<ActorId, std::vector<MovieId>> movies_by_actor_;
};

} // namespace reel
