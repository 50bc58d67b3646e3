#include "reel/relation_index.hpp"
#include "reel/entity_store.hpp"
#include "reel/log.hpp"

#include <algorithm>
#include <iterator>

namespace reel {

namespace {

const std::vector<int64_t> &empty_ids() noexcept {
  static const std::vector<int64_t> empty;
  return empty;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// link()
// ═══════════════════════════════════════════════════════════════════════════

Result<void> RelationIndex::link(const EntityStore &store, MovieId movie_id,
                                 ActorId actor_id) {
  if (!store.contains_movie(movie_id) || !store.contains_actor(actor_id)) {
    log::logger()->warn("link rejected: movie={} actor={} not found",
                        movie_id, actor_id);
    return std::unexpected(CatalogError::NotFound);
  }

  Role role{movie_id, actor_id};
  if (row_slots_.contains(role)) {
    log::logger()->warn("link rejected: movie={} actor={} already linked",
                        movie_id, actor_id);
    return std::unexpected(CatalogError::Duplicate);
  }

  rows_.push_back(role);
  row_slots_.emplace(role, std::prev(rows_.end()));
  actors_by_movie_[movie_id].push_back(actor_id);
  movies_by_actor_[actor_id].push_back(movie_id);

  log::logger()->debug("link movie={} actor={}", movie_id, actor_id);
  return {};
}

// ═══════════════════════════════════════════════════════════════════════════
// unlink_all(): cascade entry point
// ═══════════════════════════════════════════════════════════════════════════

size_t RelationIndex::unlink_all(std::optional<MovieId> movie_id,
                                 std::optional<ActorId> actor_id) {
  if (movie_id && actor_id) {
    Role role{*movie_id, *actor_id};
    if (!row_slots_.contains(role))
      return 0;
    erase_row(role);
    return 1;
  }

  // Copy the victim list: erase_row() mutates the vector being walked.
  std::vector<Role> victims;
  if (movie_id) {
    for (ActorId actor : actors_of(*movie_id))
      victims.push_back(Role{*movie_id, actor});
  } else if (actor_id) {
    for (MovieId movie : movies_of(*actor_id))
      victims.push_back(Role{movie, *actor_id});
  }

  for (const Role &role : victims)
    erase_row(role);
  return victims.size();
}

void RelationIndex::erase_row(const Role &role) {
  auto slot = row_slots_.find(role);
  rows_.erase(slot->second);
  row_slots_.erase(slot);

  auto by_movie = actors_by_movie_.find(role.movie_id);
  std::erase(by_movie->second, role.actor_id);
  if (by_movie->second.empty())
    actors_by_movie_.erase(by_movie);

  auto by_actor = movies_by_actor_.find(role.actor_id);
  std::erase(by_actor->second, role.movie_id);
  if (by_actor->second.empty())
    movies_by_actor_.erase(by_actor);
}

// ═══════════════════════════════════════════════════════════════════════════
// Directional lookups
// ═══════════════════════════════════════════════════════════════════════════

const std::vector<ActorId> &
RelationIndex::actors_of(MovieId movie_id) const noexcept {
  auto it = actors_by_movie_.find(movie_id);
  return it == actors_by_movie_.end() ? empty_ids() : it->second;
}

const std::vector<MovieId> &
RelationIndex::movies_of(ActorId actor_id) const noexcept {
  auto it = movies_by_actor_.find(actor_id);
  return it == movies_by_actor_.end() ? empty_ids() : it->second;
}

} // namespace reel
