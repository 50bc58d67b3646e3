#include "reel/entity_store.hpp"
#include "reel/log.hpp"
#include "reel/relation_index.hpp"

#include <utility>

namespace reel {

// ═══════════════════════════════════════════════════════════════════════════
// Inserts
// ═══════════════════════════════════════════════════════════════════════════

Result<ActorId> EntityStore::insert_actor(std::string name,
                                          std::optional<int> age) {
  if (name.empty()) {
    log::logger()->warn("insert_actor rejected: empty name");
    return std::unexpected(CatalogError::Validation);
  }

  ActorId id = actors_.insert(Actor{.name = std::move(name), .age = age});
  log::logger()->debug("insert_actor id={} name='{}'", id,
                       actors_.find(id)->name);
  return id;
}

Result<MovieId> EntityStore::insert_movie(std::string title,
                                          std::optional<int> release_year) {
  if (title.empty()) {
    log::logger()->warn("insert_movie rejected: empty title");
    return std::unexpected(CatalogError::Validation);
  }

  MovieId id = movies_.insert(
      Movie{.title = std::move(title), .release_year = release_year});
  log::logger()->debug("insert_movie id={} title='{}'", id,
                       movies_.find(id)->title);
  return id;
}

// ═══════════════════════════════════════════════════════════════════════════
// Lookups
// ═══════════════════════════════════════════════════════════════════════════

Result<Actor> EntityStore::get_actor(ActorId id) const {
  if (const Actor *actor = actors_.find(id))
    return *actor;
  return std::unexpected(CatalogError::NotFound);
}

Result<Movie> EntityStore::get_movie(MovieId id) const {
  if (const Movie *movie = movies_.find(id))
    return *movie;
  return std::unexpected(CatalogError::NotFound);
}

// ═══════════════════════════════════════════════════════════════════════════
// Deletes (ON DELETE CASCADE)
// ═══════════════════════════════════════════════════════════════════════════

Result<void> EntityStore::delete_actor(ActorId id, RelationIndex &relations) {
  // Existence is checked first so a miss never touches the relation rows.
  if (!actors_.contains(id)) {
    log::logger()->warn("delete_actor rejected: id={} not found", id);
    return std::unexpected(CatalogError::NotFound);
  }

  size_t removed = relations.unlink_all(std::nullopt, id);
  actors_.erase(id);
  log::logger()->debug("delete_actor id={} cascaded {} role(s)", id, removed);
  return {};
}

Result<void> EntityStore::delete_movie(MovieId id, RelationIndex &relations) {
  if (!movies_.contains(id)) {
    log::logger()->warn("delete_movie rejected: id={} not found", id);
    return std::unexpected(CatalogError::NotFound);
  }

  size_t removed = relations.unlink_all(id, std::nullopt);
  movies_.erase(id);
  log::logger()->debug("delete_movie id={} cascaded {} role(s)", id, removed);
  return {};
}

} // namespace reel
