#pragma once

/**
 * @file catalog.hpp
 * @brief Thread-safe facade over EntityStore, RelationIndex and QueryEngine.
 *
 * The Catalog owns the three components and wires the delete cascade
 * between them. One exclusive mutex guards the whole state for the
 * duration of every public call; the dataset is small and fully in memory
 * so nothing finer-grained is needed.
 *
 * Every result is returned by value so it stays valid after the lock is
 * released.
 */

#include "reel/entity_store.hpp"
#include "reel/error.hpp"
#include "reel/options.hpp"
#include "reel/query_engine.hpp"
#include "reel/relation_index.hpp"
#include "reel/schema.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reel {

class Catalog {
public:
  Catalog() : Catalog(CatalogOptions{}) {}
  explicit Catalog(CatalogOptions options);

  // Non-copyable, non-movable (QueryEngine holds references into *this)
  Catalog(const Catalog &) = delete;
  Catalog &operator=(const Catalog &) = delete;

  const CatalogOptions &options() const noexcept { return options_; }

  // ═══════════════════════════════════════════════════════════════════════
  // Writes
  // ═══════════════════════════════════════════════════════════════════════

  Result<ActorId> insert_actor(std::string name,
                               std::optional<int> age = std::nullopt);
  Result<MovieId> insert_movie(std::string title,
                               std::optional<int> release_year = std::nullopt);

  /// Removes the actor and all of its roles.
  Result<void> delete_actor(ActorId id);
  /// Removes the movie and all of its roles.
  Result<void> delete_movie(MovieId id);

  Result<void> link(MovieId movie_id, ActorId actor_id);

  /// Removes matching roles without touching the entities.
  size_t unlink_all(std::optional<MovieId> movie_id,
                    std::optional<ActorId> actor_id);

  // ═══════════════════════════════════════════════════════════════════════
  // Point lookups
  // ═══════════════════════════════════════════════════════════════════════

  Result<Actor> get_actor(ActorId id) const;
  Result<Movie> get_movie(MovieId id) const;

  /// RelationIndex::actors_of() snapshot.
  std::vector<ActorId> linked_actors(MovieId movie_id) const;
  /// RelationIndex::movies_of() snapshot.
  std::vector<MovieId> linked_movies(ActorId actor_id) const;

  size_t role_count() const;

  // ═══════════════════════════════════════════════════════════════════════
  // Queries (see QueryEngine for contracts)
  // ═══════════════════════════════════════════════════════════════════════

  std::vector<Actor> list_actors() const;
  std::vector<Movie> list_movies() const;
  std::vector<Actor> cast_of(std::string_view movie_title) const;
  std::vector<Movie> movies_of(std::string_view actor_name) const;
  std::vector<Movie> movies_in_year(int year) const;
  std::vector<Actor> actors_younger_than(int max_age) const;
  std::vector<ActorMovieCount> movie_count_per_actor() const;
  std::optional<Actor> oldest_actor() const;
  std::vector<Movie> movies_from(int year) const;
  std::vector<MovieCast> movie_casts() const;
  std::vector<MovieActorCount> movies_with_multiple_actors() const;
  std::optional<double> average_actor_age() const;
  std::vector<DecadeGroup> movies_by_decade() const;
  std::vector<ActorMovieCount> actors_in_multiple_movies() const;
  std::optional<Movie> most_recent_movie() const;
  std::vector<std::string> tables() const;
  std::string database_name() const;

private:
  const CatalogOptions options_;
  EntityStore store_;
  RelationIndex relations_;
  QueryEngine engine_;

  mutable std::mutex mutex_;
};

} // namespace reel
