#pragma once

/**
 * @file query_engine.hpp
 * @brief The fixed read surface of the catalog.
 *
 * Every query is recomputed from the current EntityStore + RelationIndex
 * state on each call. Joins walk the RelationIndex directional maps; GROUP
 * BY becomes an explicit ordered bucket map; LEFT JOIN semantics come from
 * scanning the entity table and reading a (possibly empty) link list.
 *
 * Ordering contract: unless stated otherwise results follow entity
 * insertion order, then link order. Sorts are stable so ties keep that
 * order.
 */

#include "reel/entity_store.hpp"
#include "reel/options.hpp"
#include "reel/relation_index.hpp"
#include "reel/schema.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reel {

class QueryEngine {
public:
  /// All three references must outlive the engine.
  QueryEngine(const EntityStore &store, const RelationIndex &relations,
              const CatalogOptions &options) noexcept
      : store_(store), relations_(relations), options_(options) {}

  std::vector<Actor> list_actors() const;
  std::vector<Movie> list_movies() const;

  /// Actors cast in any movie titled exactly `movie_title`.
  std::vector<Actor> cast_of(std::string_view movie_title) const;

  /// Movies featuring any actor named exactly `actor_name`.
  std::vector<Movie> movies_of(std::string_view actor_name) const;

  std::vector<Movie> movies_in_year(int year) const;

  /// Actors with a known age strictly below `max_age`.
  std::vector<Actor> actors_younger_than(int max_age) const;

  /// Every actor with its movie count, busiest first.
  std::vector<ActorMovieCount> movie_count_per_actor() const;

  /**
   * @brief Actor with the highest known age.
   * Ties resolve to the earliest inserted actor. nullopt if no actor has
   * a known age.
   */
  std::optional<Actor> oldest_actor() const;

  /// Movies released in or after `year`, oldest first.
  std::vector<Movie> movies_from(int year) const;

  /// Movies with at least one linked actor and their joined cast list.
  std::vector<MovieCast> movie_casts() const;

  std::vector<MovieActorCount> movies_with_multiple_actors() const;

  /**
   * @brief Mean of all known ages, rounded half away from zero to one
   * decimal place. nullopt when no actor has a known age.
   */
  std::optional<double> average_actor_age() const;

  /// Movies bucketed by decade, ascending. Movies without a year are skipped.
  std::vector<DecadeGroup> movies_by_decade() const;

  std::vector<ActorMovieCount> actors_in_multiple_movies() const;

  /// Movie with the latest known release year; ties resolve to the earliest
  /// inserted movie.
  std::optional<Movie> most_recent_movie() const;

  /// Names of the catalog's relations, sorted.
  std::vector<std::string> tables() const;

  /// Configured database name.
  std::string database_name() const { return options_.name; }

private:
  const EntityStore &store_;
  const RelationIndex &relations_;
  const CatalogOptions &options_;
};

/// Decade bucket of `year`. Division truncates toward zero.
constexpr int decade_of(int year) noexcept { return (year / 10) * 10; }

/// Rounds half away from zero to `places` decimals.
double round_half_away(double value, int places) noexcept;

} // namespace reel
