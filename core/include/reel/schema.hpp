#pragma once

/**
 * @file schema.hpp
 * @brief Record and result-row layouts for the Reel movie/actor catalog.
 *
 * Three relations make up the catalog:
 *
 *   Actors        [id | name | age?]
 *   Movies        [id | title | release_year?]
 *   Movie_Actors  [movie_id | actor_id]   (composite key, cascades)
 *
 * Records are plain aggregates. Ownership lives in EntityStore (Actors,
 * Movies) and RelationIndex (Movie_Actors).
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace reel {

// ═══════════════════════════════════════════════════════════════════════════
// Identifiers
// ═══════════════════════════════════════════════════════════════════════════

using ActorId = int64_t;
using MovieId = int64_t;

/// First id handed out by each auto-increment counter.
constexpr int64_t FIRST_ENTITY_ID = 1;

// ═══════════════════════════════════════════════════════════════════════════
// Compile-Time Constants
// ═══════════════════════════════════════════════════════════════════════════

constexpr std::string_view ACTORS_RELATION = "Actors";
constexpr std::string_view MOVIES_RELATION = "Movies";
constexpr std::string_view ROLES_RELATION = "Movie_Actors";

/// Relation names in sorted order, as reported by QueryEngine::tables().
constexpr std::array<std::string_view, 3> RELATION_NAMES = {
    ACTORS_RELATION, ROLES_RELATION, MOVIES_RELATION};

/// Default database name reported by QueryEngine::database_name().
constexpr std::string_view DEFAULT_DATABASE_NAME = "MovieDB";

/// Default separator for string aggregation (cast lists, decade titles).
constexpr std::string_view DEFAULT_LIST_SEPARATOR = ", ";

/// Suffix appended to a decade bucket label ("1990" -> "1990s").
constexpr std::string_view DECADE_SUFFIX = "s";

/// Decimal places kept by averaged ages.
constexpr int AVERAGE_PRECISION = 1;

// ═══════════════════════════════════════════════════════════════════════════
// Entity Records
// ═══════════════════════════════════════════════════════════════════════════

struct Actor {
  ActorId id = 0;
  std::string name;
  std::optional<int> age;

  bool operator==(const Actor &) const = default;
};

struct Movie {
  MovieId id = 0;
  std::string title;
  std::optional<int> release_year;

  bool operator==(const Movie &) const = default;
};

/// One Movie_Actors row. Both ids are non-owning references into
/// EntityStore and are valid for as long as the row exists.
struct Role {
  MovieId movie_id = 0;
  ActorId actor_id = 0;

  bool operator==(const Role &) const = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Query Result Rows
// ═══════════════════════════════════════════════════════════════════════════

/// Actor paired with an aggregate count (movieCountPerActor,
/// actorsInMultipleMovies).
struct ActorMovieCount {
  Actor actor;
  size_t movie_count = 0;

  bool operator==(const ActorMovieCount &) const = default;
};

/// Movie paired with the number of linked actors.
struct MovieActorCount {
  Movie movie;
  size_t actor_count = 0;

  bool operator==(const MovieActorCount &) const = default;
};

/// Movie with its joined cast list (movieCasts).
struct MovieCast {
  std::string title;
  std::optional<int> release_year;
  std::string cast;

  bool operator==(const MovieCast &) const = default;
};

/// One decade bucket (moviesByDecade).
struct DecadeGroup {
  int decade = 0;
  std::string label;
  size_t movie_count = 0;
  std::string titles;

  bool operator==(const DecadeGroup &) const = default;
};

} // namespace reel
