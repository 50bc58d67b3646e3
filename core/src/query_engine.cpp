#include "reel/query_engine.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <map>

namespace reel {

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

double round_half_away(double value, int places) noexcept {
  const double scale = std::pow(10.0, places);
  // std::round rounds half away from zero.
  return std::round(value * scale) / scale;
}

namespace {

/// Stable descending sort on movie_count; ties keep insertion order.
void sort_busiest_first(std::vector<ActorMovieCount> &rows) {
  std::stable_sort(rows.begin(), rows.end(),
                   [](const ActorMovieCount &a, const ActorMovieCount &b) {
                     return a.movie_count > b.movie_count;
                   });
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Listing
// ═══════════════════════════════════════════════════════════════════════════

std::vector<Actor> QueryEngine::list_actors() const {
  return store_.list_actors();
}

std::vector<Movie> QueryEngine::list_movies() const {
  return store_.list_movies();
}

std::vector<std::string> QueryEngine::tables() const {
  return std::vector<std::string>(RELATION_NAMES.begin(),
                                  RELATION_NAMES.end());
}

// ═══════════════════════════════════════════════════════════════════════════
// Joins: Movies ⋈ Movie_Actors ⋈ Actors
// ═══════════════════════════════════════════════════════════════════════════

std::vector<Actor> QueryEngine::cast_of(std::string_view movie_title) const {
  std::vector<Actor> cast;
  for (const Movie &movie : store_.movies()) {
    if (movie.title != movie_title)
      continue;
    for (ActorId actor_id : relations_.actors_of(movie.id)) {
      if (const Actor *actor = store_.find_actor(actor_id))
        cast.push_back(*actor);
    }
  }
  return cast;
}

std::vector<Movie> QueryEngine::movies_of(std::string_view actor_name) const {
  std::vector<Movie> movies;
  for (const Actor &actor : store_.actors()) {
    if (actor.name != actor_name)
      continue;
    for (MovieId movie_id : relations_.movies_of(actor.id)) {
      if (const Movie *movie = store_.find_movie(movie_id))
        movies.push_back(*movie);
    }
  }
  return movies;
}

std::vector<MovieCast> QueryEngine::movie_casts() const {
  std::vector<MovieCast> rows;
  for (const Movie &movie : store_.movies()) {
    const auto &actor_ids = relations_.actors_of(movie.id);
    if (actor_ids.empty())
      continue; // inner join: no cast, no row

    std::vector<std::string_view> names;
    names.reserve(actor_ids.size());
    for (ActorId actor_id : actor_ids) {
      if (const Actor *actor = store_.find_actor(actor_id))
        names.push_back(actor->name);
    }

    rows.push_back(MovieCast{
        .title = movie.title,
        .release_year = movie.release_year,
        .cast = fmt::format("{}", fmt::join(names, options_.list_separator)),
    });
  }
  return rows;
}

// ═══════════════════════════════════════════════════════════════════════════
// Filters
// ═══════════════════════════════════════════════════════════════════════════

std::vector<Movie> QueryEngine::movies_in_year(int year) const {
  std::vector<Movie> movies;
  for (const Movie &movie : store_.movies()) {
    if (movie.release_year && *movie.release_year == year)
      movies.push_back(movie);
  }
  return movies;
}

std::vector<Actor> QueryEngine::actors_younger_than(int max_age) const {
  std::vector<Actor> actors;
  for (const Actor &actor : store_.actors()) {
    if (actor.age && *actor.age < max_age)
      actors.push_back(actor);
  }
  return actors;
}

std::vector<Movie> QueryEngine::movies_from(int year) const {
  std::vector<Movie> movies;
  for (const Movie &movie : store_.movies()) {
    if (movie.release_year && *movie.release_year >= year)
      movies.push_back(movie);
  }
  std::stable_sort(movies.begin(), movies.end(),
                   [](const Movie &a, const Movie &b) {
                     return *a.release_year < *b.release_year;
                   });
  return movies;
}

// ═══════════════════════════════════════════════════════════════════════════
// Grouped Aggregates
// ═══════════════════════════════════════════════════════════════════════════

std::vector<ActorMovieCount> QueryEngine::movie_count_per_actor() const {
  // LEFT JOIN: every actor gets a row, unlinked actors count 0.
  std::vector<ActorMovieCount> rows;
  rows.reserve(store_.actor_count());
  for (const Actor &actor : store_.actors())
    rows.push_back(
        ActorMovieCount{actor, relations_.movies_of(actor.id).size()});

  sort_busiest_first(rows);
  return rows;
}

std::vector<ActorMovieCount> QueryEngine::actors_in_multiple_movies() const {
  std::vector<ActorMovieCount> rows;
  for (const Actor &actor : store_.actors()) {
    size_t count = relations_.movies_of(actor.id).size();
    if (count > 1)
      rows.push_back(ActorMovieCount{actor, count});
  }

  sort_busiest_first(rows);
  return rows;
}

std::vector<MovieActorCount> QueryEngine::movies_with_multiple_actors() const {
  std::vector<MovieActorCount> rows;
  for (const Movie &movie : store_.movies()) {
    size_t count = relations_.actors_of(movie.id).size();
    if (count > 1)
      rows.push_back(MovieActorCount{movie, count});
  }
  return rows;
}

std::vector<DecadeGroup> QueryEngine::movies_by_decade() const {
  // std::map keeps buckets ascending; titles append in insertion order.
  std::map<int, std::vector<std::string_view>> buckets;
  for (const Movie &movie : store_.movies()) {
    if (movie.release_year)
      buckets[decade_of(*movie.release_year)].push_back(movie.title);
  }

  std::vector<DecadeGroup> groups;
  groups.reserve(buckets.size());
  for (const auto &[decade, titles] : buckets) {
    groups.push_back(DecadeGroup{
        .decade = decade,
        .label = fmt::format("{}{}", decade, DECADE_SUFFIX),
        .movie_count = titles.size(),
        .titles =
            fmt::format("{}", fmt::join(titles, options_.list_separator)),
    });
  }
  return groups;
}

std::optional<double> QueryEngine::average_actor_age() const {
  long long sum = 0;
  size_t known = 0;
  for (const Actor &actor : store_.actors()) {
    if (actor.age) {
      sum += *actor.age;
      ++known;
    }
  }

  if (known == 0)
    return std::nullopt;
  return round_half_away(static_cast<double>(sum) / static_cast<double>(known),
                         AVERAGE_PRECISION);
}

// ═══════════════════════════════════════════════════════════════════════════
// Extremes (ORDER BY ... DESC LIMIT 1)
// ═══════════════════════════════════════════════════════════════════════════

std::optional<Actor> QueryEngine::oldest_actor() const {
  const Actor *oldest = nullptr;
  for (const Actor &actor : store_.actors()) {
    // Strict '>' keeps the first inserted actor on ties.
    if (actor.age && (!oldest || *actor.age > *oldest->age))
      oldest = &actor;
  }

  if (!oldest)
    return std::nullopt;
  return *oldest;
}

std::optional<Movie> QueryEngine::most_recent_movie() const {
  const Movie *newest = nullptr;
  for (const Movie &movie : store_.movies()) {
    if (movie.release_year &&
        (!newest || *movie.release_year > *newest->release_year))
      newest = &movie;
  }

  if (!newest)
    return std::nullopt;
  return *newest;
}

} // namespace reel
