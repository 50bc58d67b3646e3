#include "reel/catalog.hpp"
#include "reel/log.hpp"

#include <utility>

namespace reel {

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

Catalog::Catalog(CatalogOptions options)
    : options_(std::move(options)), engine_(store_, relations_, options_) {
  log::set_level(options_.log_level);
  log::logger()->info("catalog '{}' created", options_.name);
}

// ═══════════════════════════════════════════════════════════════════════════
// Writes: every call runs to completion under mutex_
// ═══════════════════════════════════════════════════════════════════════════

Result<ActorId> Catalog::insert_actor(std::string name,
                                      std::optional<int> age) {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.insert_actor(std::move(name), age);
}

Result<MovieId> Catalog::insert_movie(std::string title,
                                      std::optional<int> release_year) {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.insert_movie(std::move(title), release_year);
}

Result<void> Catalog::delete_actor(ActorId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.delete_actor(id, relations_);
}

Result<void> Catalog::delete_movie(MovieId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.delete_movie(id, relations_);
}

Result<void> Catalog::link(MovieId movie_id, ActorId actor_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return relations_.link(store_, movie_id, actor_id);
}

size_t Catalog::unlink_all(std::optional<MovieId> movie_id,
                           std::optional<ActorId> actor_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return relations_.unlink_all(movie_id, actor_id);
}

// ═══════════════════════════════════════════════════════════════════════════
// Point lookups
// ═══════════════════════════════════════════════════════════════════════════

Result<Actor> Catalog::get_actor(ActorId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.get_actor(id);
}

Result<Movie> Catalog::get_movie(MovieId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.get_movie(id);
}

std::vector<ActorId> Catalog::linked_actors(MovieId movie_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return relations_.actors_of(movie_id);
}

std::vector<MovieId> Catalog::linked_movies(ActorId actor_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return relations_.movies_of(actor_id);
}

size_t Catalog::role_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return relations_.size();
}

// ═══════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════

std::vector<Actor> Catalog::list_actors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.list_actors();
}

std::vector<Movie> Catalog::list_movies() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.list_movies();
}

std::vector<Actor> Catalog::cast_of(std::string_view movie_title) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.cast_of(movie_title);
}

std::vector<Movie> Catalog::movies_of(std::string_view actor_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.movies_of(actor_name);
}

std::vector<Movie> Catalog::movies_in_year(int year) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.movies_in_year(year);
}

std::vector<Actor> Catalog::actors_younger_than(int max_age) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.actors_younger_than(max_age);
}

std::vector<ActorMovieCount> Catalog::movie_count_per_actor() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.movie_count_per_actor();
}

std::optional<Actor> Catalog::oldest_actor() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.oldest_actor();
}

std::vector<Movie> Catalog::movies_from(int year) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.movies_from(year);
}

std::vector<MovieCast> Catalog::movie_casts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.movie_casts();
}

std::vector<MovieActorCount> Catalog::movies_with_multiple_actors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.movies_with_multiple_actors();
}

std::optional<double> Catalog::average_actor_age() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.average_actor_age();
}

std::vector<DecadeGroup> Catalog::movies_by_decade() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.movies_by_decade();
}

std::vector<ActorMovieCount> Catalog::actors_in_multiple_movies() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.actors_in_multiple_movies();
}

std::optional<Movie> Catalog::most_recent_movie() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.most_recent_movie();
}

std::vector<std::string> Catalog::tables() const {
  // Constant data; no lock needed.
  return engine_.tables();
}

std::string Catalog::database_name() const { return engine_.database_name(); }

} // namespace reel
