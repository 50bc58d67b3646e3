/**
 * @file reel_c_api.cpp
 * @brief C API implementation: exception-safe FFI boundary.
 *
 * Every extern "C" entry point runs its body through guarded(), which maps
 * std::bad_alloc to REEL_ERR_OUT_OF_MEMORY and anything else thrown to
 * REEL_ERR_UNKNOWN (logged) so no exception unwinds into C callers.
 */

#include "reel/reel_c_api.h"
#include "reel/catalog.hpp"
#include "reel/log.hpp"
#include "reel/seed.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <new>
#include <string>
#include <string_view>
#include <vector>

// ===========================================================================
// Internal: handle casts, conversions, error mapping
// ===========================================================================

namespace {

reel::Catalog *to_catalog(reel_catalog_t *handle) {
  return reinterpret_cast<reel::Catalog *>(handle);
}

reel_error_t to_c_error(reel::CatalogError err) {
  switch (err) {
  case reel::CatalogError::Validation:
    return REEL_ERR_VALIDATION;
  case reel::CatalogError::NotFound:
    return REEL_ERR_NOT_FOUND;
  case reel::CatalogError::Duplicate:
    return REEL_ERR_DUPLICATE;
  }
  return REEL_ERR_UNKNOWN;
}

/// Copies at most capacity - 1 bytes and always terminates.
void copy_text(char *dst, size_t capacity, std::string_view src) {
  size_t n = std::min(src.size(), capacity - 1);
  std::memcpy(dst, src.data(), n);
  dst[n] = '\0';
}

void to_c(const reel::Actor &src, reel_actor_t &dst) {
  std::memset(&dst, 0, sizeof(dst));
  dst.id = src.id;
  copy_text(dst.name, sizeof(dst.name), src.name);
  dst.has_age = src.age.has_value() ? 1 : 0;
  dst.age = src.age.value_or(0);
}

void to_c(const reel::Movie &src, reel_movie_t &dst) {
  std::memset(&dst, 0, sizeof(dst));
  dst.id = src.id;
  copy_text(dst.title, sizeof(dst.title), src.title);
  dst.has_release_year = src.release_year.has_value() ? 1 : 0;
  dst.release_year = src.release_year.value_or(0);
}

void to_c(const reel::ActorMovieCount &src, reel_actor_count_t &dst) {
  to_c(src.actor, dst.actor);
  dst.movie_count = src.movie_count;
}

void to_c(const reel::MovieActorCount &src, reel_movie_count_t &dst) {
  to_c(src.movie, dst.movie);
  dst.actor_count = src.actor_count;
}

void to_c(const reel::MovieCast &src, reel_movie_cast_t &dst) {
  std::memset(&dst, 0, sizeof(dst));
  copy_text(dst.title, sizeof(dst.title), src.title);
  dst.has_release_year = src.release_year.has_value() ? 1 : 0;
  dst.release_year = src.release_year.value_or(0);
  copy_text(dst.cast, sizeof(dst.cast), src.cast);
}

void to_c(const reel::DecadeGroup &src, reel_decade_group_t &dst) {
  std::memset(&dst, 0, sizeof(dst));
  dst.decade = src.decade;
  copy_text(dst.label, sizeof(dst.label), src.label);
  dst.movie_count = src.movie_count;
  copy_text(dst.titles, sizeof(dst.titles), src.titles);
}

/// All-or-nothing copy of `rows` into the caller buffer.
template <typename CRow, typename Row>
reel_error_t write_rows(const std::vector<Row> &rows, CRow *out_rows,
                        size_t max_count, size_t *out_count) {
  *out_count = rows.size();
  if (rows.size() > max_count)
    return REEL_ERR_BUFFER_TOO_SMALL;
  for (size_t i = 0; i < rows.size(); ++i)
    to_c(rows[i], out_rows[i]);
  return REEL_OK;
}

template <typename Fn> reel_error_t guarded(const char *entry, Fn &&body) {
  try {
    return body();
  } catch (const std::bad_alloc &) {
    return REEL_ERR_OUT_OF_MEMORY;
  } catch (const std::exception &e) {
    reel::log::logger()->error("{}: {}", entry, e.what());
    return REEL_ERR_UNKNOWN;
  } catch (...) {
    reel::log::logger()->error("{}: unknown exception", entry);
    return REEL_ERR_UNKNOWN;
  }
}

/// Validates the common (handle, out_rows, out_count) triple.
template <typename CRow>
bool bad_list_args(reel_catalog_t *catalog, CRow *out_rows, size_t max_count,
                   size_t *out_count) {
  return !catalog || !out_count || (max_count > 0 && !out_rows);
}

} // namespace

extern "C" {

// ===========================================================================
// Lifecycle
// ===========================================================================

REEL_API const char *reel_version(void) { return "0.1.0"; }

REEL_API reel_error_t reel_catalog_create(reel_catalog_t **out_catalog) {
  if (!out_catalog)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_catalog_create", [&] {
    *out_catalog = reinterpret_cast<reel_catalog_t *>(new reel::Catalog());
    return REEL_OK;
  });
}

REEL_API reel_error_t reel_catalog_create_named(const char *name,
                                               reel_catalog_t **out_catalog) {
  if (!name || !out_catalog)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_catalog_create_named", [&] {
    auto *catalog =
        new reel::Catalog(reel::CatalogOptions{.name = std::string(name)});
    *out_catalog = reinterpret_cast<reel_catalog_t *>(catalog);
    return REEL_OK;
  });
}

REEL_API reel_error_t reel_catalog_destroy(reel_catalog_t *catalog) {
  if (!catalog)
    return REEL_OK; // No-op for NULL

  delete to_catalog(catalog);
  return REEL_OK;
}

REEL_API reel_error_t reel_catalog_seed(reel_catalog_t *catalog) {
  if (!catalog)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_catalog_seed", [&] {
    auto seeded = reel::seed_sample_catalog(*to_catalog(catalog));
    return seeded ? REEL_OK : to_c_error(seeded.error());
  });
}

// ===========================================================================
// Writes
// ===========================================================================

REEL_API reel_error_t reel_insert_actor(reel_catalog_t *catalog,
                                        const char *name, const int32_t *age,
                                        int64_t *out_id) {
  if (!catalog || !name || !out_id)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_insert_actor", [&] {
    std::optional<int> known_age;
    if (age)
      known_age = *age;
    auto id = to_catalog(catalog)->insert_actor(name, known_age);
    if (!id)
      return to_c_error(id.error());
    *out_id = *id;
    return REEL_OK;
  });
}

REEL_API reel_error_t reel_insert_movie(reel_catalog_t *catalog,
                                        const char *title,
                                        const int32_t *release_year,
                                        int64_t *out_id) {
  if (!catalog || !title || !out_id)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_insert_movie", [&] {
    std::optional<int> known_year;
    if (release_year)
      known_year = *release_year;
    auto id = to_catalog(catalog)->insert_movie(title, known_year);
    if (!id)
      return to_c_error(id.error());
    *out_id = *id;
    return REEL_OK;
  });
}

REEL_API reel_error_t reel_delete_actor(reel_catalog_t *catalog, int64_t id) {
  if (!catalog)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_delete_actor", [&] {
    auto deleted = to_catalog(catalog)->delete_actor(id);
    return deleted ? REEL_OK : to_c_error(deleted.error());
  });
}

REEL_API reel_error_t reel_delete_movie(reel_catalog_t *catalog, int64_t id) {
  if (!catalog)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_delete_movie", [&] {
    auto deleted = to_catalog(catalog)->delete_movie(id);
    return deleted ? REEL_OK : to_c_error(deleted.error());
  });
}

REEL_API reel_error_t reel_link(reel_catalog_t *catalog, int64_t movie_id,
                                int64_t actor_id) {
  if (!catalog)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_link", [&] {
    auto linked = to_catalog(catalog)->link(movie_id, actor_id);
    return linked ? REEL_OK : to_c_error(linked.error());
  });
}

// ===========================================================================
// Lookups
// ===========================================================================

REEL_API reel_error_t reel_get_actor(reel_catalog_t *catalog, int64_t id,
                                     reel_actor_t *out_actor) {
  if (!catalog || !out_actor)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_get_actor", [&] {
    auto actor = to_catalog(catalog)->get_actor(id);
    if (!actor)
      return to_c_error(actor.error());
    to_c(*actor, *out_actor);
    return REEL_OK;
  });
}

REEL_API reel_error_t reel_get_movie(reel_catalog_t *catalog, int64_t id,
                                     reel_movie_t *out_movie) {
  if (!catalog || !out_movie)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_get_movie", [&] {
    auto movie = to_catalog(catalog)->get_movie(id);
    if (!movie)
      return to_c_error(movie.error());
    to_c(*movie, *out_movie);
    return REEL_OK;
  });
}

// ===========================================================================
// Queries: list results
// ===========================================================================

REEL_API reel_error_t reel_list_actors(reel_catalog_t *catalog,
                                       reel_actor_t *out_rows,
                                       size_t max_count, size_t *out_count) {
  if (bad_list_args(catalog, out_rows, max_count, out_count))
    return REEL_ERR_NULL_PTR;

  return guarded("reel_list_actors", [&] {
    return write_rows(to_catalog(catalog)->list_actors(), out_rows, max_count,
                      out_count);
  });
}

REEL_API reel_error_t reel_list_movies(reel_catalog_t *catalog,
                                       reel_movie_t *out_rows,
                                       size_t max_count, size_t *out_count) {
  if (bad_list_args(catalog, out_rows, max_count, out_count))
    return REEL_ERR_NULL_PTR;

  return guarded("reel_list_movies", [&] {
    return write_rows(to_catalog(catalog)->list_movies(), out_rows, max_count,
                      out_count);
  });
}

REEL_API reel_error_t reel_cast_of(reel_catalog_t *catalog,
                                   const char *movie_title,
                                   reel_actor_t *out_rows, size_t max_count,
                                   size_t *out_count) {
  if (!movie_title || bad_list_args(catalog, out_rows, max_count, out_count))
    return REEL_ERR_NULL_PTR;

  return guarded("reel_cast_of", [&] {
    return write_rows(to_catalog(catalog)->cast_of(movie_title), out_rows,
                      max_count, out_count);
  });
}

REEL_API reel_error_t reel_movies_of(reel_catalog_t *catalog,
                                     const char *actor_name,
                                     reel_movie_t *out_rows, size_t max_count,
                                     size_t *out_count) {
  if (!actor_name || bad_list_args(catalog, out_rows, max_count, out_count))
    return REEL_ERR_NULL_PTR;

  return guarded("reel_movies_of", [&] {
    return write_rows(to_catalog(catalog)->movies_of(actor_name), out_rows,
                      max_count, out_count);
  });
}

REEL_API reel_error_t reel_movies_in_year(reel_catalog_t *catalog,
                                          int32_t year, reel_movie_t *out_rows,
                                          size_t max_count, size_t *out_count) {
  if (bad_list_args(catalog, out_rows, max_count, out_count))
    return REEL_ERR_NULL_PTR;

  return guarded("reel_movies_in_year", [&] {
    return write_rows(to_catalog(catalog)->movies_in_year(year), out_rows,
                      max_count, out_count);
  });
}

REEL_API reel_error_t reel_actors_younger_than(reel_catalog_t *catalog,
                                               int32_t max_age,
                                               reel_actor_t *out_rows,
                                               size_t max_count,
                                               size_t *out_count) {
  if (bad_list_args(catalog, out_rows, max_count, out_count))
    return REEL_ERR_NULL_PTR;

  return guarded("reel_actors_younger_than", [&] {
    return write_rows(to_catalog(catalog)->actors_younger_than(max_age),
                      out_rows, max_count, out_count);
  });
}

REEL_API reel_error_t
reel_movie_count_per_actor(reel_catalog_t *catalog,
                           reel_actor_count_t *out_rows, size_t max_count,
                           size_t *out_count) {
  if (bad_list_args(catalog, out_rows, max_count, out_count))
    return REEL_ERR_NULL_PTR;

  return guarded("reel_movie_count_per_actor", [&] {
    return write_rows(to_catalog(catalog)->movie_count_per_actor(), out_rows,
                      max_count, out_count);
  });
}

REEL_API reel_error_t reel_movies_from(reel_catalog_t *catalog, int32_t year,
                                       reel_movie_t *out_rows,
                                       size_t max_count, size_t *out_count) {
  if (bad_list_args(catalog, out_rows, max_count, out_count))
    return REEL_ERR_NULL_PTR;

  return guarded("reel_movies_from", [&] {
    return write_rows(to_catalog(catalog)->movies_from(year), out_rows,
                      max_count, out_count);
  });
}

REEL_API reel_error_t reel_movie_casts(reel_catalog_t *catalog,
                                       reel_movie_cast_t *out_rows,
                                       size_t max_count, size_t *out_count) {
  if (bad_list_args(catalog, out_rows, max_count, out_count))
    return REEL_ERR_NULL_PTR;

  return guarded("reel_movie_casts", [&] {
    return write_rows(to_catalog(catalog)->movie_casts(), out_rows, max_count,
                      out_count);
  });
}

REEL_API reel_error_t
reel_movies_with_multiple_actors(reel_catalog_t *catalog,
                                 reel_movie_count_t *out_rows,
                                 size_t max_count, size_t *out_count) {
  if (bad_list_args(catalog, out_rows, max_count, out_count))
    return REEL_ERR_NULL_PTR;

  return guarded("reel_movies_with_multiple_actors", [&] {
    return write_rows(to_catalog(catalog)->movies_with_multiple_actors(),
                      out_rows, max_count, out_count);
  });
}

REEL_API reel_error_t reel_movies_by_decade(reel_catalog_t *catalog,
                                            reel_decade_group_t *out_rows,
                                            size_t max_count,
                                            size_t *out_count) {
  if (bad_list_args(catalog, out_rows, max_count, out_count))
    return REEL_ERR_NULL_PTR;

  return guarded("reel_movies_by_decade", [&] {
    return write_rows(to_catalog(catalog)->movies_by_decade(), out_rows,
                      max_count, out_count);
  });
}

REEL_API reel_error_t
reel_actors_in_multiple_movies(reel_catalog_t *catalog,
                               reel_actor_count_t *out_rows, size_t max_count,
                               size_t *out_count) {
  if (bad_list_args(catalog, out_rows, max_count, out_count))
    return REEL_ERR_NULL_PTR;

  return guarded("reel_actors_in_multiple_movies", [&] {
    return write_rows(to_catalog(catalog)->actors_in_multiple_movies(),
                      out_rows, max_count, out_count);
  });
}

// ===========================================================================
// Queries: single-row results
// ===========================================================================

REEL_API reel_error_t reel_oldest_actor(reel_catalog_t *catalog,
                                        reel_actor_t *out_actor,
                                        int32_t *out_found) {
  if (!catalog || !out_actor || !out_found)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_oldest_actor", [&] {
    auto oldest = to_catalog(catalog)->oldest_actor();
    *out_found = oldest ? 1 : 0;
    if (oldest)
      to_c(*oldest, *out_actor);
    return REEL_OK;
  });
}

REEL_API reel_error_t reel_most_recent_movie(reel_catalog_t *catalog,
                                             reel_movie_t *out_movie,
                                             int32_t *out_found) {
  if (!catalog || !out_movie || !out_found)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_most_recent_movie", [&] {
    auto newest = to_catalog(catalog)->most_recent_movie();
    *out_found = newest ? 1 : 0;
    if (newest)
      to_c(*newest, *out_movie);
    return REEL_OK;
  });
}

REEL_API reel_error_t reel_average_actor_age(reel_catalog_t *catalog,
                                             double *out_average,
                                             int32_t *out_found) {
  if (!catalog || !out_average || !out_found)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_average_actor_age", [&] {
    auto average = to_catalog(catalog)->average_actor_age();
    *out_found = average ? 1 : 0;
    *out_average = average.value_or(0.0);
    return REEL_OK;
  });
}

REEL_API reel_error_t reel_database_name(reel_catalog_t *catalog,
                                         char *out_buf, size_t buf_capacity,
                                         size_t *out_len) {
  if (!catalog || !out_buf || !out_len)
    return REEL_ERR_NULL_PTR;

  return guarded("reel_database_name", [&] {
    std::string name = to_catalog(catalog)->database_name();
    *out_len = name.size();

    // Need space for the null terminator
    if (buf_capacity < name.size() + 1)
      return REEL_ERR_BUFFER_TOO_SMALL;

    std::memcpy(out_buf, name.data(), name.size());
    out_buf[name.size()] = '\0';
    return REEL_OK;
  });
}

} // extern "C"
