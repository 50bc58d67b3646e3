/**
 * @file reel_c_api.h
 * @brief Flat C interface to the Reel movie/actor catalog.
 *
 * DESIGN INVARIANTS:
 *   1. All functions are `extern "C"` for flat ABI compatibility.
 *   2. All functions return `reel_error_t` (integer enum).
 *   3. C++ exceptions never cross the FFI boundary.
 *   4. Caller-allocated buffers: the caller passes a pre-allocated array +
 *      max_count + out_count. Nothing is malloc'd inside and handed back.
 *   5. Opaque pointer pattern: `reel_catalog_t` hides all C++ internals.
 */

#ifndef REEL_C_API_H
#define REEL_C_API_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32) || defined(_WIN64)
#ifdef REEL_BUILDING_SHARED
#define REEL_API __declspec(dllexport)
#else
#define REEL_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define REEL_API __attribute__((visibility("default")))
#else
#define REEL_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* ═══════════════════════════════════════════════════════════════════════════
 * ERROR CODES
 * ═══════════════════════════════════════════════════════════════════════════
 */
typedef enum {
  REEL_OK = 0,                    /**< Success */
  REEL_ERR_NULL_PTR = -1,         /**< A required pointer argument was NULL */
  REEL_ERR_VALIDATION = -2,       /**< Empty name/title on insert */
  REEL_ERR_NOT_FOUND = -3,        /**< Referenced actor/movie id is absent */
  REEL_ERR_DUPLICATE = -4,        /**< (movie, actor) pair already linked */
  REEL_ERR_OUT_OF_MEMORY = -5,    /**< Allocation failed */
  REEL_ERR_BUFFER_TOO_SMALL = -6, /**< Caller buffer too small for result */
  REEL_ERR_UNKNOWN = -99          /**< Unknown internal error */
} reel_error_t;

/** Opaque handle to a catalog. */
typedef struct reel_catalog_s reel_catalog_t;

/* ═══════════════════════════════════════════════════════════════════════════
 * RESULT STRUCTURES: Caller-Allocated Buffers
 *
 * Strings are copied into fixed inline fields and always null-terminated.
 * Values longer than the field are cut at capacity - 1 bytes.
 * ═══════════════════════════════════════════════════════════════════════════
 */

#define REEL_NAME_CAPACITY 101   /**< VARCHAR(100) + terminator */
#define REEL_TITLE_CAPACITY 201  /**< VARCHAR(200) + terminator */
#define REEL_LIST_CAPACITY 1024  /**< Joined cast / title lists */
#define REEL_LABEL_CAPACITY 16   /**< Decade label, e.g. "1990s" */

typedef struct {
  int64_t id;
  char name[REEL_NAME_CAPACITY];
  int32_t age;     /**< Valid only when has_age != 0 */
  int32_t has_age;
} reel_actor_t;

typedef struct {
  int64_t id;
  char title[REEL_TITLE_CAPACITY];
  int32_t release_year;     /**< Valid only when has_release_year != 0 */
  int32_t has_release_year;
} reel_movie_t;

typedef struct {
  reel_actor_t actor;
  uint64_t movie_count;
} reel_actor_count_t;

typedef struct {
  reel_movie_t movie;
  uint64_t actor_count;
} reel_movie_count_t;

typedef struct {
  char title[REEL_TITLE_CAPACITY];
  int32_t release_year;
  int32_t has_release_year;
  char cast[REEL_LIST_CAPACITY];
} reel_movie_cast_t;

typedef struct {
  int32_t decade;
  char label[REEL_LABEL_CAPACITY];
  uint64_t movie_count;
  char titles[REEL_LIST_CAPACITY];
} reel_decade_group_t;

/* ═══════════════════════════════════════════════════════════════════════════
 * LIFECYCLE
 * ═══════════════════════════════════════════════════════════════════════════
 */

REEL_API const char *reel_version(void);

/** Creates an empty catalog with default options. */
REEL_API reel_error_t reel_catalog_create(reel_catalog_t **out_catalog);

/** Creates an empty catalog reporting `name` as its database name. */
REEL_API reel_error_t reel_catalog_create_named(const char *name,
                                               reel_catalog_t **out_catalog);

/** Destroys a catalog. NULL is a no-op. */
REEL_API reel_error_t reel_catalog_destroy(reel_catalog_t *catalog);

/** Loads the bundled sample actors, movies and roles. */
REEL_API reel_error_t reel_catalog_seed(reel_catalog_t *catalog);

/* ═══════════════════════════════════════════════════════════════════════════
 * WRITES
 * ═══════════════════════════════════════════════════════════════════════════
 */

/** `age` may be NULL for an unknown age. */
REEL_API reel_error_t reel_insert_actor(reel_catalog_t *catalog,
                                        const char *name, const int32_t *age,
                                        int64_t *out_id);

/** `release_year` may be NULL for an unknown year. */
REEL_API reel_error_t reel_insert_movie(reel_catalog_t *catalog,
                                        const char *title,
                                        const int32_t *release_year,
                                        int64_t *out_id);

REEL_API reel_error_t reel_delete_actor(reel_catalog_t *catalog, int64_t id);
REEL_API reel_error_t reel_delete_movie(reel_catalog_t *catalog, int64_t id);

REEL_API reel_error_t reel_link(reel_catalog_t *catalog, int64_t movie_id,
                                int64_t actor_id);

/* ═══════════════════════════════════════════════════════════════════════════
 * LOOKUPS
 * ═══════════════════════════════════════════════════════════════════════════
 */

REEL_API reel_error_t reel_get_actor(reel_catalog_t *catalog, int64_t id,
                                     reel_actor_t *out_actor);
REEL_API reel_error_t reel_get_movie(reel_catalog_t *catalog, int64_t id,
                                     reel_movie_t *out_movie);

/* ═══════════════════════════════════════════════════════════════════════════
 * QUERIES
 *
 * List-returning queries write at most `max_count` rows and always store
 * the full row count in `*out_count`. If the full result does not fit,
 * nothing is written and REEL_ERR_BUFFER_TOO_SMALL is returned, so a
 * caller can retry with `*out_count` rows. `out_rows` may be NULL when
 * `max_count` is 0 (size probe).
 *
 * Single-row queries set `*out_found` to 0 when there is no row.
 * ═══════════════════════════════════════════════════════════════════════════
 */

REEL_API reel_error_t reel_list_actors(reel_catalog_t *catalog,
                                       reel_actor_t *out_rows,
                                       size_t max_count, size_t *out_count);
REEL_API reel_error_t reel_list_movies(reel_catalog_t *catalog,
                                       reel_movie_t *out_rows,
                                       size_t max_count, size_t *out_count);
REEL_API reel_error_t reel_cast_of(reel_catalog_t *catalog,
                                   const char *movie_title,
                                   reel_actor_t *out_rows, size_t max_count,
                                   size_t *out_count);
REEL_API reel_error_t reel_movies_of(reel_catalog_t *catalog,
                                     const char *actor_name,
                                     reel_movie_t *out_rows, size_t max_count,
                                     size_t *out_count);
REEL_API reel_error_t reel_movies_in_year(reel_catalog_t *catalog,
                                          int32_t year, reel_movie_t *out_rows,
                                          size_t max_count, size_t *out_count);
REEL_API reel_error_t reel_actors_younger_than(reel_catalog_t *catalog,
                                               int32_t max_age,
                                               reel_actor_t *out_rows,
                                               size_t max_count,
                                               size_t *out_count);
REEL_API reel_error_t
reel_movie_count_per_actor(reel_catalog_t *catalog,
                           reel_actor_count_t *out_rows, size_t max_count,
                           size_t *out_count);
REEL_API reel_error_t reel_oldest_actor(reel_catalog_t *catalog,
                                        reel_actor_t *out_actor,
                                        int32_t *out_found);
REEL_API reel_error_t reel_movies_from(reel_catalog_t *catalog, int32_t year,
                                       reel_movie_t *out_rows,
                                       size_t max_count, size_t *out_count);
REEL_API reel_error_t reel_movie_casts(reel_catalog_t *catalog,
                                       reel_movie_cast_t *out_rows,
                                       size_t max_count, size_t *out_count);
REEL_API reel_error_t
reel_movies_with_multiple_actors(reel_catalog_t *catalog,
                                 reel_movie_count_t *out_rows,
                                 size_t max_count, size_t *out_count);
REEL_API reel_error_t reel_average_actor_age(reel_catalog_t *catalog,
                                             double *out_average,
                                             int32_t *out_found);
REEL_API reel_error_t reel_movies_by_decade(reel_catalog_t *catalog,
                                            reel_decade_group_t *out_rows,
                                            size_t max_count,
                                            size_t *out_count);
REEL_API reel_error_t
reel_actors_in_multiple_movies(reel_catalog_t *catalog,
                               reel_actor_count_t *out_rows, size_t max_count,
                               size_t *out_count);
REEL_API reel_error_t reel_most_recent_movie(reel_catalog_t *catalog,
                                             reel_movie_t *out_movie,
                                             int32_t *out_found);

/** Copies the database name into `out_buf` (null-terminated). */
REEL_API reel_error_t reel_database_name(reel_catalog_t *catalog,
                                         char *out_buf, size_t buf_capacity,
                                         size_t *out_len);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* REEL_C_API_H */
