#include "reel/seed.hpp"
#include "reel/catalog.hpp"
#include "reel/log.hpp"

#include <array>
#include <string_view>
#include <vector>

namespace reel {

namespace {

struct SeedActor {
  std::string_view name;
  int age;
};

struct SeedMovie {
  std::string_view title;
  int release_year;
};

/// Indices into SEED_MOVIES / SEED_ACTORS.
struct SeedRole {
  size_t movie;
  size_t actor;
};

constexpr std::array<SeedActor, 5> SEED_ACTORS = {{
    {"Tom Hanks", 67},
    {"Meryl Streep", 74},
    {"Leonardo DiCaprio", 49},
    {"Scarlett Johansson", 39},
    {"Robert Downey Jr.", 58},
}};

constexpr std::array<SeedMovie, 5> SEED_MOVIES = {{
    {"Forrest Gump", 1994},
    {"The Devil Wears Prada", 2006},
    {"Titanic", 1997},
    {"Avengers: Endgame", 2019},
    {"The Shawshank Redemption", 1994},
}};

constexpr std::array<SeedRole, 6> SEED_ROLES = {{
    {0, 0}, // Forrest Gump ← Tom Hanks
    {1, 1}, // The Devil Wears Prada ← Meryl Streep
    {2, 2}, // Titanic ← Leonardo DiCaprio
    {3, 3}, // Avengers: Endgame ← Scarlett Johansson
    {3, 4}, // Avengers: Endgame ← Robert Downey Jr.
    {0, 1}, // Forrest Gump ← Meryl Streep
}};

} // namespace

Result<void> seed_sample_catalog(Catalog &catalog) {
  std::vector<ActorId> actor_ids;
  actor_ids.reserve(SEED_ACTORS.size());
  for (const auto &actor : SEED_ACTORS) {
    auto id = catalog.insert_actor(std::string(actor.name), actor.age);
    if (!id)
      return std::unexpected(id.error());
    actor_ids.push_back(*id);
  }

  std::vector<MovieId> movie_ids;
  movie_ids.reserve(SEED_MOVIES.size());
  for (const auto &movie : SEED_MOVIES) {
    auto id = catalog.insert_movie(std::string(movie.title),
                                   movie.release_year);
    if (!id)
      return std::unexpected(id.error());
    movie_ids.push_back(*id);
  }

  for (const auto &role : SEED_ROLES) {
    auto linked = catalog.link(movie_ids[role.movie], actor_ids[role.actor]);
    if (!linked)
      return linked;
  }

  log::logger()->info("seeded catalog '{}': {} actors, {} movies, {} roles",
                      catalog.database_name(), SEED_ACTORS.size(),
                      SEED_MOVIES.size(), SEED_ROLES.size());
  return {};
}

} // namespace reel
