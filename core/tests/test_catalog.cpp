/**
 * @file test_catalog.cpp
 * @brief Catalog facade on the bundled sample data: every query, cascade
 *        through the facade, failed-mutation invariance, and concurrent
 *        readers against a single writer.
 */

#include "reel/catalog.hpp"
#include "reel/seed.hpp"
#include <atomic>
#include <gtest/gtest.h>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace reel;

namespace {

std::vector<std::string> actor_names(const std::vector<Actor> &actors) {
  std::vector<std::string> out;
  for (const auto &a : actors)
    out.push_back(a.name);
  return out;
}

std::vector<std::string> movie_titles(const std::vector<Movie> &movies) {
  std::vector<std::string> out;
  for (const auto &m : movies)
    out.push_back(m.title);
  return out;
}

/// Finds a movie id by title in the current listing (0 if absent).
MovieId movie_id(const Catalog &catalog, std::string_view title) {
  for (const auto &m : catalog.list_movies())
    if (m.title == title)
      return m.id;
  return 0;
}

ActorId actor_id(const Catalog &catalog, std::string_view name) {
  for (const auto &a : catalog.list_actors())
    if (a.name == name)
      return a.id;
  return 0;
}

} // namespace

class SeededCatalogTest : public ::testing::Test {
protected:
  Catalog catalog;

  void SetUp() override { ASSERT_TRUE(seed_sample_catalog(catalog)); }
};

// ===========================================================================
// Seed round-trip, one test per query
// ===========================================================================

TEST_F(SeededCatalogTest, ListActors) {
  EXPECT_EQ(actor_names(catalog.list_actors()),
            (std::vector<std::string>{"Tom Hanks", "Meryl Streep",
                                      "Leonardo DiCaprio",
                                      "Scarlett Johansson",
                                      "Robert Downey Jr."}));
  auto actors = catalog.list_actors();
  for (size_t i = 0; i < actors.size(); ++i)
    EXPECT_EQ(actors[i].id, static_cast<ActorId>(i + 1));
}

TEST_F(SeededCatalogTest, ListMovies) {
  auto movies = catalog.list_movies();
  ASSERT_EQ(movies.size(), 5u);
  EXPECT_EQ(movies[0], (Movie{1, "Forrest Gump", 1994}));
  EXPECT_EQ(movies[4], (Movie{5, "The Shawshank Redemption", 1994}));
}

TEST_F(SeededCatalogTest, ListingIsIdempotent) {
  EXPECT_EQ(catalog.list_actors(), catalog.list_actors());
  EXPECT_EQ(catalog.list_movies(), catalog.list_movies());
}

TEST_F(SeededCatalogTest, CastOf) {
  EXPECT_EQ(actor_names(catalog.cast_of("Avengers: Endgame")),
            (std::vector<std::string>{"Scarlett Johansson",
                                      "Robert Downey Jr."}));
  EXPECT_TRUE(catalog.cast_of("The Godfather").empty());
}

TEST_F(SeededCatalogTest, MoviesOf) {
  EXPECT_EQ(movie_titles(catalog.movies_of("Meryl Streep")),
            (std::vector<std::string>{"The Devil Wears Prada",
                                      "Forrest Gump"}));
  EXPECT_TRUE(catalog.movies_of("Nobody").empty());
}

TEST_F(SeededCatalogTest, MoviesInYear) {
  EXPECT_EQ(movie_titles(catalog.movies_in_year(1994)),
            (std::vector<std::string>{"Forrest Gump",
                                      "The Shawshank Redemption"}));
}

TEST_F(SeededCatalogTest, ActorsYoungerThan) {
  auto young = catalog.actors_younger_than(50);
  ASSERT_EQ(young.size(), 2u);
  EXPECT_EQ(young[0].name, "Leonardo DiCaprio");
  EXPECT_EQ(young[0].age, 49);
  EXPECT_EQ(young[1].name, "Scarlett Johansson");
  EXPECT_EQ(young[1].age, 39);
}

TEST_F(SeededCatalogTest, MovieCountPerActor) {
  auto counts = catalog.movie_count_per_actor();
  ASSERT_EQ(counts.size(), 5u);
  EXPECT_EQ(counts[0].actor.name, "Meryl Streep");
  EXPECT_EQ(counts[0].movie_count, 2u);
  EXPECT_EQ(counts[1].actor.name, "Tom Hanks");
  EXPECT_EQ(counts[4].actor.name, "Robert Downey Jr.");

  size_t total = std::accumulate(
      counts.begin(), counts.end(), size_t{0},
      [](size_t sum, const ActorMovieCount &c) { return sum + c.movie_count; });
  EXPECT_EQ(total, catalog.role_count());
}

TEST_F(SeededCatalogTest, OldestActor) {
  auto oldest = catalog.oldest_actor();
  ASSERT_TRUE(oldest.has_value());
  EXPECT_EQ(oldest->name, "Meryl Streep");
  EXPECT_EQ(oldest->age, 74);
}

TEST_F(SeededCatalogTest, MoviesFrom) {
  auto modern = catalog.movies_from(2000);
  ASSERT_EQ(modern.size(), 2u);
  EXPECT_EQ(modern[0].title, "The Devil Wears Prada");
  EXPECT_EQ(modern[1].title, "Avengers: Endgame");
}

TEST_F(SeededCatalogTest, MovieCasts) {
  auto casts = catalog.movie_casts();
  ASSERT_EQ(casts.size(), 4u); // Shawshank has no cast
  EXPECT_EQ(casts[0],
            (MovieCast{"Forrest Gump", 1994, "Tom Hanks, Meryl Streep"}));
  EXPECT_EQ(casts[1].cast, "Meryl Streep");
  EXPECT_EQ(casts[2].cast, "Leonardo DiCaprio");
  EXPECT_EQ(casts[3], (MovieCast{"Avengers: Endgame", 2019,
                                 "Scarlett Johansson, Robert Downey Jr."}));
}

TEST_F(SeededCatalogTest, MoviesWithMultipleActors) {
  auto rows = catalog.movies_with_multiple_actors();
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].movie.title, "Forrest Gump");
  EXPECT_EQ(rows[0].actor_count, 2u);
  EXPECT_EQ(rows[1].movie.title, "Avengers: Endgame");
  EXPECT_EQ(rows[1].actor_count, 2u);
}

TEST_F(SeededCatalogTest, AverageActorAge) {
  auto average = catalog.average_actor_age();
  ASSERT_TRUE(average.has_value());
  EXPECT_DOUBLE_EQ(*average, 57.4);
}

TEST_F(SeededCatalogTest, MoviesByDecade) {
  auto decades = catalog.movies_by_decade();
  ASSERT_EQ(decades.size(), 3u);
  EXPECT_EQ(decades[0],
            (DecadeGroup{1990, "1990s", 3,
                         "Forrest Gump, Titanic, The Shawshank Redemption"}));
  EXPECT_EQ(decades[1],
            (DecadeGroup{2000, "2000s", 1, "The Devil Wears Prada"}));
  EXPECT_EQ(decades[2], (DecadeGroup{2010, "2010s", 1, "Avengers: Endgame"}));
}

TEST_F(SeededCatalogTest, ActorsInMultipleMovies) {
  auto rows = catalog.actors_in_multiple_movies();
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].actor.name, "Meryl Streep");
  EXPECT_EQ(rows[0].movie_count, 2u);
}

TEST_F(SeededCatalogTest, MostRecentMovie) {
  auto newest = catalog.most_recent_movie();
  ASSERT_TRUE(newest.has_value());
  EXPECT_EQ(newest->title, "Avengers: Endgame");
}

TEST_F(SeededCatalogTest, TablesAndDatabaseName) {
  EXPECT_EQ(catalog.tables(),
            (std::vector<std::string>{"Actors", "Movie_Actors", "Movies"}));
  EXPECT_EQ(catalog.database_name(), "MovieDB");
}

// ===========================================================================
// Mutations through the facade
// ===========================================================================

TEST_F(SeededCatalogTest, DeleteMovieCascades) {
  MovieId gump = movie_id(catalog, "Forrest Gump");
  ASSERT_NE(gump, 0);

  ASSERT_TRUE(catalog.delete_movie(gump));
  EXPECT_TRUE(catalog.cast_of("Forrest Gump").empty());
  EXPECT_TRUE(catalog.linked_actors(gump).empty());
  EXPECT_EQ(catalog.role_count(), 4u);
  EXPECT_EQ(catalog.get_movie(gump).error(), CatalogError::NotFound);

  // Tom Hanks lost his only role; Meryl keeps Prada
  EXPECT_TRUE(catalog.movies_of("Tom Hanks").empty());
  EXPECT_EQ(movie_titles(catalog.movies_of("Meryl Streep")),
            std::vector<std::string>{"The Devil Wears Prada"});
  EXPECT_TRUE(catalog.actors_in_multiple_movies().empty());
}

TEST_F(SeededCatalogTest, DeleteActorCascades) {
  ActorId rdj = actor_id(catalog, "Robert Downey Jr.");
  ASSERT_TRUE(catalog.delete_actor(rdj));

  EXPECT_EQ(actor_names(catalog.cast_of("Avengers: Endgame")),
            std::vector<std::string>{"Scarlett Johansson"});
  EXPECT_TRUE(catalog.linked_movies(rdj).empty());
  EXPECT_EQ(catalog.movies_with_multiple_actors().size(), 1u);
  EXPECT_DOUBLE_EQ(*catalog.average_actor_age(), 57.3); // 229 / 4 = 57.25
}

TEST_F(SeededCatalogTest, FailedMutationsChangeNothing) {
  auto casts = catalog.movie_casts();
  auto counts = catalog.movie_count_per_actor();

  EXPECT_EQ(catalog.link(1, 1).error(), CatalogError::Duplicate);
  EXPECT_EQ(catalog.link(1, 999).error(), CatalogError::NotFound);
  EXPECT_EQ(catalog.link(999, 1).error(), CatalogError::NotFound);
  EXPECT_EQ(catalog.delete_actor(999).error(), CatalogError::NotFound);
  EXPECT_EQ(catalog.delete_movie(999).error(), CatalogError::NotFound);
  EXPECT_EQ(catalog.insert_actor("").error(), CatalogError::Validation);

  EXPECT_EQ(catalog.movie_casts(), casts);
  EXPECT_EQ(catalog.movie_count_per_actor(), counts);
  EXPECT_EQ(catalog.role_count(), 6u);
}

TEST_F(SeededCatalogTest, NewLinkIsVisibleImmediately) {
  ActorId tom = actor_id(catalog, "Tom Hanks");
  MovieId shawshank = movie_id(catalog, "The Shawshank Redemption");
  ASSERT_TRUE(catalog.link(shawshank, tom));

  EXPECT_EQ(catalog.movie_casts().size(), 5u);
  auto multi = catalog.actors_in_multiple_movies();
  ASSERT_EQ(multi.size(), 2u);
  EXPECT_EQ(multi[0].actor.name, "Tom Hanks"); // ties keep insertion order
  EXPECT_EQ(multi[1].actor.name, "Meryl Streep");
}

TEST_F(SeededCatalogTest, UnlinkAllLeavesEntities) {
  MovieId endgame = movie_id(catalog, "Avengers: Endgame");
  EXPECT_EQ(catalog.unlink_all(endgame, std::nullopt), 2u);
  EXPECT_TRUE(catalog.cast_of("Avengers: Endgame").empty());
  EXPECT_TRUE(catalog.get_movie(endgame).has_value());
  EXPECT_EQ(catalog.list_actors().size(), 5u);
}

TEST(CatalogOptionsTest, CustomNameAndSeparator) {
  Catalog catalog(CatalogOptions{.name = "Archive", .list_separator = "; "});
  ASSERT_TRUE(seed_sample_catalog(catalog));

  EXPECT_EQ(catalog.database_name(), "Archive");
  EXPECT_EQ(catalog.movie_casts().front().cast, "Tom Hanks; Meryl Streep");
}

TEST(CatalogSeedTest, SeedOnTopOfExistingRecords) {
  Catalog catalog;
  ASSERT_TRUE(catalog.insert_actor("Extra", 20));
  ASSERT_TRUE(seed_sample_catalog(catalog));

  EXPECT_EQ(catalog.list_actors().size(), 6u);
  EXPECT_EQ(catalog.role_count(), 6u);
  EXPECT_EQ(actor_names(catalog.cast_of("Forrest Gump")),
            (std::vector<std::string>{"Tom Hanks", "Meryl Streep"}));
}

// ===========================================================================
// Concurrency: 4 readers + 1 writer under the single catalog lock
// ===========================================================================

TEST(CatalogConcurrency, ReadersSeeConsistentCounts) {
  Catalog catalog;
  ASSERT_TRUE(seed_sample_catalog(catalog));

  constexpr int NUM_READERS = 4;
  constexpr int ITERATIONS = 200;
  std::atomic<bool> stop{false};
  std::atomic<int> inconsistent{0};
  std::vector<std::thread> threads;

  for (int r = 0; r < NUM_READERS; ++r) {
    threads.emplace_back([&] {
      while (!stop.load(std::memory_order_acquire)) {
        // One snapshot sees the 6 seed roles plus at most the writer's one
        size_t roles = 0;
        for (const auto &row : catalog.movie_count_per_actor())
          roles += row.movie_count;
        if (roles != 6 && roles != 7)
          inconsistent.fetch_add(1);

        for (const auto &cast : catalog.movie_casts()) {
          if (cast.cast.empty())
            inconsistent.fetch_add(1);
        }
      }
    });
  }

  std::thread writer([&] {
    for (int i = 0; i < ITERATIONS; ++i) {
      auto movie = catalog.insert_movie("Churn " + std::to_string(i), 2000);
      auto actor = catalog.insert_actor("Extra " + std::to_string(i), 30);
      if (movie && actor) {
        (void)catalog.link(*movie, *actor);
        (void)catalog.delete_actor(*actor);
        (void)catalog.delete_movie(*movie);
      }
    }
    stop.store(true, std::memory_order_release);
  });

  writer.join();
  for (auto &t : threads)
    t.join();

  EXPECT_EQ(inconsistent.load(), 0);
  EXPECT_EQ(catalog.role_count(), 6u);
  EXPECT_EQ(catalog.list_movies().size(), 5u);
}
