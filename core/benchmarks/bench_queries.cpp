// ===========================================================================
// Catalog query throughput on a synthetic catalog
// ---------------------------------------------------------------------------
// Claims under test:
//   - cast_of() / movies_of() scale with the number of same-named entities,
//     not with the catalog size
//   - aggregate queries (counts, casts, decades) are linear in actors + roles
//   - cascade delete cost is proportional to the entity's own roles
//
// Methodology:
//   - state.range(0) actors, the same number of movies, ROLES_PER_MOVIE
//     links per movie drawn from a fixed-seed RNG
//   - 5 repetitions, aggregates only
// ===========================================================================

#include "reel/catalog.hpp"
#include <benchmark/benchmark.h>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace {

constexpr size_t ROLES_PER_MOVIE = 4;
constexpr uint32_t RNG_SEED = 42;

} // namespace

// ===========================================================================
// Fixture: catalog with N actors, N movies and ~4N roles
// ===========================================================================
class CatalogFixture : public benchmark::Fixture {
public:
  std::unique_ptr<reel::Catalog> catalog;
  std::vector<reel::ActorId> actor_ids;
  std::vector<reel::MovieId> movie_ids;

  void SetUp(benchmark::State &state) override {
    const auto n = static_cast<size_t>(state.range(0));
    // Rejected duplicate links would otherwise log a warning each
    catalog = std::make_unique<reel::Catalog>(
        reel::CatalogOptions{.log_level = spdlog::level::off});
    actor_ids.clear();
    movie_ids.clear();
    actor_ids.reserve(n);
    movie_ids.reserve(n);

    std::mt19937 rng(RNG_SEED);
    std::uniform_int_distribution<int> age(18, 90);
    std::uniform_int_distribution<int> year(1920, 2024);
    std::uniform_int_distribution<size_t> pick(0, n - 1);

    for (size_t i = 0; i < n; ++i) {
      actor_ids.push_back(
          *catalog->insert_actor("actor_" + std::to_string(i), age(rng)));
      movie_ids.push_back(
          *catalog->insert_movie("movie_" + std::to_string(i), year(rng)));
    }

    // Duplicate links are rejected and simply skipped
    for (auto movie : movie_ids)
      for (size_t r = 0; r < ROLES_PER_MOVIE; ++r)
        (void)catalog->link(movie, actor_ids[pick(rng)]);
  }

  void TearDown(benchmark::State &) override { catalog.reset(); }
};

// ---------------------------------------------------------------------------
// BM_CastOf: Title join, rotating over every movie
// ---------------------------------------------------------------------------
BENCHMARK_DEFINE_F(CatalogFixture, BM_CastOf)(benchmark::State &state) {
  size_t idx = 0;
  for (auto _ : state) {
    auto cast = catalog->cast_of("movie_" + std::to_string(idx));
    benchmark::DoNotOptimize(cast);
    idx = (idx + 1) % movie_ids.size();
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK_REGISTER_F(CatalogFixture, BM_CastOf)
    ->Arg(1'000)
    ->Arg(10'000)
    ->Unit(benchmark::kMicrosecond)
    ->Repetitions(5)
    ->ReportAggregatesOnly(true);

// ---------------------------------------------------------------------------
// BM_MovieCountPerActor: Full count + stable sort
// ---------------------------------------------------------------------------
BENCHMARK_DEFINE_F(CatalogFixture, BM_MovieCountPerActor)
(benchmark::State &state) {
  for (auto _ : state) {
    auto counts = catalog->movie_count_per_actor();
    benchmark::DoNotOptimize(counts);
  }
  state.counters["Roles"] = static_cast<double>(catalog->role_count());
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK_REGISTER_F(CatalogFixture, BM_MovieCountPerActor)
    ->Arg(1'000)
    ->Arg(10'000)
    ->Unit(benchmark::kMicrosecond)
    ->Repetitions(5)
    ->ReportAggregatesOnly(true);

// ---------------------------------------------------------------------------
// BM_MovieCasts: Joined cast strings for every movie
// ---------------------------------------------------------------------------
BENCHMARK_DEFINE_F(CatalogFixture, BM_MovieCasts)(benchmark::State &state) {
  for (auto _ : state) {
    auto casts = catalog->movie_casts();
    benchmark::DoNotOptimize(casts);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK_REGISTER_F(CatalogFixture, BM_MovieCasts)
    ->Arg(1'000)
    ->Arg(10'000)
    ->Unit(benchmark::kMicrosecond)
    ->Repetitions(5)
    ->ReportAggregatesOnly(true);

// ---------------------------------------------------------------------------
// BM_MoviesByDecade: Bucketing + title joins
// ---------------------------------------------------------------------------
BENCHMARK_DEFINE_F(CatalogFixture, BM_MoviesByDecade)
(benchmark::State &state) {
  for (auto _ : state) {
    auto decades = catalog->movies_by_decade();
    benchmark::DoNotOptimize(decades);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK_REGISTER_F(CatalogFixture, BM_MoviesByDecade)
    ->Arg(1'000)
    ->Arg(10'000)
    ->Unit(benchmark::kMicrosecond)
    ->Repetitions(5)
    ->ReportAggregatesOnly(true);

// ---------------------------------------------------------------------------
// BM_DeleteActorCascade: Delete + reinsert + relink one actor per iteration
// ---------------------------------------------------------------------------
BENCHMARK_DEFINE_F(CatalogFixture, BM_DeleteActorCascade)
(benchmark::State &state) {
  size_t idx = 0;
  for (auto _ : state) {
    auto victim = actor_ids[idx];
    auto movies = catalog->linked_movies(victim);
    auto deleted = catalog->delete_actor(victim);
    benchmark::DoNotOptimize(deleted);

    state.PauseTiming();
    auto replacement = *catalog->insert_actor("actor_" + std::to_string(idx));
    for (auto movie : movies)
      (void)catalog->link(movie, replacement);
    actor_ids[idx] = replacement;
    state.ResumeTiming();

    idx = (idx + 1) % actor_ids.size();
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK_REGISTER_F(CatalogFixture, BM_DeleteActorCascade)
    ->Arg(1'000)
    ->Arg(10'000)
    ->Unit(benchmark::kMicrosecond)
    ->Repetitions(5)
    ->ReportAggregatesOnly(true);

BENCHMARK_MAIN();
