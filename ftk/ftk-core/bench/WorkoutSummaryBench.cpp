#include <benchmark/benchmark.h>

#include <array>
#include <string_view>

#include "ftk-core/src/Dispatch/WorkoutDispatcher.hpp"
#include "ftk-core/src/Summary/SummaryFormatter.hpp"
#include "ftk-core/src/Workout/Running.hpp"

using namespace ftk_core;

// ============================================================================
// Dispatch Benchmarks
// ============================================================================

/**
 * @brief Benchmark code lookup + construction of each workout kind
 */
static void BM_ResolveWorkout(benchmark::State& state)
{
  const std::array<double, 5> swimming{720, 1, 80, 25, 40};
  const std::array<double, 3> running{15000, 1, 75};
  const std::array<double, 4> walking{9000, 1, 75, 180};

  for (auto _ : state)
  {
    auto a = workout_dispatcher::resolveWorkout("SWM", swimming);
    auto b = workout_dispatcher::resolveWorkout("RUN", running);
    auto c = workout_dispatcher::resolveWorkout("WLK", walking);
    benchmark::DoNotOptimize(a);
    benchmark::DoNotOptimize(b);
    benchmark::DoNotOptimize(c);
  }
}
BENCHMARK(BM_ResolveWorkout);

// ============================================================================
// Summary Benchmarks
// ============================================================================

static void BM_BuildSummary(benchmark::State& state)
{
  const Running running{15000, 1, 75};
  for (auto _ : state)
  {
    auto summary = running.buildSummary();
    benchmark::DoNotOptimize(summary);
  }
}
BENCHMARK(BM_BuildSummary);

/**
 * @brief Benchmark the full package pipeline: dispatch, summary, message
 */
static void BM_ResolveAndRender(benchmark::State& state)
{
  const std::array<double, 4> walking{9000, 1, 75, 180};
  for (auto _ : state)
  {
    auto workout = workout_dispatcher::resolveWorkout("WLK", walking);
    auto message = renderMessage(workout->buildSummary());
    benchmark::DoNotOptimize(message);
  }
}
BENCHMARK(BM_ResolveAndRender);

BENCHMARK_MAIN();
