// Ticket: 0005_separation_cache

#include <benchmark/benchmark.h>
#include <Eigen/Geometry>
#include <chrono>
#include <cmath>
#include <optional>
#include <random>
#include <string>

#include "sepax-sim/src/Physics/Collision/PolygonMesh.hpp"
#include "sepax-sim/src/Physics/Collision/SeparatingAxis.hpp"
#include "sepax-sim/src/Physics/Collision/SeparationCache.hpp"
#include "sepax-sim/src/Physics/PhysicsEngine.hpp"

using namespace sepax_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

PolygonMesh unitCube()
{
  return PolygonMesh::createCuboid(Point{0.0, 0.0, 0.0},
                                   Direction{1.0, 0.0, 0.0},
                                   Direction{0.0, 1.0, 0.0},
                                   1.0);
}

// Rigid transform with a random rotation and the given translation
Eigen::Matrix4d randomPlacement(std::mt19937& rng, const Eigen::Vector3d& offset)
{
  std::uniform_real_distribution<double> angle{-M_PI, M_PI};
  std::uniform_real_distribution<double> component{-1.0, 1.0};

  Eigen::Vector3d axis{component(rng), component(rng), component(rng)};
  if (axis.isZero())
  {
    axis = Eigen::Vector3d::UnitZ();
  }

  Eigen::Matrix4d transform = Eigen::Matrix4d::Identity();
  transform.topLeftCorner<3, 3>() =
    Eigen::AngleAxisd{angle(rng), axis.normalized()}.toRotationMatrix();
  transform.topRightCorner<3, 1>() = offset;
  return transform;
}

}  // namespace

// ============================================================================
// Axis Search Benchmarks
// ============================================================================

/**
 * @brief Full SAT search between two disjoint, randomly rotated cubes
 *
 * @ticket 0004_sat_axis_search
 */
static void BM_SAT_FullSearch(benchmark::State& state)
{
  std::mt19937 rng{42};  // Fixed seed for deterministic benchmarks
  auto cube = unitCube();
  Eigen::Matrix4d const transformA =
    randomPlacement(rng, Eigen::Vector3d::Zero());
  Eigen::Matrix4d const transformB =
    randomPlacement(rng, Eigen::Vector3d{1.8, 0.3, 0.0});

  for (auto _ : state)
  {
    auto axis = findSeparatingAxis(cube, transformA, cube, transformB);
    benchmark::DoNotOptimize(axis);
  }
}
BENCHMARK(BM_SAT_FullSearch);

/**
 * @brief Cached-axis refresh when the pair stays separated
 *
 * Compares against BM_SAT_FullSearch: the fast path re-tests one axis.
 *
 * @ticket 0005_separation_cache
 */
static void BM_SAT_CachedRefresh(benchmark::State& state)
{
  std::mt19937 rng{42};
  auto cube = unitCube();
  Eigen::Matrix4d const transformA =
    randomPlacement(rng, Eigen::Vector3d::Zero());
  Eigen::Matrix4d const transformB =
    randomPlacement(rng, Eigen::Vector3d{1.8, 0.3, 0.0});

  SeparatingAxisSolver const solver{cube, transformA, cube, transformB};
  SeparationCache cache;
  auto axis = solver.findSeparatingAxis();
  if (!axis)
  {
    state.SkipWithError("Benchmark placement is not separated");
    return;
  }
  cache.insert(0, 1, *axis);

  for (auto _ : state)
  {
    const Separation& separation = cache.refresh(0, 1, solver);
    benchmark::DoNotOptimize(separation);
  }
}
BENCHMARK(BM_SAT_CachedRefresh);

// ============================================================================
// Engine Benchmarks
// ============================================================================

/**
 * @brief One simulated second of N cubes falling onto a ground rectangle
 *
 * @ticket 0008_physics_engine
 */
static void BM_Engine_FallingCubes(benchmark::State& state)
{
  auto const cubeCount = static_cast<int>(state.range(0));

  for (auto _ : state)
  {
    state.PauseTiming();
    PhysicsEngine engine;
    KineticState groundState;
    groundState.position = Point{0.0, -2.0, 0.0};
    engine.addStaticObject(
      "ground",
      PhysicsObject{PolygonMesh::createRectangle(Point{0.0, 0.0, 0.0},
                                                 Direction{0.0, 0.0, 40.0},
                                                 Direction{40.0, 0.0, 0.0}),
                    groundState});
    for (int i = 0; i < cubeCount; ++i)
    {
      KineticState cubeState;
      cubeState.mass = Mass::finite(1.0);
      cubeState.position = Point{2.0 * i - cubeCount, 2.0, 0.0};
      engine.addDynamicObject("cube" + std::to_string(i),
                              PhysicsObject{unitCube(), cubeState});
    }
    state.ResumeTiming();

    engine.run(std::chrono::milliseconds{1000});
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_Engine_FallingCubes)
  ->Arg(1)
  ->Arg(4)
  ->Arg(16)
  ->Unit(benchmark::kMillisecond)
  ->Complexity();

BENCHMARK_MAIN();
