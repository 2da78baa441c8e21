// Ticket: 0009_headless_demo

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>

#include "sepax-sim/src/Physics/Collision/PolygonMesh.hpp"
#include "sepax-sim/src/Physics/PhysicsEngine.hpp"
#include "sepax-sim/src/Physics/RigidBody/KineticState.hpp"
#include "sepax-sim/src/Physics/RigidBody/Mass.hpp"
#include "sepax-sim/src/Physics/RigidBody/PhysicsObject.hpp"

using namespace sepax_sim;

namespace
{

// Frame delta handed to the engine each tick
constexpr std::chrono::milliseconds kFrameTime{16};
constexpr int kFrameCount{120};

PhysicsObject makeGround()
{
  KineticState state;
  state.position = Point{0.0, -2.0, 0.0};
  return PhysicsObject{PolygonMesh::createRectangle(Point{0.0, 0.0, 0.0},
                                                    Direction{0.0, 0.0, 10.0},
                                                    Direction{10.0, 0.0, 0.0}),
                       state};
}

PhysicsObject makeCrate()
{
  KineticState state;
  state.mass = Mass::finite(1.0);
  state.position = Point{0.0, 2.0, 0.0};
  return PhysicsObject{PolygonMesh::createCuboid(Point{0.0, 0.0, 0.0},
                                                 Direction{1.0, 0.0, 0.0},
                                                 Direction{0.0, 1.0, 0.0},
                                                 1.0),
                       state};
}

}  // namespace

int main()
{
  spdlog::set_level(spdlog::level::info);
  // SPDLOG_LEVEL=debug overrides the default
  spdlog::cfg::load_env_levels();

  try
  {
    PhysicsEngine engine;
    engine.addStaticObject("ground", makeGround());
    engine.addDynamicObject("crate", makeCrate());

    for (int frame = 0; frame < kFrameCount; ++frame)
    {
      engine.run(kFrameTime);

      const PhysicsObject* crate = engine.getDynamicObject("crate");
      const KineticState& state = crate->getKineticState();
      spdlog::info("t = {:5d} ms  crate y = {:+.4f} m  vy = {:+.4f} m/s",
                   engine.getSimulationTime().count(),
                   state.position.y(),
                   state.velocity.y());
    }
  }
  catch (const std::exception& e)
  {
    spdlog::critical("Simulation failed: {}", e.what());
    return 1;
  }

  return 0;
}
