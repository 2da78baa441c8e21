// Ticket: 0008_physics_engine

#ifndef SEPAX_SIM_PHYSICS_PHYSICS_CONFIG_HPP
#define SEPAX_SIM_PHYSICS_PHYSICS_CONFIG_HPP

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "sepax-sim/src/Geometry/Direction.hpp"
#include "sepax-sim/src/Physics/Collision/PlaneClassifier.hpp"

namespace sepax_sim
{

/**
 * @brief Tunable parameters of the physics engine
 *
 * @ticket 0008_physics_engine
 */
struct PhysicsConfig
{
  Direction gravity{0.0, -10.0, 0.0};   ///< Seeded into new dynamic objects [m/s²]
  size_t maxResolutionIterations{128};  ///< Penetration passes per object per tick
  double contactTolerance{1e-6};        ///< Gap at or below which a face counts as touching [m]
  double planeTolerance{kDefaultPlaneTolerance};  ///< Vertex-on-plane tolerance [m]

  /**
   * @brief Check the parameters for consistency
   * @throws std::invalid_argument naming the offending field
   */
  void validate() const
  {
    if (!gravity.allFinite())
    {
      throw std::invalid_argument("PhysicsConfig: gravity must be finite");
    }
    if (maxResolutionIterations == 0)
    {
      throw std::invalid_argument(
        "PhysicsConfig: maxResolutionIterations must be at least 1");
    }
    if (!(contactTolerance >= 0.0) || !std::isfinite(contactTolerance))
    {
      throw std::invalid_argument(
        "PhysicsConfig: contactTolerance must be non-negative, got: " +
        std::to_string(contactTolerance));
    }
    if (!(planeTolerance >= 0.0) || !std::isfinite(planeTolerance))
    {
      throw std::invalid_argument(
        "PhysicsConfig: planeTolerance must be non-negative, got: " +
        std::to_string(planeTolerance));
    }
  }
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_PHYSICS_PHYSICS_CONFIG_HPP
