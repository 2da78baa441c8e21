// Ticket: 0009_body_forces

#ifndef SEPAX_SIM_PHYSICS_BODY_FORCE_HPP
#define SEPAX_SIM_PHYSICS_BODY_FORCE_HPP

#include <variant>

#include "sepax-sim/src/Geometry/Direction.hpp"

namespace sepax_sim
{

/**
 * @brief Constant force acting on a single body [N]
 *
 * Contributes value / mass to the body's acceleration; nothing for an
 * infinite mass.
 */
struct ConstantForce
{
  Direction value;
};

/**
 * @brief Constant acceleration imposed on a single body regardless of its
 * mass [m/s²]
 */
struct ConstantAcceleration
{
  Direction value;
};

/**
 * @brief Force input applied to one body every tick on top of gravity
 *
 * @ticket 0009_body_forces
 */
using BodyForce = std::variant<ConstantForce, ConstantAcceleration>;

}  // namespace sepax_sim

#endif  // SEPAX_SIM_PHYSICS_BODY_FORCE_HPP
