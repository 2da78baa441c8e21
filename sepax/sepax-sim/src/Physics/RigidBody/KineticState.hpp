// Ticket: 0006_rigid_body_state

#ifndef SEPAX_SIM_PHYSICS_KINETIC_STATE_HPP
#define SEPAX_SIM_PHYSICS_KINETIC_STATE_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "sepax-sim/src/Geometry/Direction.hpp"
#include "sepax-sim/src/Geometry/Point.hpp"
#include "sepax-sim/src/Physics/RigidBody/Mass.hpp"

namespace sepax_sim
{

/**
 * @brief Linear and angular kinematic state of a rigid body
 *
 * Orientation is a 3x3 rotation matrix; angular quantities are axis-angle
 * vectors in the world frame.
 *
 * @ticket 0006_rigid_body_state
 */
struct KineticState
{
  Mass mass{Mass::infinite()};

  // Linear components
  Point position;
  Direction velocity;      // [m/s]
  Direction acceleration;  // [m/s²]

  // Angular components
  Eigen::Matrix3d orientation{Eigen::Matrix3d::Identity()};
  Direction angularVelocity;      // [rad/s]
  Direction angularAcceleration;  // [rad/s²]

  /**
   * @brief World transform translate(position) * orientation
   */
  [[nodiscard]] Eigen::Matrix4d getWorldTransform() const;
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_PHYSICS_KINETIC_STATE_HPP
