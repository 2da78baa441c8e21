// Ticket: 0006_rigid_body_state

#include "sepax-sim/src/Physics/RigidBody/KineticState.hpp"

namespace sepax_sim
{

Eigen::Matrix4d KineticState::getWorldTransform() const
{
  Eigen::Matrix4d transform = Eigen::Matrix4d::Identity();
  transform.topLeftCorner<3, 3>() = orientation;
  transform.topRightCorner<3, 1>() = position;
  return transform;
}

}  // namespace sepax_sim
