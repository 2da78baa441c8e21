// Ticket: 0007_contact_integration

#include "sepax-sim/src/Physics/Integration/ContactEulerIntegrator.hpp"

#include <Eigen/Geometry>

namespace sepax_sim
{

Direction ContactEulerIntegrator::rejectInto(const Direction& vector,
                                             const Direction& normal)
{
  double const into = vector.dot(normal);
  if (into <= 0.0)
  {
    return vector;
  }
  return Direction{vector - normal * into};
}

void ContactEulerIntegrator::step(KineticState& state,
                                  const std::vector<Direction>& contactNormals,
                                  double dt)
{
  // ===== Contact Rejection =====

  Direction acceleration = state.acceleration;
  for (const auto& normal : contactNormals)
  {
    state.velocity = rejectInto(state.velocity, normal);
    acceleration = rejectInto(acceleration, normal);
  }

  // ===== Linear Integration =====

  state.position = state.position.displace(
    Direction{state.velocity * dt + acceleration * (0.5 * dt * dt)});
  state.velocity += acceleration * dt;

  // ===== Angular Integration =====

  Eigen::Vector3d const rotation = state.angularVelocity * dt +
                                   state.angularAcceleration * (0.5 * dt * dt);
  double const angle = rotation.norm();
  if (angle > 0.0)
  {
    state.orientation =
      Eigen::AngleAxisd{angle, rotation / angle}.toRotationMatrix() *
      state.orientation;
  }
  state.angularVelocity += state.angularAcceleration * dt;
}

}  // namespace sepax_sim
