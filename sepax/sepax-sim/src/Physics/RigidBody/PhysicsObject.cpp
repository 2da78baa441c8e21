// Ticket: 0006_rigid_body_state

#include "sepax-sim/src/Physics/RigidBody/PhysicsObject.hpp"

#include <stdexcept>
#include <utility>
#include <variant>

namespace sepax_sim
{

PhysicsObject::PhysicsObject(PolygonMesh mesh, KineticState state)
  : mesh_{std::move(mesh)}, state_{std::move(state)}
{
}

Eigen::Matrix4d PhysicsObject::getWorldTransform() const
{
  return state_.getWorldTransform();
}

void PhysicsObject::addBodyForce(const BodyForce& force)
{
  Direction const& value = std::visit(
    [](const auto& input) -> const Direction& { return input.value; }, force);
  if (!value.allFinite())
  {
    throw std::invalid_argument("Body force must be finite");
  }
  bodyForces_.push_back(force);
}

void PhysicsObject::clearBodyForces()
{
  bodyForces_.clear();
}

Direction PhysicsObject::computeBodyForceAcceleration() const
{
  Direction netForce{0.0, 0.0, 0.0};
  Direction netAcceleration{0.0, 0.0, 0.0};
  for (const auto& force : bodyForces_)
  {
    if (const auto* constantForce = std::get_if<ConstantForce>(&force))
    {
      netForce += constantForce->value;
    }
    else
    {
      netAcceleration += std::get<ConstantAcceleration>(force).value;
    }
  }

  if (!state_.mass.isInfinite())
  {
    netAcceleration += netForce / state_.mass.getValue();
  }
  return netAcceleration;
}

}  // namespace sepax_sim
