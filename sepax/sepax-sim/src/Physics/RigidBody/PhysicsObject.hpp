// Ticket: 0006_rigid_body_state

#ifndef SEPAX_SIM_PHYSICS_PHYSICS_OBJECT_HPP
#define SEPAX_SIM_PHYSICS_PHYSICS_OBJECT_HPP

#include <Eigen/Dense>
#include <vector>

#include "sepax-sim/src/Geometry/Direction.hpp"
#include "sepax-sim/src/Physics/Collision/PolygonMesh.hpp"
#include "sepax-sim/src/Physics/RigidBody/BodyForce.hpp"
#include "sepax-sim/src/Physics/RigidBody/KineticState.hpp"

namespace sepax_sim
{

/**
 * @brief Collision mesh plus kinetic state of a simulated body
 *
 * The mesh is fixed in the object's local frame. The world placement comes
 * from the kinetic state, so moving or rotating the object never rebuilds the
 * mesh.
 *
 * An object is marked stuck when the engine could not resolve its
 * penetrations within one tick's iteration budget. The flag stays set until
 * clearStuck() is called.
 *
 * Body forces persist across ticks until cleared. The engine adds their net
 * acceleration to the stored acceleration for each step without writing it
 * back, so the stored acceleration stays equal to gravity.
 *
 * @ticket 0006_rigid_body_state
 */
class PhysicsObject
{
public:
  PhysicsObject(PolygonMesh mesh, KineticState state);

  [[nodiscard]] const PolygonMesh& getMesh() const
  {
    return mesh_;
  }

  [[nodiscard]] const KineticState& getKineticState() const
  {
    return state_;
  }

  KineticState& getKineticState()
  {
    return state_;
  }

  /**
   * @brief Local-to-world transform derived from the kinetic state
   */
  [[nodiscard]] Eigen::Matrix4d getWorldTransform() const;

  [[nodiscard]] bool isStuck() const
  {
    return stuck_;
  }

  void markStuck()
  {
    stuck_ = true;
  }

  void clearStuck()
  {
    stuck_ = false;
  }

  void addBodyForce(const BodyForce& force);

  void clearBodyForces();

  [[nodiscard]] const std::vector<BodyForce>& getBodyForces() const
  {
    return bodyForces_;
  }

  /**
   * @brief Net acceleration from the body forces [m/s²]
   *
   * a = Σ F_i / m + Σ a_j. Constant forces contribute nothing to a body of
   * infinite mass.
   */
  [[nodiscard]] Direction computeBodyForceAcceleration() const;

  PhysicsObject(const PhysicsObject&) = default;
  PhysicsObject(PhysicsObject&&) noexcept = default;
  PhysicsObject& operator=(const PhysicsObject&) = default;
  PhysicsObject& operator=(PhysicsObject&&) noexcept = default;
  ~PhysicsObject() = default;

private:
  PolygonMesh mesh_;
  KineticState state_;
  std::vector<BodyForce> bodyForces_;
  bool stuck_{false};
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_PHYSICS_PHYSICS_OBJECT_HPP
