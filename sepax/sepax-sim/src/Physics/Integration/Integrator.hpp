// Ticket: 0007_contact_integration

#ifndef SEPAX_SIM_PHYSICS_INTEGRATOR_HPP
#define SEPAX_SIM_PHYSICS_INTEGRATOR_HPP

#include <vector>

#include "sepax-sim/src/Geometry/Direction.hpp"
#include "sepax-sim/src/Physics/RigidBody/KineticState.hpp"

namespace sepax_sim
{

/**
 * @brief Abstract interface for advancing a kinetic state by one timestep
 *
 * Contact normals are unit directions pointing from the integrated body into
 * the obstacles it currently touches. Implementations must not let the body
 * move further into any of them during the step.
 *
 * Thread safety: Implementations should be stateless and thread-safe
 *
 * @ticket 0007_contact_integration
 */
class Integrator
{
public:
  virtual ~Integrator() = default;

  /**
   * @brief Integrate state forward by one timestep
   * @param state Current kinetic state (modified in place)
   * @param contactNormals Unit normals into touching obstacles
   * @param dt Timestep [s]
   */
  virtual void step(KineticState& state,
                    const std::vector<Direction>& contactNormals,
                    double dt) = 0;

protected:
  Integrator() = default;
  Integrator(const Integrator&) = default;
  Integrator& operator=(const Integrator&) = default;
  Integrator(Integrator&&) noexcept = default;
  Integrator& operator=(Integrator&&) noexcept = default;
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_PHYSICS_INTEGRATOR_HPP
