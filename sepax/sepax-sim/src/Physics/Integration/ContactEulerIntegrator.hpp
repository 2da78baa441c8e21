// Ticket: 0007_contact_integration

#ifndef SEPAX_SIM_PHYSICS_CONTACT_EULER_INTEGRATOR_HPP
#define SEPAX_SIM_PHYSICS_CONTACT_EULER_INTEGRATOR_HPP

#include <vector>

#include "sepax-sim/src/Physics/Integration/Integrator.hpp"

namespace sepax_sim
{

/**
 * @brief Constant-acceleration Euler step with contact rejection
 *
 * Before integrating, every velocity and acceleration component that points
 * into a contact normal is removed:
 *
 *   v ← v - max(0, v·n) n
 *
 * The velocity rejection is written back to the state. The acceleration
 * rejection only affects this step, so the stored acceleration (gravity)
 * resumes once the contact is gone.
 *
 * Then, with a the rejected acceleration:
 * - x ← x + v·dt + ½a·dt²
 * - v ← v + a·dt
 * - R ← rot(ω·dt + ½α·dt²) · R
 * - ω ← ω + α·dt
 *
 * @ticket 0007_contact_integration
 */
class ContactEulerIntegrator : public Integrator
{
public:
  ContactEulerIntegrator() = default;
  ~ContactEulerIntegrator() override = default;

  void step(KineticState& state,
            const std::vector<Direction>& contactNormals,
            double dt) override;

  /**
   * @brief Remove the component of @p vector that points into @p normal
   */
  static Direction rejectInto(const Direction& vector, const Direction& normal);

  ContactEulerIntegrator(const ContactEulerIntegrator&) = default;
  ContactEulerIntegrator& operator=(const ContactEulerIntegrator&) = default;
  ContactEulerIntegrator(ContactEulerIntegrator&&) noexcept = default;
  ContactEulerIntegrator& operator=(ContactEulerIntegrator&&) noexcept = default;
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_PHYSICS_CONTACT_EULER_INTEGRATOR_HPP
