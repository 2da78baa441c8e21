// Ticket: 0006_rigid_body_state

#ifndef SEPAX_SIM_PHYSICS_MASS_HPP
#define SEPAX_SIM_PHYSICS_MASS_HPP

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace sepax_sim
{

/**
 * @brief Mass class of a rigid body: infinite (immovable) or a finite value
 *
 * @ticket 0006_rigid_body_state
 */
class Mass
{
public:
  /**
   * @brief Immovable body
   */
  static Mass infinite()
  {
    return Mass{};
  }

  /**
   * @brief Finite mass
   * @param kilograms Mass [kg]
   * @throws std::invalid_argument if the mass is not a positive finite value
   */
  static Mass finite(double kilograms)
  {
    if (!(kilograms > 0.0) || !std::isfinite(kilograms))
    {
      throw std::invalid_argument("Mass must be positive and finite, got: " +
                                  std::to_string(kilograms));
    }
    return Mass{kilograms};
  }

  [[nodiscard]] bool isInfinite() const
  {
    return infinite_;
  }

  /**
   * @brief Mass in kilograms; +infinity for an infinite mass [kg]
   */
  [[nodiscard]] double getValue() const
  {
    return infinite_ ? std::numeric_limits<double>::infinity() : kilograms_;
  }

  bool operator==(const Mass&) const = default;

private:
  Mass() = default;

  explicit Mass(double kilograms) : kilograms_{kilograms}, infinite_{false}
  {
  }

  double kilograms_{0.0};
  bool infinite_{true};
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_PHYSICS_MASS_HPP
