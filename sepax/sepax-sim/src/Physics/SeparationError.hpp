// Ticket: 0008_physics_engine

#ifndef SEPAX_SIM_PHYSICS_SEPARATION_ERROR_HPP
#define SEPAX_SIM_PHYSICS_SEPARATION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace sepax_sim
{

/**
 * @brief Thrown when an object is registered overlapping an existing one
 *
 * No separating axis exists between the two named objects, so no cache entry
 * can be created for the pair.
 */
class SeparationError : public std::runtime_error
{
public:
  SeparationError(const std::string& first, const std::string& second)
    : std::runtime_error{"No separating axis between '" + first + "' and '" +
                         second + "'"},
      first_{first},
      second_{second}
  {
  }

  [[nodiscard]] const std::string& getFirstName() const
  {
    return first_;
  }

  [[nodiscard]] const std::string& getSecondName() const
  {
    return second_;
  }

private:
  std::string first_;
  std::string second_;
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_PHYSICS_SEPARATION_ERROR_HPP
