// Ticket: 0001_geometry_kernel

#ifndef SEPAX_SIM_GEOMETRY_DIRECTION_HPP
#define SEPAX_SIM_GEOMETRY_DIRECTION_HPP

#include <Eigen/Dense>

#include "sepax-sim/src/Geometry/Vec3DBase.hpp"

namespace sepax_sim
{

/**
 * @brief Free vector in 3D space (normals, edge directions, velocities)
 *
 * A Direction never carries position semantics: transforming it applies only
 * the rotational part of a homogeneous matrix (w = 0), so translations leave
 * it unchanged. Use Point for positions.
 *
 * @ticket 0001_geometry_kernel
 */
struct Direction final : detail::Vec3DBase<Direction>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  static constexpr double kHomogeneousW = 0.0;

  Direction() = default;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Direction(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  /**
   * @brief Direction from one location to another (end - start)
   */
  template <typename StartDerived, typename EndDerived>
  static Direction between(const Eigen::MatrixBase<StartDerived>& start,
                           const Eigen::MatrixBase<EndDerived>& end)
  {
    return Direction{end - start};
  }

  /**
   * @brief Unit-length copy of this direction
   *
   * A zero direction normalizes to zero (Eigen semantics); callers that build
   * planes from cross products check isZero() first.
   */
  [[nodiscard]] Direction normalized() const
  {
    return Direction{Eigen::Vector3d::normalized()};
  }

  [[nodiscard]] Direction cross(const Direction& other) const
  {
    return Direction{Eigen::Vector3d::cross(other)};
  }

  [[nodiscard]] Direction opposite() const
  {
    return Direction{-static_cast<const Eigen::Vector3d&>(*this)};
  }

  /**
   * @brief Check whether the direction is degenerate
   * @param tolerance Length at or below which the direction counts as zero
   *        (default: exact zero)
   */
  [[nodiscard]] bool isZero(double tolerance = 0.0) const
  {
    return squaredNorm() <= tolerance * tolerance;
  }

  // Rule of Five
  Direction(const Direction&) = default;
  Direction(Direction&&) noexcept = default;
  Direction& operator=(const Direction&) = default;
  Direction& operator=(Direction&&) noexcept = default;
  ~Direction() = default;
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_GEOMETRY_DIRECTION_HPP
