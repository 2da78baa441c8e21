// Ticket: 0001_geometry_kernel

#ifndef SEPAX_SIM_GEOMETRY_POINT_HPP
#define SEPAX_SIM_GEOMETRY_POINT_HPP

#include <Eigen/Dense>
#include <vector>

#include "sepax-sim/src/Geometry/Direction.hpp"
#include "sepax-sim/src/Geometry/Vec3DBase.hpp"

namespace sepax_sim
{

/**
 * @brief Position in 3D space
 *
 * Transforms as a homogeneous point (w = 1), so translations apply. Moving a
 * point by a free vector goes through displace().
 *
 * @ticket 0001_geometry_kernel
 */
struct Point final : detail::Vec3DBase<Point>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  static constexpr double kHomogeneousW = 1.0;

  Point() = default;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Point(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  [[nodiscard]] Point displace(const Direction& displacement) const;

  /**
   * @brief Arithmetic mean of a set of points
   * @return The centroid, or the origin for an empty set
   */
  static Point averageOf(const std::vector<Point>& points);

  // Rule of Five
  Point(const Point&) = default;
  Point(Point&&) noexcept = default;
  Point& operator=(const Point&) = default;
  Point& operator=(Point&&) noexcept = default;
  ~Point() = default;
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_GEOMETRY_POINT_HPP
