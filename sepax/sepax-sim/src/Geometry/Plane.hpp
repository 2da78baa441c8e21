// Ticket: 0001_geometry_kernel

#ifndef SEPAX_SIM_GEOMETRY_PLANE_HPP
#define SEPAX_SIM_GEOMETRY_PLANE_HPP

#include <Eigen/Dense>

#include "sepax-sim/src/Geometry/Direction.hpp"
#include "sepax-sim/src/Geometry/Point.hpp"

namespace sepax_sim
{

/**
 * @brief Oriented plane defined by a unit normal and an anchor point
 *
 * The normal is normalized on construction. Signed distances are positive on
 * the side the normal points to.
 *
 * @ticket 0001_geometry_kernel
 */
class Plane
{
public:
  /**
   * @brief Construct a plane through @p anchor with the given normal
   * @param normal Plane normal, any non-zero length
   * @param anchor Any point on the plane
   * @throws std::invalid_argument if the normal is zero or not finite
   */
  Plane(const Direction& normal, const Point& anchor);

  [[nodiscard]] const Direction& getNormal() const
  {
    return normal_;
  }

  [[nodiscard]] const Point& getAnchor() const
  {
    return anchor_;
  }

  /**
   * @brief Plane equation (nx, ny, nz, -n·p)
   */
  [[nodiscard]] Eigen::Vector4d getPlaneEquation() const;

  /**
   * @brief Signed distance of a point from the plane
   *
   * Computed as the dot product of the plane equation with the homogeneous
   * point.
   */
  [[nodiscard]] double distanceTo(const Point& point) const;

  /**
   * @brief Apply a rigid transform to both normal and anchor
   */
  [[nodiscard]] Plane transform(const Eigen::Matrix4d& matrix) const;

  /**
   * @brief Same plane with the normal flipped (anchor unchanged)
   */
  [[nodiscard]] Plane opposite() const;

  [[nodiscard]] Plane displace(const Direction& displacement) const;

  /**
   * @brief Vector that moves @p point onto the plane along the normal
   */
  [[nodiscard]] Direction projectDirection(const Point& point) const;

  /**
   * @brief Orthogonal projection of @p point onto the plane
   */
  [[nodiscard]] Point projectPoint(const Point& point) const;

  Plane(const Plane&) = default;
  Plane(Plane&&) noexcept = default;
  Plane& operator=(const Plane&) = default;
  Plane& operator=(Plane&&) noexcept = default;
  ~Plane() = default;

private:
  Direction normal_;
  Point anchor_;
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_GEOMETRY_PLANE_HPP
