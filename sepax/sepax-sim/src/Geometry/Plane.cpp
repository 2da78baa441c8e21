// Ticket: 0001_geometry_kernel

#include "sepax-sim/src/Geometry/Plane.hpp"

#include <cmath>
#include <stdexcept>

namespace sepax_sim
{

Plane::Plane(const Direction& normal, const Point& anchor)
  : normal_{normal.normalized()}, anchor_{anchor}
{
  if (normal.isZero() || !normal_.allFinite())
  {
    throw std::invalid_argument("Plane normal must be a non-zero finite direction");
  }
}

Eigen::Vector4d Plane::getPlaneEquation() const
{
  return Eigen::Vector4d{
    normal_.x(), normal_.y(), normal_.z(), -normal_.dot(anchor_)};
}

double Plane::distanceTo(const Point& point) const
{
  return getPlaneEquation().dot(point.homogeneous());
}

Plane Plane::transform(const Eigen::Matrix4d& matrix) const
{
  return Plane{normal_.transform(matrix), anchor_.transform(matrix)};
}

Plane Plane::opposite() const
{
  return Plane{normal_.opposite(), anchor_};
}

Plane Plane::displace(const Direction& displacement) const
{
  return Plane{normal_, anchor_.displace(displacement)};
}

Direction Plane::projectDirection(const Point& point) const
{
  return Direction{normal_ * -distanceTo(point)};
}

Point Plane::projectPoint(const Point& point) const
{
  return point.displace(projectDirection(point));
}

}  // namespace sepax_sim
