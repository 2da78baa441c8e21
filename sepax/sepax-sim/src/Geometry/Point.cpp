// Ticket: 0001_geometry_kernel

#include "sepax-sim/src/Geometry/Point.hpp"

namespace sepax_sim
{

Point Point::displace(const Direction& displacement) const
{
  return Point{static_cast<const Eigen::Vector3d&>(*this) + displacement};
}

Point Point::averageOf(const std::vector<Point>& points)
{
  if (points.empty())
  {
    return Point{};
  }

  Eigen::Vector3d sum = Eigen::Vector3d::Zero();
  for (const auto& point : points)
  {
    sum += point;
  }
  return Point{sum / static_cast<double>(points.size())};
}

}  // namespace sepax_sim
