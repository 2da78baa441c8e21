// Ticket: 0001_geometry_kernel

#ifndef SEPAX_SIM_GEOMETRY_LINE_SEGMENT_HPP
#define SEPAX_SIM_GEOMETRY_LINE_SEGMENT_HPP

#include <Eigen/Dense>

#include "sepax-sim/src/Geometry/Direction.hpp"
#include "sepax-sim/src/Geometry/Point.hpp"

namespace sepax_sim
{

/**
 * @brief Segment between two points; its direction is end - start
 */
class LineSegment
{
public:
  LineSegment(const Point& start, const Point& end) : start_{start}, end_{end}
  {
  }

  [[nodiscard]] const Point& getStart() const
  {
    return start_;
  }

  [[nodiscard]] const Point& getEnd() const
  {
    return end_;
  }

  [[nodiscard]] Direction getDirection() const
  {
    return Direction::between(start_, end_);
  }

  [[nodiscard]] LineSegment transform(const Eigen::Matrix4d& matrix) const
  {
    return LineSegment{start_.transform(matrix), end_.transform(matrix)};
  }

  [[nodiscard]] LineSegment displace(const Direction& displacement) const
  {
    return LineSegment{start_.displace(displacement),
                       end_.displace(displacement)};
  }

private:
  Point start_;
  Point end_;
};

}  // namespace sepax_sim

#endif  // SEPAX_SIM_GEOMETRY_LINE_SEGMENT_HPP
