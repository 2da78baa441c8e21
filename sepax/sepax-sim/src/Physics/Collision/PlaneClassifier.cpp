// Ticket: 0003_separation_classifier

#include "sepax-sim/src/Physics/Collision/PlaneClassifier.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

namespace sepax_sim
{

PlaneClassification classifyPoints(const std::vector<Point>& points,
                                   const Plane& plane,
                                   double tolerance)
{
  // nullopt until the first vertex has been seen
  std::optional<PlaneSide> side;
  double minDistance = 0.0;

  for (const auto& point : points)
  {
    double const distance = plane.distanceTo(point);

    if (std::abs(distance) <= tolerance)
    {
      if (!side)
      {
        side = PlaneSide::OnPlane;
      }
      else if (*side == PlaneSide::Positive || *side == PlaneSide::Negative)
      {
        minDistance = 0.0;
      }
      continue;
    }

    PlaneSide const vertexSide =
      distance > 0.0 ? PlaneSide::Positive : PlaneSide::Negative;

    if (!side)
    {
      side = vertexSide;
      minDistance = std::abs(distance);
    }
    else if (*side == PlaneSide::OnPlane)
    {
      // Earlier vertices touched the plane, so the run is already at zero
      side = vertexSide;
      minDistance = 0.0;
    }
    else if (*side == vertexSide)
    {
      minDistance = std::min(minDistance, std::abs(distance));
    }
    else
    {
      // Intersect is absorbing
      return PlaneClassification{PlaneSide::Intersect, 0.0};
    }
  }

  if (!side || *side == PlaneSide::OnPlane)
  {
    return PlaneClassification{PlaneSide::OnPlane, 0.0};
  }
  return PlaneClassification{*side, minDistance};
}

PlaneClassification classifyMesh(const PolygonMesh& mesh,
                                 const Eigen::Matrix4d& transform,
                                 const Plane& plane,
                                 double tolerance)
{
  return classifyPoints(transformVertices(mesh, transform), plane, tolerance);
}

PlaneExtent computePlaneExtent(const std::vector<Point>& points,
                               const Plane& plane)
{
  if (points.empty())
  {
    return PlaneExtent{0.0, 0.0};
  }

  double minDistance = plane.distanceTo(points.front());
  double maxDistance = minDistance;
  for (const auto& point : points)
  {
    double const distance = plane.distanceTo(point);
    minDistance = std::min(minDistance, distance);
    maxDistance = std::max(maxDistance, distance);
  }
  return PlaneExtent{minDistance, maxDistance};
}

double computeOverlap(const std::vector<Point>& first,
                      const std::vector<Point>& second,
                      const Plane& plane)
{
  if (first.empty() || second.empty())
  {
    return 0.0;
  }
  return computePlaneExtent(first, plane).max -
         computePlaneExtent(second, plane).min;
}

std::vector<Point> transformVertices(const PolygonMesh& mesh,
                                     const Eigen::Matrix4d& transform)
{
  std::vector<Point> world;
  world.reserve(mesh.getVertices().size());
  for (const auto& vertex : mesh.getVertices())
  {
    world.push_back(vertex.transform(transform));
  }
  return world;
}

}  // namespace sepax_sim
