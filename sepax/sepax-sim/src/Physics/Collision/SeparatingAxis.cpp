// Ticket: 0004_sat_axis_search

#include "sepax-sim/src/Physics/Collision/SeparatingAxis.hpp"

namespace sepax_sim
{

namespace
{

// Edge pairs whose cross product is shorter than this fraction of
// |eA| * |eB| are treated as parallel
constexpr double kParallelEdgeTolerance{1e-9};

}  // namespace

SeparatingAxisSolver::SeparatingAxisSolver(const PolygonMesh& meshA,
                                           const Eigen::Matrix4d& transformA,
                                           const PolygonMesh& meshB,
                                           const Eigen::Matrix4d& transformB,
                                           double tolerance)
  : meshA_{meshA},
    meshB_{meshB},
    transformA_{transformA},
    transformB_{transformB},
    tolerance_{tolerance},
    worldVerticesA_{transformVertices(meshA, transformA)},
    worldVerticesB_{transformVertices(meshB, transformB)}
{
}

std::optional<SeparatingAxis> SeparatingAxisSolver::findSeparatingAxis() const
{
  for (size_t i = 0; i < meshA_.getCollisionFaces().size(); ++i)
  {
    if (firstFaceSeparates(i))
    {
      return SeparatingAxis{FirstObjectFace{i}};
    }
  }

  for (size_t i = 0; i < meshB_.getCollisionFaces().size(); ++i)
  {
    if (secondFaceSeparates(i))
    {
      return SeparatingAxis{SecondObjectFace{i}};
    }
  }

  for (size_t i = 0; i < meshA_.getEdges().size(); ++i)
  {
    for (size_t j = 0; j < meshB_.getEdges().size(); ++j)
    {
      if (edgeCrossSeparates(i, j))
      {
        return SeparatingAxis{EdgeCross{i, j}};
      }
    }
  }

  return std::nullopt;
}

bool SeparatingAxisSolver::separates(const SeparatingAxis& axis) const
{
  if (const auto* face = std::get_if<FirstObjectFace>(&axis))
  {
    return firstFaceSeparates(face->index);
  }
  if (const auto* face = std::get_if<SecondObjectFace>(&axis))
  {
    return secondFaceSeparates(face->index);
  }
  const auto& edges = std::get<EdgeCross>(axis);
  return edgeCrossSeparates(edges.firstEdge, edges.secondEdge);
}

std::optional<AxisContact> SeparatingAxisSolver::evaluate(
  const SeparatingAxis& axis) const
{
  if (const auto* face = std::get_if<FirstObjectFace>(&axis))
  {
    if (face->index >= meshA_.getCollisionFaces().size())
    {
      return std::nullopt;
    }
    return contactAlong(
      meshA_.getCollisionFaces()[face->index].transform(transformA_));
  }

  if (const auto* face = std::get_if<SecondObjectFace>(&axis))
  {
    if (face->index >= meshB_.getCollisionFaces().size())
    {
      return std::nullopt;
    }
    // The second mesh's face points toward the first mesh
    return contactAlong(meshB_.getCollisionFaces()[face->index]
                          .transform(transformB_)
                          .opposite());
  }

  const auto& edges = std::get<EdgeCross>(axis);
  auto plane = edgeCrossPlane(edges.firstEdge, edges.secondEdge);
  if (!plane)
  {
    return std::nullopt;
  }

  Direction const centroidOffset =
    Direction::between(meshA_.getCentroid().transform(transformA_),
                       meshB_.getCentroid().transform(transformB_));
  if (plane->getNormal().dot(centroidOffset) < 0.0)
  {
    return contactAlong(plane->opposite());
  }
  return contactAlong(*plane);
}

bool SeparatingAxisSolver::firstFaceSeparates(size_t index) const
{
  const auto& faces = meshA_.getCollisionFaces();
  if (index >= faces.size())
  {
    return false;
  }
  Plane const worldPlane = faces[index].transform(transformA_);
  return classifyPoints(worldVerticesB_, worldPlane, tolerance_).side ==
         PlaneSide::Positive;
}

bool SeparatingAxisSolver::secondFaceSeparates(size_t index) const
{
  const auto& faces = meshB_.getCollisionFaces();
  if (index >= faces.size())
  {
    return false;
  }
  Plane const worldPlane = faces[index].transform(transformB_);
  return classifyPoints(worldVerticesA_, worldPlane, tolerance_).side ==
         PlaneSide::Positive;
}

bool SeparatingAxisSolver::edgeCrossSeparates(size_t firstEdge,
                                              size_t secondEdge) const
{
  auto plane = edgeCrossPlane(firstEdge, secondEdge);
  if (!plane)
  {
    return false;
  }

  PlaneSide const sideA = classifyPoints(worldVerticesA_, *plane, tolerance_).side;
  PlaneSide const sideB = classifyPoints(worldVerticesB_, *plane, tolerance_).side;

  if (sideB == PlaneSide::Positive)
  {
    return sideA == PlaneSide::Negative || sideA == PlaneSide::OnPlane;
  }
  if (sideB == PlaneSide::Negative)
  {
    return sideA == PlaneSide::Positive || sideA == PlaneSide::OnPlane;
  }
  return false;
}

std::optional<Plane> SeparatingAxisSolver::edgeCrossPlane(size_t firstEdge,
                                                          size_t secondEdge) const
{
  if (firstEdge >= meshA_.getEdges().size() ||
      secondEdge >= meshB_.getEdges().size())
  {
    return std::nullopt;
  }

  LineSegment const edgeA = meshA_.getEdgeSegment(firstEdge).transform(transformA_);
  LineSegment const edgeB =
    meshB_.getEdgeSegment(secondEdge).transform(transformB_);

  Direction const directionA = edgeA.getDirection();
  Direction const directionB = edgeB.getDirection();
  Direction const normal = directionA.cross(directionB);

  if (normal.isZero(kParallelEdgeTolerance * directionA.norm() *
                    directionB.norm()))
  {
    return std::nullopt;
  }
  return Plane{normal, edgeA.getStart()};
}

AxisContact SeparatingAxisSolver::contactAlong(const Plane& plane) const
{
  return AxisContact{plane.getNormal(),
                     computeOverlap(worldVerticesA_, worldVerticesB_, plane)};
}

std::optional<SeparatingAxis> findSeparatingAxis(
  const PolygonMesh& meshA,
  const Eigen::Matrix4d& transformA,
  const PolygonMesh& meshB,
  const Eigen::Matrix4d& transformB,
  double tolerance)
{
  SeparatingAxisSolver const solver{
    meshA, transformA, meshB, transformB, tolerance};
  return solver.findSeparatingAxis();
}

}  // namespace sepax_sim
