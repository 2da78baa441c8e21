// Ticket: 0003_separation_classifier

#ifndef SEPAX_SIM_PHYSICS_PLANE_CLASSIFIER_HPP
#define SEPAX_SIM_PHYSICS_PLANE_CLASSIFIER_HPP

#include <Eigen/Dense>
#include <vector>

#include "sepax-sim/src/Geometry/Plane.hpp"
#include "sepax-sim/src/Geometry/Point.hpp"
#include "sepax-sim/src/Physics/Collision/PolygonMesh.hpp"

namespace sepax_sim
{

/// Signed distances at or below this magnitude count as lying on the plane [m]
inline constexpr double kDefaultPlaneTolerance{1e-9};

/**
 * @brief Which side of a plane a vertex set lies on
 *
 * - Positive: every vertex on or in front of the plane, at least one strictly
 *   in front
 * - Negative: mirror of Positive
 * - OnPlane: every vertex on the plane (or no vertices at all)
 * - Intersect: vertices strictly on both sides; never a separator
 */
enum class PlaneSide
{
  Positive,
  Negative,
  OnPlane,
  Intersect
};

/**
 * @brief Result of classifying a vertex set against a plane
 */
struct PlaneClassification
{
  PlaneSide side{PlaneSide::OnPlane};
  // Smallest |d| over the vertices for Positive/Negative, zero otherwise [m]
  double distance{0.0};
};

/**
 * @brief Classify world-space points against a plane
 *
 * Runs the four-state machine over the points in order. Zero distances move
 * an undetermined run to OnPlane; after a sign has been recorded they only
 * lower the recorded minimum to zero. Seeing the opposite sign escalates to
 * Intersect, which no later vertex can undo.
 *
 * @param points Vertices in the same frame as @p plane
 * @param plane Candidate plane
 * @param tolerance |d| at or below which a vertex counts as on the plane
 */
[[nodiscard]] PlaneClassification classifyPoints(
  const std::vector<Point>& points,
  const Plane& plane,
  double tolerance = kDefaultPlaneTolerance);

/**
 * @brief Classify a mesh placed by @p transform against a world-space plane
 */
[[nodiscard]] PlaneClassification classifyMesh(
  const PolygonMesh& mesh,
  const Eigen::Matrix4d& transform,
  const Plane& plane,
  double tolerance = kDefaultPlaneTolerance);

/**
 * @brief Extreme signed distances of a point set from a plane
 */
struct PlaneExtent
{
  double min;
  double max;
};

/**
 * @brief Smallest and largest signed distance of @p points from @p plane
 *
 * An empty set yields {0, 0}.
 */
[[nodiscard]] PlaneExtent computePlaneExtent(const std::vector<Point>& points,
                                             const Plane& plane);

/**
 * @brief Overlap of two point sets' projections along a plane normal
 *
 * The normal of @p plane is taken to point from @p first toward @p second.
 * The result is max(first) - min(second) of the signed distances: positive
 * values are a penetration depth, negative values the gap between the sets.
 * Returns 0 if either set is empty.
 */
[[nodiscard]] double computeOverlap(const std::vector<Point>& first,
                                    const std::vector<Point>& second,
                                    const Plane& plane);

/**
 * @brief Transform every mesh vertex into the world frame
 */
[[nodiscard]] std::vector<Point> transformVertices(
  const PolygonMesh& mesh,
  const Eigen::Matrix4d& transform);

}  // namespace sepax_sim

#endif  // SEPAX_SIM_PHYSICS_PLANE_CLASSIFIER_HPP
