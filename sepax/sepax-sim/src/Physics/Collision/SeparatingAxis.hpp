// Ticket: 0004_sat_axis_search

#ifndef SEPAX_SIM_PHYSICS_SEPARATING_AXIS_HPP
#define SEPAX_SIM_PHYSICS_SEPARATING_AXIS_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

#include "sepax-sim/src/Geometry/Direction.hpp"
#include "sepax-sim/src/Geometry/Plane.hpp"
#include "sepax-sim/src/Geometry/Point.hpp"
#include "sepax-sim/src/Physics/Collision/PlaneClassifier.hpp"
#include "sepax-sim/src/Physics/Collision/PolygonMesh.hpp"

namespace sepax_sim
{

/// Collision face @c index of the first mesh separates the pair
struct FirstObjectFace
{
  size_t index;

  bool operator==(const FirstObjectFace&) const = default;
};

/// Collision face @c index of the second mesh separates the pair
struct SecondObjectFace
{
  size_t index;

  bool operator==(const SecondObjectFace&) const = default;
};

/// The plane through edge @c firstEdge of the first mesh, spanned with edge
/// @c secondEdge of the second mesh, separates the pair
struct EdgeCross
{
  size_t firstEdge;
  size_t secondEdge;

  bool operator==(const EdgeCross&) const = default;
};

/**
 * @brief Names the feature that produced a separating axis
 *
 * Only indices are stored so the axis can be re-tested cheaply after either
 * mesh moves.
 */
using SeparatingAxis = std::variant<FirstObjectFace, SecondObjectFace, EdgeCross>;

/**
 * @brief Geometry of a named axis for the current placement
 *
 * The normal is unit length and points from the first mesh toward the
 * second. @c overlap is the overlap of the two meshes' projections onto the
 * normal: positive values are a penetration depth, negative values a gap.
 */
struct AxisContact
{
  Direction normal;
  double overlap{0.0};
};

/**
 * @brief Separating-axis test between two convex meshes in world space.
 *
 * Holds both meshes with their world transforms and the world-space vertex
 * positions derived from them. Candidate axes are enumerated in a fixed
 * order and the first that separates wins:
 *
 * 1. Collision faces of the first mesh (the second mesh must lie strictly in
 *    front)
 * 2. Collision faces of the second mesh (the first mesh must lie strictly in
 *    front)
 * 3. Every (first edge, second edge) pair: the plane through the first edge
 *    with normal firstEdge × secondEdge; one mesh must lie on a closed side
 *    and the other strictly on the opposite side. Parallel edge pairs are
 *    skipped.
 *
 * The meshes are held by reference and must outlive the solver.
 *
 * @ticket 0004_sat_axis_search
 */
class SeparatingAxisSolver
{
public:
  /**
   * @brief Place both meshes in world space
   *
   * @param meshA First mesh (local frame)
   * @param transformA World transform of the first mesh
   * @param meshB Second mesh (local frame)
   * @param transformB World transform of the second mesh
   * @param tolerance Plane tolerance for vertex classification
   */
  SeparatingAxisSolver(const PolygonMesh& meshA,
                       const Eigen::Matrix4d& transformA,
                       const PolygonMesh& meshB,
                       const Eigen::Matrix4d& transformB,
                       double tolerance = kDefaultPlaneTolerance);

  /**
   * @brief Full search over every candidate axis
   * @return The first separating axis, or std::nullopt if the meshes
   *         interpenetrate
   */
  [[nodiscard]] std::optional<SeparatingAxis> findSeparatingAxis() const;

  /**
   * @brief Re-test a single previously found axis
   *
   * Out-of-range indices and degenerate edge pairs never separate.
   */
  [[nodiscard]] bool separates(const SeparatingAxis& axis) const;

  /**
   * @brief Normal and projection overlap along a named axis
   * @return std::nullopt if the axis indices are invalid or the edge pair is
   *         degenerate for the current placement
   */
  [[nodiscard]] std::optional<AxisContact> evaluate(
    const SeparatingAxis& axis) const;

  [[nodiscard]] const std::vector<Point>& getWorldVerticesA() const
  {
    return worldVerticesA_;
  }

  [[nodiscard]] const std::vector<Point>& getWorldVerticesB() const
  {
    return worldVerticesB_;
  }

  SeparatingAxisSolver(const SeparatingAxisSolver&) = delete;
  SeparatingAxisSolver& operator=(const SeparatingAxisSolver&) = delete;
  SeparatingAxisSolver(SeparatingAxisSolver&&) noexcept = default;
  SeparatingAxisSolver& operator=(SeparatingAxisSolver&&) noexcept = delete;
  ~SeparatingAxisSolver() = default;

private:
  [[nodiscard]] bool firstFaceSeparates(size_t index) const;
  [[nodiscard]] bool secondFaceSeparates(size_t index) const;
  [[nodiscard]] bool edgeCrossSeparates(size_t firstEdge,
                                        size_t secondEdge) const;

  /**
   * @brief Plane through the first mesh's edge with normal eA × eB
   * @return std::nullopt for invalid indices or parallel edges
   */
  [[nodiscard]] std::optional<Plane> edgeCrossPlane(size_t firstEdge,
                                                    size_t secondEdge) const;

  [[nodiscard]] AxisContact contactAlong(const Plane& plane) const;

  const PolygonMesh& meshA_;
  const PolygonMesh& meshB_;
  Eigen::Matrix4d transformA_;
  Eigen::Matrix4d transformB_;
  double tolerance_;

  std::vector<Point> worldVerticesA_;
  std::vector<Point> worldVerticesB_;
};

/**
 * @brief Convenience wrapper for a one-off full search
 */
[[nodiscard]] std::optional<SeparatingAxis> findSeparatingAxis(
  const PolygonMesh& meshA,
  const Eigen::Matrix4d& transformA,
  const PolygonMesh& meshB,
  const Eigen::Matrix4d& transformB,
  double tolerance = kDefaultPlaneTolerance);

}  // namespace sepax_sim

#endif  // SEPAX_SIM_PHYSICS_SEPARATING_AXIS_HPP
