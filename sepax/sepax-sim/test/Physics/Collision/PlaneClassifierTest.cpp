// Ticket: 0003_separation_classifier

#include <gtest/gtest.h>

#include <vector>

#include "sepax-sim/src/Geometry/Direction.hpp"
#include "sepax-sim/src/Geometry/Plane.hpp"
#include "sepax-sim/src/Geometry/Point.hpp"
#include "sepax-sim/src/Physics/Collision/PlaneClassifier.hpp"
#include "sepax-sim/src/Physics/Collision/PolygonMesh.hpp"

using namespace sepax_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// y = 0 plane with +y normal
Plane floorPlane()
{
  return Plane{Direction{0.0, 1.0, 0.0}, Point{0.0, 0.0, 0.0}};
}

}  // anonymous namespace

// ============================================================================
// classifyPoints State Machine
// ============================================================================

TEST(PlaneClassifier, AllAbove_PositiveWithMinimumDistance)
{
  std::vector<Point> const points{
    Point{0.0, 3.0, 0.0}, Point{1.0, 0.5, 0.0}, Point{0.0, 2.0, 1.0}};

  auto const result = classifyPoints(points, floorPlane());

  EXPECT_EQ(result.side, PlaneSide::Positive);
  EXPECT_DOUBLE_EQ(result.distance, 0.5);
}

TEST(PlaneClassifier, AllBelow_NegativeWithMinimumDistance)
{
  std::vector<Point> const points{Point{0.0, -3.0, 0.0}, Point{0.0, -0.25, 0.0}};

  auto const result = classifyPoints(points, floorPlane());

  EXPECT_EQ(result.side, PlaneSide::Negative);
  EXPECT_DOUBLE_EQ(result.distance, 0.25);
}

TEST(PlaneClassifier, AllOnPlane_OnPlane)
{
  std::vector<Point> const points{Point{0.0, 0.0, 0.0}, Point{5.0, 0.0, -5.0}};

  EXPECT_EQ(classifyPoints(points, floorPlane()).side, PlaneSide::OnPlane);
}

TEST(PlaneClassifier, EmptySet_OnPlane)
{
  auto const result = classifyPoints({}, floorPlane());

  EXPECT_EQ(result.side, PlaneSide::OnPlane);
  EXPECT_DOUBLE_EQ(result.distance, 0.0);
}

TEST(PlaneClassifier, BothSides_Intersect)
{
  std::vector<Point> const points{Point{0.0, 1.0, 0.0}, Point{0.0, -1.0, 0.0}};

  EXPECT_EQ(classifyPoints(points, floorPlane()).side, PlaneSide::Intersect);
}

TEST(PlaneClassifier, IntersectIsAbsorbing)
{
  // Later vertices on the plane or on the first side cannot undo Intersect
  std::vector<Point> const points{Point{0.0, -1.0, 0.0},
                                  Point{0.0, 1.0, 0.0},
                                  Point{0.0, 0.0, 0.0},
                                  Point{0.0, -2.0, 0.0}};

  EXPECT_EQ(classifyPoints(points, floorPlane()).side, PlaneSide::Intersect);
}

TEST(PlaneClassifier, OnPlaneThenPositive_PositiveWithZeroDistance)
{
  std::vector<Point> const points{Point{0.0, 0.0, 0.0}, Point{0.0, 2.0, 0.0}};

  auto const result = classifyPoints(points, floorPlane());

  EXPECT_EQ(result.side, PlaneSide::Positive);
  EXPECT_DOUBLE_EQ(result.distance, 0.0);
}

TEST(PlaneClassifier, PositiveThenOnPlane_StaysPositiveWithZeroDistance)
{
  std::vector<Point> const points{Point{0.0, 2.0, 0.0}, Point{0.0, 0.0, 0.0}};

  auto const result = classifyPoints(points, floorPlane());

  EXPECT_EQ(result.side, PlaneSide::Positive);
  EXPECT_DOUBLE_EQ(result.distance, 0.0);
}

TEST(PlaneClassifier, DistanceWithinTolerance_CountsAsZero)
{
  std::vector<Point> const points{Point{0.0, 1e-12, 0.0}, Point{0.0, -1e-12, 0.0}};

  EXPECT_EQ(classifyPoints(points, floorPlane()).side, PlaneSide::OnPlane);
  EXPECT_EQ(classifyPoints(points, floorPlane(), 0.0).side, PlaneSide::Intersect);
}

// ============================================================================
// Mesh Classification
// ============================================================================

TEST(PlaneClassifier, ClassifyMesh_UsesTransform)
{
  auto const cube = PolygonMesh::createCuboid(
    Point{0.0, 0.0, 0.0}, Direction{1.0, 0.0, 0.0}, Direction{0.0, 1.0, 0.0}, 1.0);

  Eigen::Matrix4d raised = Eigen::Matrix4d::Identity();
  raised(1, 3) = 2.0;

  auto const above = classifyMesh(cube, raised, floorPlane());
  EXPECT_EQ(above.side, PlaneSide::Positive);
  EXPECT_NEAR(above.distance, 1.5, 1e-12);

  auto const straddling =
    classifyMesh(cube, Eigen::Matrix4d::Identity(), floorPlane());
  EXPECT_EQ(straddling.side, PlaneSide::Intersect);
}

// ============================================================================
// Extent and Overlap
// ============================================================================

TEST(PlaneClassifier, ComputePlaneExtent_MinAndMax)
{
  std::vector<Point> const points{
    Point{0.0, -1.0, 0.0}, Point{0.0, 4.0, 0.0}, Point{0.0, 2.0, 0.0}};

  auto const extent = computePlaneExtent(points, floorPlane());
  EXPECT_DOUBLE_EQ(extent.min, -1.0);
  EXPECT_DOUBLE_EQ(extent.max, 4.0);

  auto const empty = computePlaneExtent({}, floorPlane());
  EXPECT_DOUBLE_EQ(empty.min, 0.0);
  EXPECT_DOUBLE_EQ(empty.max, 0.0);
}

TEST(PlaneClassifier, ComputeOverlap_PenetrationAndGap)
{
  std::vector<Point> const lower{Point{0.0, -1.0, 0.0}, Point{0.0, 0.0, 0.0}};
  std::vector<Point> const penetrating{Point{0.0, -0.25, 0.0}, Point{0.0, 1.0, 0.0}};
  std::vector<Point> const apart{Point{0.0, 0.5, 0.0}, Point{0.0, 1.0, 0.0}};

  EXPECT_DOUBLE_EQ(computeOverlap(lower, penetrating, floorPlane()), 0.25);
  EXPECT_DOUBLE_EQ(computeOverlap(lower, apart, floorPlane()), -0.5);
  EXPECT_DOUBLE_EQ(computeOverlap(lower, {}, floorPlane()), 0.0);
}
