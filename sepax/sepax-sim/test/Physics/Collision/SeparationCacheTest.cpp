// Ticket: 0005_separation_cache

#include <gtest/gtest.h>

#include <stdexcept>

#include "sepax-sim/src/Geometry/Direction.hpp"
#include "sepax-sim/src/Geometry/Point.hpp"
#include "sepax-sim/src/Physics/Collision/PolygonMesh.hpp"
#include "sepax-sim/src/Physics/Collision/SeparatingAxis.hpp"
#include "sepax-sim/src/Physics/Collision/SeparationCache.hpp"

using namespace sepax_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

PolygonMesh unitCube()
{
  return PolygonMesh::createCuboid(
    Point{0.0, 0.0, 0.0}, Direction{1.0, 0.0, 0.0}, Direction{0.0, 1.0, 0.0}, 1.0);
}

Eigen::Matrix4d translation(double x, double y, double z)
{
  Eigen::Matrix4d transform = Eigen::Matrix4d::Identity();
  transform.topRightCorner<3, 1>() = Eigen::Vector3d{x, y, z};
  return transform;
}

}  // anonymous namespace

// ============================================================================
// Storage
// ============================================================================

TEST(SeparationCache, InsertAndFind)
{
  SeparationCache cache;
  cache.insert(1, 2, FirstObjectFace{3});

  auto const entry = cache.find(1, 2);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->type, SeparationType::Separated);
  EXPECT_EQ(entry->axis, SeparatingAxis{FirstObjectFace{3}});
  EXPECT_TRUE(cache.hasEntry(1, 2));
  EXPECT_EQ(cache.size(), 1u);
}

TEST(SeparationCache, KeysAreOrdered)
{
  SeparationCache cache;
  cache.insert(1, 2, SecondObjectFace{0});

  EXPECT_FALSE(cache.find(2, 1).has_value());
  EXPECT_FALSE(cache.hasEntry(2, 1));
}

TEST(SeparationCache, InsertOverwrites)
{
  SeparationCache cache;
  cache.insert(1, 2, FirstObjectFace{0});
  cache.insert(1, 2, EdgeCross{4, 5});

  EXPECT_EQ(cache.size(), 1u);
  EXPECT_EQ(cache.find(1, 2)->axis, (SeparatingAxis{EdgeCross{4, 5}}));
}

TEST(SeparationCache, Clear_RemovesEverything)
{
  SeparationCache cache;
  cache.insert(1, 2, FirstObjectFace{0});
  cache.insert(1, 3, FirstObjectFace{0});
  cache.clear();

  EXPECT_EQ(cache.size(), 0u);
  EXPECT_EQ(cache.getFullSearchCount(), 0u);
}

// ============================================================================
// Refresh
// ============================================================================

TEST(SeparationCache, Refresh_AxisStillSeparates_FastPath)
{
  auto const cube = unitCube();
  SeparationCache cache;
  cache.insert(0, 1, FirstObjectFace{0});

  SeparatingAxisSolver const solver{
    cube, translation(0.0, 0.0, 0.0), cube, translation(2.5, 0.1, 0.0)};
  const Separation& entry = cache.refresh(0, 1, solver);

  EXPECT_EQ(entry.type, SeparationType::Separated);
  EXPECT_EQ(entry.axis, SeparatingAxis{FirstObjectFace{0}});
  EXPECT_EQ(cache.getFullSearchCount(), 0u);
}

TEST(SeparationCache, Refresh_AxisInvalidated_FindsNewAxis)
{
  auto const cube = unitCube();
  SeparationCache cache;
  cache.insert(0, 1, FirstObjectFace{0});

  // Second cube moved from +x to +y of the first
  SeparatingAxisSolver const solver{
    cube, translation(0.0, 0.0, 0.0), cube, translation(0.0, 3.0, 0.0)};
  const Separation& entry = cache.refresh(0, 1, solver);

  EXPECT_EQ(entry.type, SeparationType::Separated);
  EXPECT_EQ(entry.axis, SeparatingAxis{FirstObjectFace{2}});
  EXPECT_EQ(cache.getFullSearchCount(), 1u);
}

TEST(SeparationCache, Refresh_Interpenetration_ContactKeepsLastAxis)
{
  auto const cube = unitCube();
  SeparationCache cache;
  cache.insert(0, 1, FirstObjectFace{0});

  SeparatingAxisSolver const solver{
    cube, translation(0.0, 0.0, 0.0), cube, translation(0.9, 0.0, 0.0)};
  const Separation& entry = cache.refresh(0, 1, solver);

  EXPECT_EQ(entry.type, SeparationType::Contact);
  EXPECT_EQ(entry.axis, SeparatingAxis{FirstObjectFace{0}});
  EXPECT_EQ(cache.find(0, 1)->type, SeparationType::Contact);
}

TEST(SeparationCache, Refresh_ContactEntryAlwaysSearches)
{
  auto const cube = unitCube();
  SeparationCache cache;
  cache.insert(0, 1, FirstObjectFace{0});

  SeparatingAxisSolver const overlapping{
    cube, translation(0.0, 0.0, 0.0), cube, translation(0.9, 0.0, 0.0)};
  static_cast<void>(cache.refresh(0, 1, overlapping));
  ASSERT_EQ(cache.getFullSearchCount(), 1u);

  SeparatingAxisSolver const apart{
    cube, translation(0.0, 0.0, 0.0), cube, translation(1.5, 0.0, 0.0)};
  const Separation& entry = cache.refresh(0, 1, apart);

  EXPECT_EQ(entry.type, SeparationType::Separated);
  EXPECT_EQ(entry.axis, SeparatingAxis{FirstObjectFace{0}});
  EXPECT_EQ(cache.getFullSearchCount(), 2u);
}

TEST(SeparationCache, Refresh_MissingEntry_Throws)
{
  auto const cube = unitCube();
  SeparationCache cache;
  SeparatingAxisSolver const solver{
    cube, translation(0.0, 0.0, 0.0), cube, translation(3.0, 0.0, 0.0)};

  EXPECT_THROW(static_cast<void>(cache.refresh(0, 1, solver)), std::out_of_range);
}
