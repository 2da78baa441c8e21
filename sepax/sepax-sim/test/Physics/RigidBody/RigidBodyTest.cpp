// Ticket: 0006_rigid_body_state

#include <gtest/gtest.h>

#include <Eigen/Geometry>
#include <cmath>
#include <stdexcept>

#include "sepax-sim/src/Physics/Collision/PolygonMesh.hpp"
#include "sepax-sim/src/Physics/RigidBody/BodyForce.hpp"
#include "sepax-sim/src/Physics/RigidBody/KineticState.hpp"
#include "sepax-sim/src/Physics/RigidBody/Mass.hpp"
#include "sepax-sim/src/Physics/RigidBody/PhysicsObject.hpp"

using namespace sepax_sim;

// ============================================================================
// Mass
// ============================================================================

TEST(Mass, Infinite)
{
  Mass const mass = Mass::infinite();

  EXPECT_TRUE(mass.isInfinite());
  EXPECT_TRUE(std::isinf(mass.getValue()));
}

TEST(Mass, Finite)
{
  Mass const mass = Mass::finite(2.5);

  EXPECT_FALSE(mass.isInfinite());
  EXPECT_DOUBLE_EQ(mass.getValue(), 2.5);
}

TEST(Mass, NonPositive_Throws)
{
  EXPECT_THROW(static_cast<void>(Mass::finite(0.0)), std::invalid_argument);
  EXPECT_THROW(static_cast<void>(Mass::finite(-1.0)), std::invalid_argument);
  EXPECT_THROW(static_cast<void>(Mass::finite(std::nan(""))), std::invalid_argument);
}

// ============================================================================
// KineticState
// ============================================================================

TEST(KineticState, DefaultsAreAtRest)
{
  KineticState const state{};

  EXPECT_TRUE(state.mass.isInfinite());
  EXPECT_TRUE(state.position.isZero());
  EXPECT_TRUE(state.velocity.isZero());
  EXPECT_TRUE(state.orientation.isIdentity());
  EXPECT_TRUE(state.getWorldTransform().isIdentity());
}

TEST(KineticState, WorldTransform_TranslatesAfterRotating)
{
  KineticState state;
  state.position = Point{1.0, 2.0, 3.0};
  state.orientation =
    Eigen::AngleAxisd{M_PI / 2.0, Eigen::Vector3d::UnitZ()}.toRotationMatrix();

  Eigen::Matrix4d const transform = state.getWorldTransform();
  Point const moved = Point{1.0, 0.0, 0.0}.transform(transform);

  EXPECT_NEAR(moved.x(), 1.0, 1e-12);
  EXPECT_NEAR(moved.y(), 3.0, 1e-12);
  EXPECT_NEAR(moved.z(), 3.0, 1e-12);
  EXPECT_DOUBLE_EQ(transform(3, 3), 1.0);
}

// ============================================================================
// PhysicsObject
// ============================================================================

TEST(PhysicsObject, StuckFlagIsSticky)
{
  PhysicsObject object{PolygonMesh::createCuboid(Point{}, Direction{1.0, 0.0, 0.0},
                                                 Direction{0.0, 1.0, 0.0}, 1.0),
                       KineticState{}};

  EXPECT_FALSE(object.isStuck());
  object.markStuck();
  EXPECT_TRUE(object.isStuck());
  object.markStuck();
  EXPECT_TRUE(object.isStuck());
  object.clearStuck();
  EXPECT_FALSE(object.isStuck());
}

TEST(PhysicsObject, WorldTransformFollowsKineticState)
{
  PhysicsObject object{PolygonMesh::createCuboid(Point{}, Direction{1.0, 0.0, 0.0},
                                                 Direction{0.0, 1.0, 0.0}, 1.0),
                       KineticState{}};

  object.getKineticState().position = Point{0.0, 4.0, 0.0};

  EXPECT_DOUBLE_EQ(object.getWorldTransform()(1, 3), 4.0);
  // The mesh itself stays in the local frame
  EXPECT_DOUBLE_EQ(object.getMesh().getCentroid().y(), 0.0);
}

// ============================================================================
// Body Forces
// ============================================================================

TEST(PhysicsObject, BodyForceAcceleration_SumsForcesOverMassAndAccelerations)
{
  KineticState state;
  state.mass = Mass::finite(4.0);
  PhysicsObject object{PolygonMesh::createCuboid(Point{}, Direction{1.0, 0.0, 0.0},
                                                 Direction{0.0, 1.0, 0.0}, 1.0),
                       state};

  EXPECT_TRUE(object.computeBodyForceAcceleration().isZero());

  object.addBodyForce(ConstantForce{Direction{8.0, 0.0, 0.0}});
  object.addBodyForce(ConstantForce{Direction{0.0, 4.0, 0.0}});
  object.addBodyForce(ConstantAcceleration{Direction{0.0, 0.0, -3.0}});
  ASSERT_EQ(object.getBodyForces().size(), 3u);

  Direction const acceleration = object.computeBodyForceAcceleration();
  EXPECT_DOUBLE_EQ(acceleration.x(), 2.0);
  EXPECT_DOUBLE_EQ(acceleration.y(), 1.0);
  EXPECT_DOUBLE_EQ(acceleration.z(), -3.0);

  object.clearBodyForces();
  EXPECT_TRUE(object.getBodyForces().empty());
  EXPECT_TRUE(object.computeBodyForceAcceleration().isZero());
}

TEST(PhysicsObject, BodyForceAcceleration_InfiniteMassIgnoresForces)
{
  PhysicsObject object{PolygonMesh::createCuboid(Point{}, Direction{1.0, 0.0, 0.0},
                                                 Direction{0.0, 1.0, 0.0}, 1.0),
                       KineticState{}};

  object.addBodyForce(ConstantForce{Direction{100.0, 0.0, 0.0}});
  object.addBodyForce(ConstantAcceleration{Direction{0.0, -1.0, 0.0}});

  Direction const acceleration = object.computeBodyForceAcceleration();
  EXPECT_DOUBLE_EQ(acceleration.x(), 0.0);
  EXPECT_DOUBLE_EQ(acceleration.y(), -1.0);
}

TEST(PhysicsObject, AddBodyForce_NonFinite_Throws)
{
  PhysicsObject object{PolygonMesh::createCuboid(Point{}, Direction{1.0, 0.0, 0.0},
                                                 Direction{0.0, 1.0, 0.0}, 1.0),
                       KineticState{}};

  EXPECT_THROW(object.addBodyForce(ConstantForce{Direction{std::nan(""), 0.0, 0.0}}),
               std::invalid_argument);
  EXPECT_TRUE(object.getBodyForces().empty());
}
