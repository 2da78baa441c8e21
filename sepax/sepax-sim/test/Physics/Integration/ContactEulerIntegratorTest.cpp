// Ticket: 0007_contact_integration

#include <gtest/gtest.h>

#include <Eigen/Geometry>
#include <cmath>
#include <vector>

#include "sepax-sim/src/Geometry/Direction.hpp"
#include "sepax-sim/src/Physics/Integration/ContactEulerIntegrator.hpp"
#include "sepax-sim/src/Physics/RigidBody/KineticState.hpp"

using namespace sepax_sim;

// ============================================================================
// Linear Integration
// ============================================================================

TEST(ContactEulerIntegrator, FreeFall_ConstantAcceleration)
{
  ContactEulerIntegrator integrator;
  KineticState state;
  state.position = Point{0.0, 2.0, 0.0};
  state.acceleration = Direction{0.0, -10.0, 0.0};

  integrator.step(state, {}, 0.5);

  // x = x0 + ½at², v = at
  EXPECT_DOUBLE_EQ(state.position.y(), 2.0 - 1.25);
  EXPECT_DOUBLE_EQ(state.velocity.y(), -5.0);
}

TEST(ContactEulerIntegrator, ConstantVelocity_NoAcceleration)
{
  ContactEulerIntegrator integrator;
  KineticState state;
  state.velocity = Direction{1.0, 0.0, -2.0};

  integrator.step(state, {}, 0.25);

  EXPECT_DOUBLE_EQ(state.position.x(), 0.25);
  EXPECT_DOUBLE_EQ(state.position.z(), -0.5);
  EXPECT_DOUBLE_EQ(state.velocity.x(), 1.0);
}

// ============================================================================
// Contact Rejection
// ============================================================================

TEST(ContactEulerIntegrator, VelocityIntoContact_RemovedAndPersisted)
{
  ContactEulerIntegrator integrator;
  KineticState state;
  state.velocity = Direction{1.0, -3.0, 0.0};

  std::vector<Direction> const normals{Direction{0.0, -1.0, 0.0}};
  integrator.step(state, normals, 0.001);

  EXPECT_DOUBLE_EQ(state.velocity.x(), 1.0);
  EXPECT_DOUBLE_EQ(state.velocity.y(), 0.0);
  EXPECT_DOUBLE_EQ(state.position.y(), 0.0);
}

TEST(ContactEulerIntegrator, VelocityAwayFromContact_Untouched)
{
  ContactEulerIntegrator integrator;
  KineticState state;
  state.velocity = Direction{0.0, 2.0, 0.0};

  std::vector<Direction> const normals{Direction{0.0, -1.0, 0.0}};
  integrator.step(state, normals, 0.5);

  EXPECT_DOUBLE_EQ(state.velocity.y(), 2.0);
  EXPECT_DOUBLE_EQ(state.position.y(), 1.0);
}

TEST(ContactEulerIntegrator, AccelerationRejection_AppliesToStepOnly)
{
  ContactEulerIntegrator integrator;
  KineticState state;
  state.acceleration = Direction{0.0, -10.0, 0.0};

  std::vector<Direction> const normals{Direction{0.0, -1.0, 0.0}};
  integrator.step(state, normals, 0.001);

  EXPECT_DOUBLE_EQ(state.position.y(), 0.0);
  EXPECT_DOUBLE_EQ(state.velocity.y(), 0.0);
  // Gravity resumes once the contact is gone
  EXPECT_DOUBLE_EQ(state.acceleration.y(), -10.0);

  integrator.step(state, {}, 0.001);
  EXPECT_LT(state.velocity.y(), 0.0);
}

TEST(ContactEulerIntegrator, RejectInto_RemovesOnlyPositiveComponent)
{
  Direction const normal{1.0, 0.0, 0.0};

  Direction const into = ContactEulerIntegrator::rejectInto(Direction{2.0, 1.0, 0.0}, normal);
  EXPECT_DOUBLE_EQ(into.x(), 0.0);
  EXPECT_DOUBLE_EQ(into.y(), 1.0);

  Direction const away = ContactEulerIntegrator::rejectInto(Direction{-2.0, 1.0, 0.0}, normal);
  EXPECT_DOUBLE_EQ(away.x(), -2.0);
}

// ============================================================================
// Angular Integration
// ============================================================================

TEST(ContactEulerIntegrator, AngularVelocity_RotatesOrientation)
{
  ContactEulerIntegrator integrator;
  KineticState state;
  state.angularVelocity = Direction{0.0, 0.0, M_PI / 2.0};

  integrator.step(state, {}, 1.0);

  Eigen::Vector3d const rotatedX = state.orientation * Eigen::Vector3d::UnitX();
  EXPECT_NEAR(rotatedX.x(), 0.0, 1e-12);
  EXPECT_NEAR(rotatedX.y(), 1.0, 1e-12);
  EXPECT_NEAR(state.orientation.determinant(), 1.0, 1e-12);
}

TEST(ContactEulerIntegrator, AngularAcceleration_UpdatesAngularVelocity)
{
  ContactEulerIntegrator integrator;
  KineticState state;
  state.angularAcceleration = Direction{2.0, 0.0, 0.0};

  integrator.step(state, {}, 0.5);

  EXPECT_DOUBLE_EQ(state.angularVelocity.x(), 1.0);
  // θ = ½αt² = 0.25 rad about x
  Eigen::Vector3d const rotatedY = state.orientation * Eigen::Vector3d::UnitY();
  EXPECT_NEAR(rotatedY.y(), std::cos(0.25), 1e-12);
  EXPECT_NEAR(rotatedY.z(), std::sin(0.25), 1e-12);
}

TEST(ContactEulerIntegrator, NoRotation_OrientationUnchanged)
{
  ContactEulerIntegrator integrator;
  KineticState state;

  integrator.step(state, {}, 0.001);

  EXPECT_TRUE(state.orientation.isIdentity());
}
