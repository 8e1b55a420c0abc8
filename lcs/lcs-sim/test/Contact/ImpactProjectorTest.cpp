// Ticket: 0011_impact_velocity_projection

#include "lcs-sim/src/Contact/ImpactProjector.hpp"

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <stdexcept>
#include <vector>

#include "lcs-sim/src/Contact/FootKinematics.hpp"
#include "lcs-sim/test/Helpers/RigidBiped.hpp"

namespace lcs_sim
{

namespace
{

FootGeometry rectangleFoot()
{
  Eigen::MatrixXd footprint(4, 3);
  footprint << 0.1, 0.03, 0.0,
               0.1, -0.03, 0.0,
               -0.05, 0.03, 0.0,
               -0.05, -0.03, 0.0;
  return FootGeometry{footprint};
}

}  // namespace

TEST(ImpactProjectorTest, FullRankConstraintRemovesConstrainedVelocity)
{
  // Point mass in 3D with a single vertical constraint
  const Eigen::MatrixXd mass = 2.0 * Eigen::MatrixXd::Identity(3, 3);
  const Eigen::LLT<Eigen::MatrixXd> llt{mass};
  Eigen::MatrixXd j(1, 3);
  j << 0.0, 0.0, 1.0;

  const ImpactProjector projector;
  Eigen::Index rank = 0;
  const Eigen::MatrixXd n = projector.projector(llt, j, &rank);

  const Eigen::Vector3d after = n * Eigen::Vector3d{1.0, -2.0, -3.0};
  EXPECT_EQ(rank, 1);
  EXPECT_TRUE(after.isApprox(Eigen::Vector3d{1.0, -2.0, 0.0}, 1e-12));
}

TEST(ImpactProjectorTest, RedundantRowsUsePseudoInverse)
{
  // The same constraint stacked twice: J M^{-1} J^T is singular
  const Eigen::MatrixXd mass = Eigen::MatrixXd::Identity(3, 3);
  const Eigen::LLT<Eigen::MatrixXd> llt{mass};
  Eigen::MatrixXd j(2, 3);
  j << 0.0, 0.0, 1.0,
       0.0, 0.0, 1.0;

  const ImpactProjector projector;
  Eigen::Index rank = 0;
  const Eigen::MatrixXd n = projector.projector(llt, j, &rank);

  const Eigen::Vector3d after = n * Eigen::Vector3d{0.5, 0.5, -1.0};
  EXPECT_EQ(rank, 1);
  EXPECT_TRUE(after.allFinite());
  EXPECT_TRUE(after.isApprox(Eigen::Vector3d{0.5, 0.5, 0.0}, 1e-12));
}

TEST(ImpactProjectorTest, ConstrainedVerticesListImpactsFirst)
{
  ContactState state = ContactState::airborne();
  state.previous[6] = true;
  state.current[6] = true;
  state.current[2] = true;
  state.current[0] = true;

  EXPECT_EQ(ImpactProjector::constrainedVertices(state), (std::vector<int>{0, 2, 6}));
}

TEST(ImpactProjectorTest, StackVertexRowsPicksThreeRowsPerVertex)
{
  Eigen::MatrixXd jacobian(24, 2);
  for (int r = 0; r < 24; ++r)
  {
    jacobian(r, 0) = r;
    jacobian(r, 1) = -r;
  }

  const Eigen::MatrixXd stacked = ImpactProjector::stackVertexRows(jacobian, {5, 1});

  ASSERT_EQ(stacked.rows(), 6);
  EXPECT_DOUBLE_EQ(stacked(0, 0), 15.0);
  EXPECT_DOUBLE_EQ(stacked(2, 0), 17.0);
  EXPECT_DOUBLE_EQ(stacked(3, 0), 3.0);
  EXPECT_DOUBLE_EQ(stacked(5, 1), -5.0);
}

TEST(ImpactProjectorTest, NoTouchdownLeavesVelocityBitIdentical)
{
  test::RigidBiped robot;
  const FootGeometry geometry = rectangleFoot();
  const VertexJacobians kinematics = foot_kinematics::assembleVertexJacobians(
    geometry, robot.feetTransforms(), robot.feetJacobians(), robot.feetJacobianDotNu());
  const Eigen::LLT<Eigen::MatrixXd> llt{robot.massMatrix()};

  Eigen::VectorXd velocity = Eigen::VectorXd::LinSpaced(robot.generalizedDofs(), -1.0, 1.0);

  const ImpactProjector projector;
  const auto correction =
    projector.correct(llt, kinematics.jacobian, ContactState::initial(), velocity);

  EXPECT_FALSE(correction.applied);
  EXPECT_TRUE(correction.impactVertices.empty());
  EXPECT_TRUE(correction.velocity == velocity);
}

TEST(ImpactProjectorTest, FootTouchdownStopsFootAndDoesNotAddEnergy)
{
  test::RigidBiped robot;
  const FootGeometry geometry = rectangleFoot();
  const VertexJacobians kinematics = foot_kinematics::assembleVertexJacobians(
    geometry, robot.feetTransforms(), robot.feetJacobians(), robot.feetJacobianDotNu());
  const Eigen::LLT<Eigen::MatrixXd> llt{robot.massMatrix()};

  ContactState state = ContactState::airborne();
  for (int i = 0; i < kVerticesPerFoot; ++i)
  {
    state.current[static_cast<size_t>(i)] = true;
  }

  Eigen::VectorXd velocity = Eigen::VectorXd::Zero(robot.generalizedDofs());
  velocity.head<6>() << 0.2, 0.1, -1.0, 0.3, -0.2, 0.1;
  velocity.tail(robot.parameters().actuatedDofs).setConstant(0.5);

  const ImpactProjector projector;
  const auto correction = projector.correct(llt, kinematics.jacobian, state, velocity);

  ASSERT_TRUE(correction.applied);
  EXPECT_EQ(correction.impactVertices, (std::vector<int>{0, 1, 2, 3}));
  // Four coplanar vertices of one rigid foot constrain six directions
  EXPECT_EQ(correction.rank, 6);

  const Eigen::VectorXd footVelocity =
    kinematics.jacobian.topRows<12>() * correction.velocity;
  EXPECT_LT(footVelocity.cwiseAbs().maxCoeff(), 1e-9);
  EXPECT_LE(robot.kineticEnergy(correction.velocity),
            robot.kineticEnergy(velocity) + 1e-12);

  // Rotors are decoupled from the base and keep their speed
  EXPECT_TRUE(correction.velocity.tail(robot.parameters().actuatedDofs)
                .isApprox(velocity.tail(robot.parameters().actuatedDofs), 1e-12));
}

TEST(ImpactProjectorTest, DimensionMismatchThrows)
{
  const Eigen::LLT<Eigen::MatrixXd> llt{Eigen::MatrixXd::Identity(6, 6)};
  const ImpactProjector projector;
  EXPECT_THROW((void)projector.correct(llt, Eigen::MatrixXd::Zero(24, 7),
                                       ContactState::initial(), Eigen::VectorXd::Zero(6)),
               std::invalid_argument);
}

}  // namespace lcs_sim
