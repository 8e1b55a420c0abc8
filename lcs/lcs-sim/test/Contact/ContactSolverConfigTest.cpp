// Ticket: 0009_contact_solver_configuration

#include "lcs-sim/src/Contact/ContactSolverConfig.hpp"

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <limits>

#include "lcs-sim/src/Contact/ContactErrors.hpp"

namespace lcs_sim
{

namespace
{

ContactSolverConfig validConfig()
{
  ContactSolverConfig config;
  config.footprint = Eigen::MatrixXd::Zero(4, 3);
  config.footprint.col(0) << 0.1, 0.1, -0.05, -0.05;
  config.footprint.col(1) << 0.03, -0.03, 0.03, -0.03;
  config.actuatedDofs = 23;
  config.frictionCoefficient = 0.6;
  return config;
}

}  // namespace

TEST(ContactSolverConfigTest, DefaultsMatchDocumentedValues)
{
  const ContactSolverConfig config;

  EXPECT_DOUBLE_EQ(config.warmStartForce, 100.0);
  EXPECT_EQ(config.backend, QPBackend::NLoptSLSQP);
  EXPECT_DOUBLE_EQ(config.solverTolerance, 1e-9);
  EXPECT_EQ(config.solverMaxIterations, 1000);
  EXPECT_DOUBLE_EQ(config.feasibilityTolerance, 1e-6);
  EXPECT_DOUBLE_EQ(config.impactRankTolerance, 1e-10);
}

TEST(ContactSolverConfigTest, ValidConfigurationPasses)
{
  EXPECT_NO_THROW(validConfig().validate());
}

TEST(ContactSolverConfigTest, FootprintShapeIsChecked)
{
  ContactSolverConfig config = validConfig();
  config.footprint = Eigen::MatrixXd::Zero(8, 3);
  EXPECT_THROW(config.validate(), ConfigurationError);

  config.footprint = Eigen::MatrixXd::Zero(4, 3).transpose();
  EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST(ContactSolverConfigTest, InvalidScalarsAreRejected)
{
  {
    ContactSolverConfig config = validConfig();
    config.frictionCoefficient = 0.0;
    EXPECT_THROW(config.validate(), ConfigurationError);
  }
  {
    ContactSolverConfig config = validConfig();
    config.actuatedDofs = -2;
    EXPECT_THROW(config.validate(), ConfigurationError);
  }
  {
    ContactSolverConfig config = validConfig();
    config.warmStartForce = std::numeric_limits<double>::infinity();
    EXPECT_THROW(config.validate(), ConfigurationError);
  }
  {
    ContactSolverConfig config = validConfig();
    config.solverTolerance = -1e-9;
    EXPECT_THROW(config.validate(), ConfigurationError);
  }
  {
    ContactSolverConfig config = validConfig();
    config.solverMaxIterations = 0;
    EXPECT_THROW(config.validate(), ConfigurationError);
  }
  {
    ContactSolverConfig config = validConfig();
    config.feasibilityTolerance = 0.0;
    EXPECT_THROW(config.validate(), ConfigurationError);
  }
  {
    ContactSolverConfig config = validConfig();
    config.impactRankTolerance = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(config.validate(), ConfigurationError);
  }
}

TEST(ContactSolverConfigTest, ZeroWarmStartIsAllowed)
{
  ContactSolverConfig config = validConfig();
  config.warmStartForce = 0.0;
  EXPECT_NO_THROW(config.validate());
}

}  // namespace lcs_sim
