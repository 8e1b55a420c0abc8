// Ticket: 0014_contact_solver_test_suite

#ifndef LCS_SIM_TEST_HELPERS_CONTACT_ASSERTIONS_HPP
#define LCS_SIM_TEST_HELPERS_CONTACT_ASSERTIONS_HPP

#include <string>

#include <Eigen/Dense>
#include <gtest/gtest.h>

#include "lcs-sim/src/Contact/ContactStepResult.hpp"
#include "lcs-sim/src/Contact/ContactTypes.hpp"
#include "lcs-sim/src/Contact/FrictionPyramid.hpp"

namespace lcs_sim::test
{

/**
 * @brief Assertion helpers for contact step results
 *
 * All helpers use EXPECT_* so every violation of a step is reported.
 * Forces are in N, moments in N m.
 *
 * @ticket 0014_contact_solver_test_suite
 */

// ============================================================================
// Vectors
// ============================================================================

/**
 * @brief Element-wise |actual - expected| <= tolerance
 */
inline void expectVectorNear(const Eigen::VectorXd& actual,
                             const Eigen::VectorXd& expected,
                             double tolerance,
                             const std::string& context = "")
{
  ASSERT_EQ(actual.size(), expected.size()) << context;
  for (Eigen::Index i = 0; i < actual.size(); ++i)
  {
    EXPECT_NEAR(actual(i), expected(i), tolerance)
      << "entry " << i << (context.empty() ? "" : " [" + context + "]");
  }
}

// ============================================================================
// Vertex forces
// ============================================================================

/**
 * @brief Every vertex force lies in the friction pyramid (rows <= tolerance)
 */
inline void expectForcesInPyramid(const ContactForceVector& forces,
                                  double mu,
                                  double tolerance)
{
  const FrictionPyramid pyramid{mu};
  for (int i = 0; i < kNumVertices; ++i)
  {
    const Eigen::Vector3d f = forces.segment<3>(forceOffset(i));
    EXPECT_TRUE(pyramid.contains(f, tolerance))
      << "vertex " << i << " force (" << f.transpose()
      << ") violates the friction pyramid, mu = " << mu;
  }
}

/**
 * @brief Vertices not in contact this step carry no force
 */
inline void expectNoForceOffContact(const ContactStepResult& result,
                                    double tolerance = 1e-12)
{
  for (int i = 0; i < kNumVertices; ++i)
  {
    if (result.contactState.current[static_cast<size_t>(i)])
    {
      continue;
    }
    const Eigen::Vector3d f = result.contactForces.segment<3>(forceOffset(i));
    EXPECT_LE(f.cwiseAbs().maxCoeff(), tolerance)
      << "vertex " << i << " is above ground (height "
      << result.vertexHeights(i) << ") but carries force (" << f.transpose() << ")";
  }
}

/**
 * @brief Sum of vertical vertex forces
 */
inline double totalNormalForce(const ContactForceVector& forces)
{
  double total = 0.0;
  for (int i = 0; i < kNumVertices; ++i)
  {
    total += forces(forceOffset(i) + 2);
  }
  return total;
}

}  // namespace lcs_sim::test

#endif  // LCS_SIM_TEST_HELPERS_CONTACT_ASSERTIONS_HPP
