// Ticket: 0005_wrench_assembly

#ifndef LCS_SIM_CONTACT_WRENCH_ASSEMBLY_HPP
#define LCS_SIM_CONTACT_WRENCH_ASSEMBLY_HPP

#include <Eigen/Dense>

#include "lcs-sim/src/Contact/ContactTypes.hpp"
#include "lcs-sim/src/Contact/FootGeometry.hpp"
#include "lcs-sim/src/Dynamics/RobotDynamics.hpp"

namespace lcs_sim::wrench_assembly
{

/// Forces of one foot's four vertices, world frame
using FootForceVector = Eigen::Matrix<double, kVerticesPerFoot * kForcesPerVertex, 1>;

/**
 * @brief Generalized contact wrench J_feet^T f (n)
 * @throws std::invalid_argument if the Jacobian does not have 24 rows
 */
[[nodiscard]] Eigen::VectorXd generalizedContactWrench(
  const Eigen::MatrixXd& vertexJacobian,
  const ContactForceVector& forces);

/**
 * @brief Wrench of one foot in its sole frame
 *
 * Each world-frame vertex force is rotated into the sole frame with R^T and
 * accumulated as
 *
 *   F   += R^T f_i
 *   tau += -skew(p_i) (R^T f_i)
 *
 * @param geometry Footprint providing p_i
 * @param rotation World <- sole rotation R
 * @param footForces Forces of the foot's four vertices, world frame
 * @return [F; tau]
 * @ticket 0005_wrench_assembly
 */
[[nodiscard]] Vector6d soleWrench(const FootGeometry& geometry,
                                  const Eigen::Matrix3d& rotation,
                                  const FootForceVector& footForces);

/// soleWrench() for both feet
[[nodiscard]] FeetPair<Vector6d> soleWrenches(
  const FootGeometry& geometry,
  const FeetPair<Eigen::Matrix4d>& transforms,
  const ContactForceVector& forces);

}  // namespace lcs_sim::wrench_assembly

#endif  // LCS_SIM_CONTACT_WRENCH_ASSEMBLY_HPP
