// Ticket: 0002_vertex_jacobian_assembly

#ifndef LCS_SIM_CONTACT_FOOT_KINEMATICS_HPP
#define LCS_SIM_CONTACT_FOOT_KINEMATICS_HPP

#include <Eigen/Dense>

#include "lcs-sim/src/Contact/ContactTypes.hpp"
#include "lcs-sim/src/Contact/FootGeometry.hpp"
#include "lcs-sim/src/Dynamics/RobotDynamics.hpp"

namespace lcs_sim
{

/**
 * @brief Stacked vertex velocity kinematics of both feet
 *
 * Rows [3i, 3i+3) belong to vertex i (left foot first). For a vertex at
 * sole-frame position p on a foot with rotation R:
 *
 *   J_i       = J_lin - skew(R p) J_ang
 *   JdotNu_i  = JdotNu_lin - skew(R p) JdotNu_ang
 *
 * @ticket 0002_vertex_jacobian_assembly
 */
struct VertexJacobians
{
  Eigen::MatrixXd jacobian;  ///< 24 x n
  ContactForceVector jacobianDotNu{ContactForceVector::Zero()};
};

namespace foot_kinematics
{

/**
 * @brief Assemble the 24 x n vertex Jacobian and its derivative term
 *
 * @param geometry Shared foot footprint
 * @param transforms World <- sole transforms (left, right)
 * @param jacobians Sole Jacobians, 6 x n each, rows [linear; angular]
 * @param jacobianDotNu Sole Jdot * nu terms
 * @throws std::invalid_argument if the Jacobians are not 6 x n with equal n
 * @ticket 0002_vertex_jacobian_assembly
 */
[[nodiscard]] VertexJacobians assembleVertexJacobians(
  const FootGeometry& geometry,
  const FeetPair<Eigen::Matrix4d>& transforms,
  const FeetPair<Eigen::MatrixXd>& jacobians,
  const FeetPair<Vector6d>& jacobianDotNu);

/**
 * @brief World z-coordinate of every vertex, z of H_foot * [p; 1]
 * @ticket 0003_contact_detection
 */
[[nodiscard]] VertexHeights computeVertexHeights(
  const FootGeometry& geometry,
  const FeetPair<Eigen::Matrix4d>& transforms);

/**
 * @brief Contact flags from heights; a vertex touches when height <= 0
 * @ticket 0003_contact_detection
 */
[[nodiscard]] ContactFlags detectContact(const VertexHeights& heights);

}  // namespace foot_kinematics

}  // namespace lcs_sim

#endif  // LCS_SIM_CONTACT_FOOT_KINEMATICS_HPP
