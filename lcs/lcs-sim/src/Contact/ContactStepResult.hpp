// Ticket: 0001_foot_contact_solver
// Ticket: 0010_contact_step_diagnostics

#ifndef LCS_SIM_CONTACT_CONTACT_STEP_RESULT_HPP
#define LCS_SIM_CONTACT_CONTACT_STEP_RESULT_HPP

#include <Eigen/Dense>
#include <limits>
#include <vector>

#include "lcs-sim/src/Contact/ContactState.hpp"
#include "lcs-sim/src/Contact/ContactTypes.hpp"

namespace lcs_sim
{

/**
 * @brief Outputs of one ContactSolver::computeContact() call
 *
 * @ticket 0001_foot_contact_solver
 * @ticket 0010_contact_step_diagnostics
 */
struct ContactStepResult
{
  Eigen::VectorXd totalWrench;     ///< f_ext + J_feet^T f (6 + N)
  Vector6d leftFootWrench{Vector6d::Zero()};   ///< [F; tau] in the left sole frame
  Vector6d rightFootWrench{Vector6d::Zero()};  ///< [F; tau] in the right sole frame
  Vector6d baseVelocity{Vector6d::Zero()};     ///< Post-impact base velocity
  Eigen::VectorXd jointVelocity;   ///< Post-impact joint velocity (N)

  // Diagnostics
  ContactForceVector contactForces{ContactForceVector::Zero()};  ///< World frame
  VertexHeights vertexHeights{VertexHeights::Zero()};
  ContactState contactState;       ///< Flags used by this step (before commit)
  bool impactDetected{false};
  std::vector<int> impactVertices; ///< Free -> contact vertices, ascending
  int solverIterations{0};
  double solverObjective{std::numeric_limits<double>::quiet_NaN()};
};

}  // namespace lcs_sim

#endif  // LCS_SIM_CONTACT_CONTACT_STEP_RESULT_HPP
