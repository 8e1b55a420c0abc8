// Ticket: 0001_foot_contact_solver
// Ticket: 0009_contact_solver_configuration

#ifndef LCS_SIM_CONTACT_CONTACT_SOLVER_CONFIG_HPP
#define LCS_SIM_CONTACT_CONTACT_SOLVER_CONFIG_HPP

#include <Eigen/Dense>

#include "lcs-sim/src/Optimization/QuadraticProgramSolver.hpp"

namespace lcs_sim
{

/**
 * @brief Construction parameters of ContactSolver
 *
 * Plain data; loading it from a robot description is the host's job.
 *
 * @ticket 0009_contact_solver_configuration
 */
struct ContactSolverConfig
{
  Eigen::MatrixXd footprint;           ///< 4x3, one sole-frame vertex per row [m]
  int actuatedDofs{0};                 ///< N
  double frictionCoefficient{0.0};     ///< mu > 0
  double warmStartForce{100.0};        ///< Every component of the QP initial point [N]
  QPBackend backend{QPBackend::NLoptSLSQP};
  double solverTolerance{1e-9};
  int solverMaxIterations{1000};
  double feasibilityTolerance{1e-6};   ///< Maximum accepted QP constraint violation [N]
  double impactRankTolerance{1e-10};   ///< Singular value cutoff of the impact projector

  /// @throws ConfigurationError on the first invalid field
  void validate() const;
};

}  // namespace lcs_sim

#endif  // LCS_SIM_CONTACT_CONTACT_SOLVER_CONFIG_HPP
