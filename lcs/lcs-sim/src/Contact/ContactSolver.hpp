// Ticket: 0001_foot_contact_solver

#ifndef LCS_SIM_CONTACT_CONTACT_SOLVER_HPP
#define LCS_SIM_CONTACT_CONTACT_SOLVER_HPP

#include <Eigen/Dense>
#include <spdlog/spdlog.h>
#include <memory>

#include "lcs-sim/src/Contact/ContactSolverConfig.hpp"
#include "lcs-sim/src/Contact/ContactState.hpp"
#include "lcs-sim/src/Contact/ContactStepResult.hpp"
#include "lcs-sim/src/Contact/ContactTypes.hpp"
#include "lcs-sim/src/Contact/FootGeometry.hpp"
#include "lcs-sim/src/Contact/FrictionPyramid.hpp"
#include "lcs-sim/src/Contact/ImpactProjector.hpp"
#include "lcs-sim/src/Dynamics/ActuationSelector.hpp"
#include "lcs-sim/src/Dynamics/RobotDynamics.hpp"
#include "lcs-sim/src/Optimization/QuadraticProgramSolver.hpp"

namespace lcs_sim
{

/**
 * @brief Rigid unilateral foot contact for a biped, one call per timestep
 *
 * Each foot touches flat ground at the four vertices of a shared footprint.
 * computeContact() runs, in order:
 *
 * 1. Vertex Jacobian assembly (J_feet 24 x n, Jdot nu 24)
 * 2. Contact detection: vertex height <= 0
 * 3. Free dynamics: qddot_free = M^{-1} (S tau + f_ext - h),
 *    a_free = J_feet qddot_free + Jdot nu
 * 4. Force solve:
 *      minimize (1/2) f^T (J_feet M^{-1} J_feet^T) f + f^T a_free
 *      s.t. friction pyramid rows, fz = 0 for vertices above ground
 * 5. Wrenches: f_ext + J_feet^T f, and per-foot sole-frame wrenches
 * 6. Impact: project the velocity if a vertex touched down (ImpactProjector)
 * 7. Commit: previous <- current
 *
 * The contact history starts with every vertex in contact, so the first
 * call never applies an impact correction. A call that throws leaves the
 * history unchanged.
 *
 * Thread safety: Not thread-safe. One instance per simulated robot.
 *
 * @ticket 0001_foot_contact_solver
 */
class ContactSolver
{
public:
  /**
   * @brief Construct from a full configuration
   * @param config Validated here
   * @param logger Logger for step events; spdlog's default logger if null
   * @throws ConfigurationError if the configuration is invalid
   */
  explicit ContactSolver(const ContactSolverConfig& config,
                         std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * @brief Construct with default solver settings
   * @param footprint 4x3 footprint, one sole-frame vertex per row
   * @param actuatedDofs Number of actuated joints N
   * @param frictionCoefficient mu > 0
   * @throws ConfigurationError if the footprint is not 4x3 or mu <= 0
   */
  ContactSolver(const Eigen::MatrixXd& footprint,
                int actuatedDofs,
                double frictionCoefficient);

  /**
   * @brief Construct with an externally built QP backend
   *
   * config.backend, solverTolerance and solverMaxIterations are ignored.
   *
   * @throws ConfigurationError if the configuration is invalid
   * @throws std::invalid_argument if qpSolver is null
   */
  ContactSolver(const ContactSolverConfig& config,
                std::unique_ptr<QuadraticProgramSolver> qpSolver,
                std::shared_ptr<spdlog::logger> logger = nullptr);

  ~ContactSolver() = default;

  ContactSolver(const ContactSolver&) = delete;
  ContactSolver& operator=(const ContactSolver&) = delete;
  ContactSolver(ContactSolver&&) noexcept = default;
  ContactSolver& operator=(ContactSolver&&) noexcept = default;

  /**
   * @brief Resolve contact for one timestep
   *
   * @param robot Dynamics at the current configuration (read only)
   * @param torque Joint torques tau (N)
   * @param externalWrench Generalized external force f_ext (6 + N)
   * @param baseVelocity Base velocity [linear; angular] before impact
   * @param jointVelocity Joint velocity qdot (N) before impact
   * @return Wrenches, post-impact velocity and step diagnostics
   *
   * @throws std::invalid_argument on dimension mismatch or non-finite values
   *         in the inputs or in the data returned by robot
   * @throws SolverFailure if M is not positive definite, the force QP fails
   *         or the impact projection is not finite
   */
  [[nodiscard]] ContactStepResult computeContact(const RobotDynamics& robot,
                                                 const Eigen::VectorXd& torque,
                                                 const Eigen::VectorXd& externalWrench,
                                                 const Vector6d& baseVelocity,
                                                 const Eigen::VectorXd& jointVelocity);

  /**
   * @brief Replace the contact history
   *
   * For hosts that reset the simulation to a new pose. The next call
   * detects impacts against state.current.
   */
  void resetContactState(const ContactState& state = ContactState::initial());

  [[nodiscard]] const ContactState& contactState() const
  {
    return state_;
  }

  [[nodiscard]] const ContactSolverConfig& config() const
  {
    return config_;
  }

  [[nodiscard]] const FootGeometry& footGeometry() const
  {
    return geometry_;
  }

  [[nodiscard]] const FrictionPyramid& frictionPyramid() const
  {
    return pyramid_;
  }

  [[nodiscard]] const ActuationSelector& actuationSelector() const
  {
    return selector_;
  }

  [[nodiscard]] const QuadraticProgramSolver& qpSolver() const
  {
    return *qp_solver_;
  }

  /// Equality rows of the last completed step: row i pins fz_i when vertex i
  /// was detected out of contact
  [[nodiscard]] const Eigen::MatrixXd& equalityMatrix() const
  {
    return equality_matrix_;
  }

private:
  /// Aeq for the detected contact flags (8 x 24)
  [[nodiscard]] static Eigen::MatrixXd equalityConstraints(const ContactFlags& flags);

  ContactSolverConfig config_;
  std::shared_ptr<spdlog::logger> logger_;
  FootGeometry geometry_;
  FrictionPyramid pyramid_;
  ActuationSelector selector_;
  ImpactProjector impact_projector_;
  std::unique_ptr<QuadraticProgramSolver> qp_solver_;

  Eigen::MatrixXd equality_matrix_;  // 8 x 24
  Eigen::VectorXd equality_bound_;   // 8, always zero
  Eigen::VectorXd warm_start_;       // 24

  ContactState state_{ContactState::initial()};
};

}  // namespace lcs_sim

#endif  // LCS_SIM_CONTACT_CONTACT_SOLVER_HPP
