// Ticket: 0001_foot_contact_solver

#ifndef LCS_SIM_DYNAMICS_ACTUATION_SELECTOR_HPP
#define LCS_SIM_DYNAMICS_ACTUATION_SELECTOR_HPP

#include <Eigen/Dense>

namespace lcs_sim
{

/**
 * @brief Maps joint torques into generalized coordinates
 *
 * S = [0_{6xN}; I_N]. The floating base is unactuated, so the first six
 * rows are zero.
 *
 * @ticket 0001_foot_contact_solver
 */
class ActuationSelector
{
public:
  /**
   * @brief Build S for N actuated joints
   * @param actuatedDofs Number of actuated joints N (>= 0)
   * @throws ConfigurationError if actuatedDofs is negative
   */
  explicit ActuationSelector(int actuatedDofs);

  /// Generalized torque S * tau
  /// @throws std::invalid_argument if tau does not have N entries
  [[nodiscard]] Eigen::VectorXd apply(const Eigen::VectorXd& torque) const;

  [[nodiscard]] const Eigen::MatrixXd& matrix() const
  {
    return matrix_;
  }

  [[nodiscard]] int actuatedDofs() const
  {
    return actuated_dofs_;
  }

  /// n = 6 + N
  [[nodiscard]] int generalizedDofs() const;

private:
  int actuated_dofs_;
  Eigen::MatrixXd matrix_;
};

}  // namespace lcs_sim

#endif  // LCS_SIM_DYNAMICS_ACTUATION_SELECTOR_HPP
