// Ticket: 0001_foot_contact_solver

#include "lcs-sim/src/Dynamics/ActuationSelector.hpp"

#include <stdexcept>
#include <string>

#include "lcs-sim/src/Contact/ContactErrors.hpp"
#include "lcs-sim/src/Contact/ContactTypes.hpp"

namespace lcs_sim
{

ActuationSelector::ActuationSelector(int actuatedDofs)
  : actuated_dofs_{actuatedDofs}
{
  if (actuatedDofs < 0)
  {
    throw ConfigurationError{
      "ActuationSelector: actuated DOF count must be non-negative, got " +
      std::to_string(actuatedDofs)};
  }

  matrix_ = Eigen::MatrixXd::Zero(kBaseDofs + actuatedDofs, actuatedDofs);
  matrix_.bottomRows(actuatedDofs).setIdentity();
}

Eigen::VectorXd ActuationSelector::apply(const Eigen::VectorXd& torque) const
{
  if (torque.size() != actuated_dofs_)
  {
    throw std::invalid_argument{
      "ActuationSelector::apply: expected " + std::to_string(actuated_dofs_) +
      " joint torques, got " + std::to_string(torque.size())};
  }

  Eigen::VectorXd generalized = Eigen::VectorXd::Zero(generalizedDofs());
  generalized.tail(actuated_dofs_) = torque;
  return generalized;
}

int ActuationSelector::generalizedDofs() const
{
  return kBaseDofs + actuated_dofs_;
}

}  // namespace lcs_sim
