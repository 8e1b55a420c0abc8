// Ticket: 0001_foot_contact_solver

#ifndef LCS_SIM_CONTACT_CONTACT_ERRORS_HPP
#define LCS_SIM_CONTACT_CONTACT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace lcs_sim
{

/**
 * @brief Invalid solver configuration detected at construction
 *
 * Thrown for a footprint that is not 4x3, a non-positive friction
 * coefficient, a negative actuated DOF count or invalid solver settings.
 *
 * @ticket 0001_foot_contact_solver
 */
class ConfigurationError : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/**
 * @brief A contact step could not be completed
 *
 * The contact history of the solver is left untouched when this is thrown.
 *
 * @ticket 0001_foot_contact_solver
 */
class SolverFailure : public std::runtime_error
{
public:
  /// Pipeline stage that failed
  enum class Stage
  {
    FreeDynamics,       ///< Mass matrix not positive definite
    ForceOptimization,  ///< QP infeasible, unbounded or not converged
    ImpactProjection    ///< Velocity projection produced non-finite values
  };

  SolverFailure(Stage stage, const std::string& message)
    : std::runtime_error{message}, stage_{stage}
  {
  }

  [[nodiscard]] Stage stage() const noexcept
  {
    return stage_;
  }

private:
  Stage stage_;
};

[[nodiscard]] constexpr std::string_view toString(SolverFailure::Stage stage)
{
  switch (stage)
  {
    case SolverFailure::Stage::FreeDynamics:
      return "free dynamics";
    case SolverFailure::Stage::ForceOptimization:
      return "force optimization";
    case SolverFailure::Stage::ImpactProjection:
      return "impact projection";
  }
  return "unknown";
}

}  // namespace lcs_sim

#endif  // LCS_SIM_CONTACT_CONTACT_ERRORS_HPP
