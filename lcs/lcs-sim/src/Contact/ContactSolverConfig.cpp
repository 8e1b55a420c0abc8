// Ticket: 0009_contact_solver_configuration

#include "lcs-sim/src/Contact/ContactSolverConfig.hpp"

#include <cmath>
#include <string>

#include "lcs-sim/src/Contact/ContactErrors.hpp"
#include "lcs-sim/src/Contact/ContactTypes.hpp"

namespace lcs_sim
{

namespace
{

void requirePositive(const char* field, double value)
{
  if (!std::isfinite(value) || value <= 0.0)
  {
    throw ConfigurationError{std::string{"ContactSolverConfig: "} + field +
                             " must be positive and finite, got " +
                             std::to_string(value)};
  }
}

}  // namespace

void ContactSolverConfig::validate() const
{
  if (footprint.rows() != kVerticesPerFoot || footprint.cols() != 3)
  {
    throw ConfigurationError{
      "ContactSolverConfig: footprint must be 4x3 (one vertex per row), got " +
      std::to_string(footprint.rows()) + "x" + std::to_string(footprint.cols())};
  }
  if (!footprint.allFinite())
  {
    throw ConfigurationError{"ContactSolverConfig: footprint contains non-finite values"};
  }
  if (actuatedDofs < 0)
  {
    throw ConfigurationError{
      "ContactSolverConfig: actuatedDofs must be non-negative, got " +
      std::to_string(actuatedDofs)};
  }
  requirePositive("frictionCoefficient", frictionCoefficient);
  if (!std::isfinite(warmStartForce))
  {
    throw ConfigurationError{"ContactSolverConfig: warmStartForce must be finite"};
  }
  requirePositive("solverTolerance", solverTolerance);
  if (solverMaxIterations <= 0)
  {
    throw ConfigurationError{
      "ContactSolverConfig: solverMaxIterations must be positive, got " +
      std::to_string(solverMaxIterations)};
  }
  requirePositive("feasibilityTolerance", feasibilityTolerance);
  requirePositive("impactRankTolerance", impactRankTolerance);
}

}  // namespace lcs_sim
