// Ticket: 0004_friction_pyramid_constraints

#include "lcs-sim/src/Contact/FrictionPyramid.hpp"

#include <cmath>
#include <string>

#include "lcs-sim/src/Contact/ContactErrors.hpp"

namespace lcs_sim
{

FrictionPyramid::FrictionPyramid(double frictionCoefficient)
  : mu_{frictionCoefficient}
{
  if (!std::isfinite(frictionCoefficient) || frictionCoefficient <= 0.0)
  {
    throw ConfigurationError{
      "FrictionPyramid: friction coefficient must be positive and finite, got " +
      std::to_string(frictionCoefficient)};
  }

  const Eigen::Matrix<double, kRowsPerVertex, 3> block = vertexBlock(mu_);

  inequality_matrix_ = Eigen::MatrixXd::Zero(kNumRows, kNumForceVariables);
  for (int i = 0; i < kNumVertices; ++i)
  {
    inequality_matrix_.block<kRowsPerVertex, 3>(kRowsPerVertex * i, forceOffset(i)) =
      block;
  }
  inequality_bound_ = Eigen::VectorXd::Zero(kNumRows);
}

Eigen::Matrix<double, FrictionPyramid::kRowsPerVertex, 3>
FrictionPyramid::vertexBlock(double mu)
{
  Eigen::Matrix<double, kRowsPerVertex, 3> block;
  block << 1.0, 0.0, -mu,
           0.0, 1.0, -mu,
           -1.0, 0.0, -mu,
           0.0, -1.0, -mu,
           0.0, 0.0, -1.0;
  return block;
}

bool FrictionPyramid::contains(const Eigen::Vector3d& force, double tolerance) const
{
  return ((vertexBlock(mu_) * force).array() <= tolerance).all();
}

}  // namespace lcs_sim
