// Ticket: 0011_impact_velocity_projection

#include "lcs-sim/src/Contact/ImpactProjector.hpp"

#include <stdexcept>
#include <string>

#include "lcs-sim/src/Contact/ContactErrors.hpp"
#include "lcs-sim/src/Contact/ContactTypes.hpp"

namespace lcs_sim
{

ImpactProjector::ImpactProjector(double rankTolerance)
  : rank_tolerance_{rankTolerance}
{
}

ImpactProjector::Correction ImpactProjector::correct(
  const Eigen::LLT<Eigen::MatrixXd>& massLlt,
  const Eigen::MatrixXd& vertexJacobian,
  const ContactState& state,
  const Eigen::VectorXd& velocity) const
{
  if (vertexJacobian.rows() != kNumForceVariables ||
      vertexJacobian.cols() != velocity.size() ||
      massLlt.rows() != velocity.size())
  {
    throw std::invalid_argument{
      "ImpactProjector::correct: expected a 24 x n Jacobian and n x n mass "
      "matrix for n = " + std::to_string(velocity.size())};
  }

  Correction correction;
  if (!state.hasImpact())
  {
    correction.velocity = velocity;
    return correction;
  }

  correction.impactVertices = state.impactVertices();

  correction.constrainedVertices = constrainedVertices(state);
  const Eigen::MatrixXd constraintJacobian =
    stackVertexRows(vertexJacobian, correction.constrainedVertices);

  correction.velocity =
    projector(massLlt, constraintJacobian, &correction.rank) * velocity;
  correction.applied = true;

  if (!correction.velocity.allFinite())
  {
    throw SolverFailure{SolverFailure::Stage::ImpactProjection,
                        "ImpactProjector: post-impact velocity is not finite"};
  }

  return correction;
}

Eigen::MatrixXd ImpactProjector::projector(const Eigen::LLT<Eigen::MatrixXd>& massLlt,
                                           const Eigen::MatrixXd& constraintJacobian,
                                           Eigen::Index* rank) const
{
  const Eigen::Index n = constraintJacobian.cols();

  // M^{-1} J^T and J M^{-1} J^T
  const Eigen::MatrixXd minvJt = massLlt.solve(constraintJacobian.transpose());
  const Eigen::MatrixXd inertiaInverse = constraintJacobian * minvJt;

  Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod;
  cod.setThreshold(rank_tolerance_);
  cod.compute(inertiaInverse);
  if (rank != nullptr)
  {
    *rank = cod.rank();
  }

  // (J M^{-1} J^T)^+ J as the minimum-norm least-squares solve
  return Eigen::MatrixXd::Identity(n, n) - minvJt * cod.solve(constraintJacobian);
}

std::vector<int> ImpactProjector::constrainedVertices(const ContactState& state)
{
  std::vector<int> vertices = state.impactVertices();
  const std::vector<int> previous = state.previousContactVertices();
  vertices.insert(vertices.end(), previous.begin(), previous.end());
  return vertices;
}

Eigen::MatrixXd ImpactProjector::stackVertexRows(const Eigen::MatrixXd& vertexJacobian,
                                                 const std::vector<int>& vertices)
{
  Eigen::MatrixXd stacked(kForcesPerVertex * static_cast<Eigen::Index>(vertices.size()),
                          vertexJacobian.cols());
  for (size_t k = 0; k < vertices.size(); ++k)
  {
    stacked.middleRows<kForcesPerVertex>(kForcesPerVertex * static_cast<Eigen::Index>(k)) =
      vertexJacobian.middleRows<kForcesPerVertex>(forceOffset(vertices[k]));
  }
  return stacked;
}

}  // namespace lcs_sim
