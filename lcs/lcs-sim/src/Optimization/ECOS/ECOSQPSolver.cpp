// Ticket: 0008_ecos_qp_backend

#include "lcs-sim/src/Optimization/ECOS/ECOSQPSolver.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace lcs_sim
{

namespace
{

// Eigenvalues below this fraction of the largest are treated as zero
constexpr double kRankTolerance = 1e-12;

// Negative eigenvalues beyond this fraction of the largest reject H
constexpr double kConvexityTolerance = 1e-9;

std::string exitFlagDescription(idxint exitFlag)
{
  switch (exitFlag)
  {
    case ECOS_OPTIMAL:
      return "optimal";
    case ECOS_OPTIMAL + ECOS_INACC_OFFSET:
      return "optimal (reduced accuracy)";
    case ECOS_PINF:
      return "primal infeasible";
    case ECOS_DINF:
      return "dual infeasible (unbounded)";
    case ECOS_PINF + ECOS_INACC_OFFSET:
      return "primal infeasible (reduced accuracy)";
    case ECOS_DINF + ECOS_INACC_OFFSET:
      return "dual infeasible (reduced accuracy)";
    case ECOS_MAXIT:
      return "iteration limit reached";
    case ECOS_NUMERICS:
      return "numerical problems";
    case ECOS_OUTCONE:
      return "iterate left the cone";
    default:
      return "ECOS exit flag " + std::to_string(exitFlag);
  }
}

}  // namespace

ECOSQPSolver::ECOSQPSolver(double tolerance, int maxIterations)
  : tolerance_{tolerance}, max_iterations_{maxIterations}
{
}

ECOSData ECOSQPSolver::buildConicProblem(const QuadraticProgram& problem)
{
  problem.validate();

  const Eigen::Index n = problem.numVariables();
  const Eigen::Index l = problem.inequalityMatrix.rows();
  const Eigen::Index p = problem.equalityMatrix.rows();

  // H = F F^T from the eigendecomposition, dropping the null space
  const Eigen::MatrixXd symmetric =
    0.5 * (problem.hessian + problem.hessian.transpose());
  const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eig{symmetric};
  if (eig.info() != Eigen::Success)
  {
    throw std::invalid_argument{
      "ECOSQPSolver: eigendecomposition of the Hessian failed"};
  }

  const Eigen::VectorXd& eigenvalues = eig.eigenvalues();
  const double scale = std::max(1.0, eigenvalues.cwiseAbs().maxCoeff());
  if (eigenvalues.minCoeff() < -kConvexityTolerance * scale)
  {
    throw std::invalid_argument{
      "ECOSQPSolver: Hessian is not positive semidefinite (min eigenvalue " +
      std::to_string(eigenvalues.minCoeff()) + ")"};
  }

  std::vector<Eigen::Index> range;
  for (Eigen::Index i = 0; i < n; ++i)
  {
    if (eigenvalues(i) > kRankTolerance * scale)
    {
      range.push_back(i);
    }
  }
  const auto r = static_cast<Eigen::Index>(range.size());

  Eigen::MatrixXd F(n, r);
  for (Eigen::Index k = 0; k < r; ++k)
  {
    const Eigen::Index i = range[static_cast<size_t>(k)];
    F.col(k) = eig.eigenvectors().col(i) * std::sqrt(eigenvalues(i));
  }

  const Eigen::Index coneSize = r + 2;
  const Eigen::Index numVars = n + 1;
  const double s = std::sqrt(0.5);

  Eigen::MatrixXd G = Eigen::MatrixXd::Zero(l + coneSize, numVars);
  Eigen::VectorXd h = Eigen::VectorXd::Zero(l + coneSize);

  if (l > 0)
  {
    G.topLeftCorner(l, n) = problem.inequalityMatrix;
    h.head(l) = problem.inequalityBound;
  }

  G(l, n) = -s;
  h(l) = s;
  if (r > 0)
  {
    G.block(l + 1, 0, r, n) = -F.transpose();
  }
  G(l + r + 1, n) = s;
  h(l + r + 1) = s;

  ECOSData data{static_cast<idxint>(numVars), static_cast<idxint>(l),
                static_cast<idxint>(p)};
  data.G_ = ECOSSparseMatrix::fromDense(G);
  data.h_.assign(h.data(), h.data() + h.size());
  data.c_.assign(problem.linear.data(), problem.linear.data() + n);
  data.c_.push_back(1.0);
  data.cone_sizes_.push_back(static_cast<idxint>(coneSize));

  if (p > 0)
  {
    Eigen::MatrixXd equality = Eigen::MatrixXd::Zero(p, numVars);
    equality.leftCols(n) = problem.equalityMatrix;
    data.A_eq_ = ECOSSparseMatrix::fromDense(equality);
    data.b_eq_.assign(problem.equalityBound.data(),
                      problem.equalityBound.data() + p);
  }

  return data;
}

QuadraticProgramSolver::Result ECOSQPSolver::solveReduced(const QuadraticProgram& problem)
{
  Result result;

  ECOSData ecosData = buildConicProblem(problem);
  try
  {
    ecosData.setup();
  }
  catch (const std::runtime_error& e)
  {
    result.status = e.what();
    return result;
  }

  pwork* workspace = ecosData.workspace_.get();
  workspace->stgs->maxit = static_cast<idxint>(max_iterations_);
  workspace->stgs->abstol = tolerance_;
  workspace->stgs->reltol = tolerance_;
  workspace->stgs->feastol = tolerance_;
  workspace->stgs->verbose = 0;

  const idxint exitFlag = ECOS_solve(workspace);

  result.iterations = static_cast<int>(workspace->info->iter);
  result.status = exitFlagDescription(exitFlag);
  result.converged = (exitFlag == ECOS_OPTIMAL ||
                      exitFlag == ECOS_OPTIMAL + ECOS_INACC_OFFSET);
  if (exitFlag == ECOS_OPTIMAL + ECOS_INACC_OFFSET)
  {
    spdlog::warn("ECOSQPSolver: solved to reduced accuracy after {} iterations "
                 "(pres = {}, dres = {})",
                 result.iterations, workspace->info->pres, workspace->info->dres);
  }

  // Drop the epigraph variable t
  result.solution = Eigen::Map<const Eigen::VectorXd>(workspace->x, problem.numVariables());

  return result;
}

}  // namespace lcs_sim
