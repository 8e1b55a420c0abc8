// Ticket: 0006_qp_solver_interface

#include "lcs-sim/src/Optimization/QuadraticProgram.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace lcs_sim
{

namespace
{

std::string shape(const Eigen::MatrixXd& m)
{
  return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

void validateConstraintBlock(const char* label,
                             const Eigen::MatrixXd& matrix,
                             const Eigen::VectorXd& bound,
                             Eigen::Index n)
{
  if (matrix.rows() == 0 && bound.size() == 0)
  {
    return;
  }
  if (matrix.cols() != n || bound.size() != matrix.rows())
  {
    throw std::invalid_argument{std::string{"QuadraticProgram: "} + label +
                                " block is " + shape(matrix) + " with " +
                                std::to_string(bound.size()) +
                                " bounds, expected m x " + std::to_string(n)};
  }
}

/// Row contribution split between fixed and free variables
struct RowSummary
{
  int freeCount{0};
  Eigen::Index freeColumn{-1};
  double coefficient{0.0};
  double residual{0.0};  ///< rhs minus the fixed-variable contribution
};

RowSummary summarizeRow(const Eigen::MatrixXd& matrix,
                        Eigen::Index row,
                        double rhs,
                        const std::vector<bool>& fixed,
                        const Eigen::VectorXd& fixedValues)
{
  RowSummary summary;
  summary.residual = rhs;
  for (Eigen::Index j = 0; j < matrix.cols(); ++j)
  {
    const double a = matrix(row, j);
    if (a == 0.0)
    {
      continue;
    }
    if (fixed[static_cast<size_t>(j)])
    {
      summary.residual -= a * fixedValues(j);
    }
    else
    {
      ++summary.freeCount;
      summary.freeColumn = j;
      summary.coefficient = a;
    }
  }
  return summary;
}

}  // namespace

void QuadraticProgram::validate() const
{
  const Eigen::Index n = numVariables();
  if (n == 0)
  {
    throw std::invalid_argument{"QuadraticProgram: problem has no variables"};
  }
  if (hessian.rows() != n || hessian.cols() != n)
  {
    throw std::invalid_argument{"QuadraticProgram: Hessian is " + shape(hessian) +
                                ", expected " + std::to_string(n) + "x" +
                                std::to_string(n)};
  }
  validateConstraintBlock("inequality", inequalityMatrix, inequalityBound, n);
  validateConstraintBlock("equality", equalityMatrix, equalityBound, n);
  if (warmStart.size() != 0 && warmStart.size() != n)
  {
    throw std::invalid_argument{"QuadraticProgram: warm start has " +
                                std::to_string(warmStart.size()) +
                                " entries, expected " + std::to_string(n)};
  }
}

double QuadraticProgram::objective(const Eigen::VectorXd& x) const
{
  return 0.5 * x.dot(hessian * x) + linear.dot(x);
}

double QuadraticProgram::maxViolation(const Eigen::VectorXd& x) const
{
  double violation = 0.0;
  if (inequalityMatrix.rows() > 0)
  {
    violation = std::max(violation,
                         (inequalityMatrix * x - inequalityBound).maxCoeff());
  }
  if (equalityMatrix.rows() > 0)
  {
    violation = std::max(
      violation, (equalityMatrix * x - equalityBound).cwiseAbs().maxCoeff());
  }
  return violation;
}

Eigen::VectorXd PresolvedProgram::expand(const Eigen::VectorXd& reducedSolution) const
{
  if (reducedSolution.size() != static_cast<Eigen::Index>(freeVariables.size()))
  {
    throw std::invalid_argument{
      "PresolvedProgram::expand: expected " +
      std::to_string(freeVariables.size()) + " free values, got " +
      std::to_string(reducedSolution.size())};
  }

  Eigen::VectorXd full = fixedValues;
  for (size_t i = 0; i < freeVariables.size(); ++i)
  {
    full(freeVariables[i]) = reducedSolution(static_cast<Eigen::Index>(i));
  }
  return full;
}

PresolvedProgram presolveQuadraticProgram(const QuadraticProgram& problem,
                                          double tolerance)
{
  problem.validate();

  const Eigen::Index n = problem.numVariables();
  constexpr double kInf = std::numeric_limits<double>::infinity();

  PresolvedProgram result;
  result.fixed.assign(static_cast<size_t>(n), false);
  result.fixedValues = Eigen::VectorXd::Zero(n);

  Eigen::VectorXd lower = Eigen::VectorXd::Constant(n, -kInf);
  Eigen::VectorXd upper = Eigen::VectorXd::Constant(n, kInf);

  auto fix = [&](Eigen::Index j, double value) {
    result.fixed[static_cast<size_t>(j)] = true;
    result.fixedValues(j) = value;
  };

  bool changed = true;
  while (changed && result.feasible)
  {
    changed = false;

    for (Eigen::Index r = 0; r < problem.equalityMatrix.rows(); ++r)
    {
      const RowSummary s = summarizeRow(problem.equalityMatrix, r,
                                        problem.equalityBound(r),
                                        result.fixed, result.fixedValues);
      if (s.freeCount == 1)
      {
        fix(s.freeColumn, s.residual / s.coefficient);
        changed = true;
      }
    }

    for (Eigen::Index r = 0; r < problem.inequalityMatrix.rows(); ++r)
    {
      const RowSummary s = summarizeRow(problem.inequalityMatrix, r,
                                        problem.inequalityBound(r),
                                        result.fixed, result.fixedValues);
      if (s.freeCount != 1)
      {
        continue;
      }
      const double bound = s.residual / s.coefficient;
      if (s.coefficient > 0.0)
      {
        upper(s.freeColumn) = std::min(upper(s.freeColumn), bound);
      }
      else
      {
        lower(s.freeColumn) = std::max(lower(s.freeColumn), bound);
      }
    }

    for (Eigen::Index j = 0; j < n; ++j)
    {
      if (result.fixed[static_cast<size_t>(j)])
      {
        continue;
      }
      if (lower(j) > upper(j) + tolerance)
      {
        result.feasible = false;
        result.infeasibility = "bounds of variable " + std::to_string(j) +
                               " are empty [" + std::to_string(lower(j)) +
                               ", " + std::to_string(upper(j)) + "]";
        break;
      }
      if (upper(j) - lower(j) <= tolerance)
      {
        fix(j, 0.5 * (lower(j) + upper(j)));
        changed = true;
      }
    }
  }

  if (!result.feasible)
  {
    return result;
  }

  for (Eigen::Index j = 0; j < n; ++j)
  {
    if (!result.fixed[static_cast<size_t>(j)])
    {
      result.freeVariables.push_back(j);
    }
  }
  const auto m = static_cast<Eigen::Index>(result.freeVariables.size());

  // Rows whose variables are all fixed reduce to a constant check
  auto reduceBlock = [&](const Eigen::MatrixXd& matrix,
                         const Eigen::VectorXd& bound,
                         bool isEquality,
                         Eigen::MatrixXd& reducedMatrix,
                         Eigen::VectorXd& reducedBound) {
    std::vector<Eigen::Index> kept;
    std::vector<double> residuals;
    for (Eigen::Index r = 0; r < matrix.rows() && result.feasible; ++r)
    {
      const RowSummary s = summarizeRow(matrix, r, bound(r), result.fixed,
                                        result.fixedValues);
      if (s.freeCount > 0)
      {
        kept.push_back(r);
        residuals.push_back(s.residual);
        continue;
      }
      const bool violated = isEquality ? std::abs(s.residual) > tolerance
                                       : s.residual < -tolerance;
      if (violated)
      {
        result.feasible = false;
        result.infeasibility = std::string{isEquality ? "equality" : "inequality"} +
                               " row " + std::to_string(r) +
                               " is violated by the fixed variables (residual " +
                               std::to_string(s.residual) + ")";
      }
    }

    const auto rows = static_cast<Eigen::Index>(kept.size());
    reducedMatrix.resize(rows, m);
    reducedBound.resize(rows);
    for (Eigen::Index i = 0; i < rows; ++i)
    {
      for (Eigen::Index k = 0; k < m; ++k)
      {
        reducedMatrix(i, k) =
          matrix(kept[static_cast<size_t>(i)], result.freeVariables[static_cast<size_t>(k)]);
      }
      reducedBound(i) = residuals[static_cast<size_t>(i)];
    }
  };

  QuadraticProgram& reduced = result.reduced;
  reduceBlock(problem.inequalityMatrix, problem.inequalityBound, false,
              reduced.inequalityMatrix, reduced.inequalityBound);
  reduceBlock(problem.equalityMatrix, problem.equalityBound, true,
              reduced.equalityMatrix, reduced.equalityBound);
  if (!result.feasible)
  {
    return result;
  }

  // q_F + H_FX x_X
  const Eigen::VectorXd shiftedLinear =
    problem.linear + problem.hessian * result.fixedValues;

  reduced.hessian.resize(m, m);
  reduced.linear.resize(m);
  if (problem.warmStart.size() == n)
  {
    reduced.warmStart.resize(m);
  }
  for (Eigen::Index i = 0; i < m; ++i)
  {
    const Eigen::Index fi = result.freeVariables[static_cast<size_t>(i)];
    reduced.linear(i) = shiftedLinear(fi);
    if (problem.warmStart.size() == n)
    {
      reduced.warmStart(i) = problem.warmStart(fi);
    }
    for (Eigen::Index k = 0; k < m; ++k)
    {
      reduced.hessian(i, k) =
        problem.hessian(fi, result.freeVariables[static_cast<size_t>(k)]);
    }
  }

  return result;
}

}  // namespace lcs_sim
