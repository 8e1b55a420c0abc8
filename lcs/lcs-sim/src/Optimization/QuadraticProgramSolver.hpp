// Ticket: 0006_qp_solver_interface

#ifndef LCS_SIM_OPTIMIZATION_QUADRATIC_PROGRAM_SOLVER_HPP
#define LCS_SIM_OPTIMIZATION_QUADRATIC_PROGRAM_SOLVER_HPP

#include <Eigen/Dense>
#include <limits>
#include <memory>
#include <string>
#include <string_view>

#include "lcs-sim/src/Optimization/QuadraticProgram.hpp"

namespace lcs_sim
{

/// Available convex QP backends
enum class QPBackend
{
  NLoptSLSQP,  ///< NLopt sequential quadratic programming (active set)
  ECOS         ///< ECOS interior-point conic solver
};

[[nodiscard]] std::string_view toString(QPBackend backend);

/**
 * @brief Narrow interface to a convex QP routine
 *
 * solve() runs presolveQuadraticProgram(), hands the reduced problem to the
 * backend through solveReduced(), scatters the answer back and verifies it
 * against the full problem's constraints. A result that violates them by more
 * than the feasibility tolerance is reported as not converged.
 *
 * Failures are reported in Result, never thrown. Only malformed input
 * (inconsistent dimensions) throws std::invalid_argument.
 *
 * @ticket 0006_qp_solver_interface
 */
class QuadraticProgramSolver
{
public:
  struct Result
  {
    Eigen::VectorXd solution;  ///< Full variable vector (empty if none produced)
    bool converged{false};
    std::string status;
    int iterations{0};
    double objective{std::numeric_limits<double>::quiet_NaN()};
    double maxViolation{std::numeric_limits<double>::quiet_NaN()};
  };

  virtual ~QuadraticProgramSolver() = default;

  /// @throws std::invalid_argument on inconsistent problem dimensions
  [[nodiscard]] Result solve(const QuadraticProgram& problem);

  [[nodiscard]] virtual std::string_view name() const = 0;

  /// Set maximum accepted constraint violation (default: 1e-6)
  void setFeasibilityTolerance(double tol)
  {
    feasibility_tolerance_ = tol;
  }

  [[nodiscard]] double getFeasibilityTolerance() const
  {
    return feasibility_tolerance_;
  }

protected:
  QuadraticProgramSolver() = default;
  QuadraticProgramSolver(const QuadraticProgramSolver&) = default;
  QuadraticProgramSolver& operator=(const QuadraticProgramSolver&) = default;
  QuadraticProgramSolver(QuadraticProgramSolver&&) noexcept = default;
  QuadraticProgramSolver& operator=(QuadraticProgramSolver&&) noexcept = default;

  /**
   * @brief Solve a presolved problem with at least one free variable
   *
   * Only `solution`, `converged`, `status` and `iterations` need to be set;
   * the caller recomputes objective and violation on the full problem.
   */
  [[nodiscard]] virtual Result solveReduced(const QuadraticProgram& problem) = 0;

private:
  double feasibility_tolerance_{1e-6};
};

/**
 * @brief Build a backend
 * @param backend Backend selection
 * @param tolerance Convergence tolerance handed to the backend
 * @param maxIterations Iteration (NLopt: evaluation) limit
 * @param feasibilityTolerance Maximum accepted constraint violation
 * @ticket 0006_qp_solver_interface
 */
[[nodiscard]] std::unique_ptr<QuadraticProgramSolver> makeQuadraticProgramSolver(
  QPBackend backend,
  double tolerance,
  int maxIterations,
  double feasibilityTolerance = 1e-6);

}  // namespace lcs_sim

#endif  // LCS_SIM_OPTIMIZATION_QUADRATIC_PROGRAM_SOLVER_HPP
