// Ticket: 0007_nlopt_qp_backend

#ifndef LCS_SIM_OPTIMIZATION_NLOPT_QP_SOLVER_HPP
#define LCS_SIM_OPTIMIZATION_NLOPT_QP_SOLVER_HPP

#include <Eigen/Dense>
#include <string_view>

#include "lcs-sim/src/Optimization/QuadraticProgramSolver.hpp"

namespace lcs_sim
{

/**
 * @brief NLopt SLSQP backend for linearly constrained QPs
 *
 * The objective (1/2) x^T H x + q^T x and both constraint blocks are passed
 * with analytic gradients. Inequalities are registered as one vector
 * constraint A x - b <= 0 and equalities as Aeq x - beq = 0. The warm start
 * is the initial point; without one the solve starts from zero.
 *
 * SLSQP is an active-set SQP method, so on a QP it terminates after a few
 * major iterations. A roundoff-limited stop is accepted (with a warning)
 * when the returned point is feasible.
 *
 * @ticket 0007_nlopt_qp_backend
 */
class NLoptQPSolver final : public QuadraticProgramSolver
{
public:
  /// Default settings (1e-9 relative tolerance, 1000 evaluations)
  NLoptQPSolver() = default;

  NLoptQPSolver(double tolerance, int maxIterations);

  ~NLoptQPSolver() override = default;

  [[nodiscard]] std::string_view name() const override
  {
    return "NLopt SLSQP";
  }

  /// Set relative tolerance on objective and variables (default: 1e-9)
  void setTolerance(double tol)
  {
    tolerance_ = tol;
  }

  /// Set maximum objective evaluations (default: 1000)
  void setMaxIterations(int n)
  {
    max_iterations_ = n;
  }

  /// Set absolute tolerance on each constraint row (default: 1e-8)
  void setConstraintTolerance(double tol)
  {
    constraint_tolerance_ = tol;
  }

  [[nodiscard]] double getTolerance() const
  {
    return tolerance_;
  }

  [[nodiscard]] int getMaxIterations() const
  {
    return max_iterations_;
  }

  [[nodiscard]] double getConstraintTolerance() const
  {
    return constraint_tolerance_;
  }

  NLoptQPSolver(const NLoptQPSolver&) = default;
  NLoptQPSolver& operator=(const NLoptQPSolver&) = default;
  NLoptQPSolver(NLoptQPSolver&&) noexcept = default;
  NLoptQPSolver& operator=(NLoptQPSolver&&) noexcept = default;

protected:
  [[nodiscard]] Result solveReduced(const QuadraticProgram& problem) override;

private:
  /// Data passed to the objective callback
  struct ObjectiveData
  {
    const Eigen::MatrixXd* H;
    const Eigen::VectorXd* q;
  };

  /// Data passed to a linear vector constraint callback
  struct LinearConstraintData
  {
    const Eigen::MatrixXd* A;
    const Eigen::VectorXd* b;
  };

  /**
   * @brief f(x) = (1/2) x^T H x + q^T x, grad = H x + q
   */
  static double objective(unsigned n, const double* x, double* grad, void* data);

  /**
   * @brief Vector constraint result = A x - b, grad (row-major m x n) = A
   */
  static void linearConstraint(unsigned m,
                               double* result,
                               unsigned n,
                               const double* x,
                               double* grad,
                               void* data);

  double tolerance_{1e-9};
  int max_iterations_{1000};
  double constraint_tolerance_{1e-8};
};

}  // namespace lcs_sim

#endif  // LCS_SIM_OPTIMIZATION_NLOPT_QP_SOLVER_HPP
