// Ticket: 0006_qp_solver_interface

#ifndef LCS_SIM_OPTIMIZATION_QUADRATIC_PROGRAM_HPP
#define LCS_SIM_OPTIMIZATION_QUADRATIC_PROGRAM_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace lcs_sim
{

/**
 * @brief Convex quadratic program in inequality/equality form
 *
 *   minimize    (1/2) x^T H x + q^T x
 *   subject to  A x <= b
 *               Aeq x == beq
 *
 * H must be symmetric positive semidefinite. Either constraint block may have
 * zero rows. warmStart is optional (empty or n entries) and only used by
 * backends that accept an initial point.
 *
 * @ticket 0006_qp_solver_interface
 */
struct QuadraticProgram
{
  Eigen::MatrixXd hessian;
  Eigen::VectorXd linear;
  Eigen::MatrixXd inequalityMatrix;
  Eigen::VectorXd inequalityBound;
  Eigen::MatrixXd equalityMatrix;
  Eigen::VectorXd equalityBound;
  Eigen::VectorXd warmStart;

  [[nodiscard]] Eigen::Index numVariables() const
  {
    return linear.size();
  }

  /// @throws std::invalid_argument on inconsistent dimensions
  void validate() const;

  /// (1/2) x^T H x + q^T x
  [[nodiscard]] double objective(const Eigen::VectorXd& x) const;

  /// Largest violation over A x <= b and |Aeq x - beq|, 0 if feasible
  [[nodiscard]] double maxViolation(const Eigen::VectorXd& x) const;
};

/**
 * @brief Problem left after eliminating variables fixed by singleton rows
 *
 * `reduced` acts on the free variables only, in ascending index order.
 * Fixed variables have been substituted into the linear term and the
 * remaining constraint bounds.
 *
 * @ticket 0006_qp_solver_interface
 */
struct PresolvedProgram
{
  QuadraticProgram reduced;
  std::vector<Eigen::Index> freeVariables;
  std::vector<bool> fixed;
  Eigen::VectorXd fixedValues;  ///< Full size; zero at free variables
  bool feasible{true};
  std::string infeasibility;    ///< Reason when feasible == false

  [[nodiscard]] bool fullyDetermined() const
  {
    return freeVariables.empty();
  }

  /// Scatter a reduced solution back into the full variable vector
  /// @throws std::invalid_argument if the size does not match freeVariables
  [[nodiscard]] Eigen::VectorXd expand(const Eigen::VectorXd& reducedSolution) const;
};

/**
 * @brief Eliminate variables pinned by the constraint structure
 *
 * Repeats until nothing changes:
 * - an equality row with a single free variable fixes that variable,
 * - an inequality row with a single free variable tightens its bound,
 * - a variable whose bounds collapse to within tolerance is fixed.
 *
 * Rows without free variables are dropped after checking them against the
 * fixed values. For the contact problem this removes the forces of vertices
 * out of contact (fz = 0 forces fx = fy = 0 through the pyramid rows), which
 * keeps the remaining problem strictly feasible.
 *
 * @param problem Validated problem
 * @param tolerance Feasibility tolerance for dropped rows and collapsed bounds
 * @throws std::invalid_argument on inconsistent dimensions
 * @ticket 0006_qp_solver_interface
 */
[[nodiscard]] PresolvedProgram presolveQuadraticProgram(const QuadraticProgram& problem,
                                                        double tolerance);

}  // namespace lcs_sim

#endif  // LCS_SIM_OPTIMIZATION_QUADRATIC_PROGRAM_HPP
