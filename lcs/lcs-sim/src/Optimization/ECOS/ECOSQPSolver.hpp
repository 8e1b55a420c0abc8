// Ticket: 0008_ecos_qp_backend

#ifndef LCS_SIM_OPTIMIZATION_ECOS_ECOS_QP_SOLVER_HPP
#define LCS_SIM_OPTIMIZATION_ECOS_ECOS_QP_SOLVER_HPP

#include <Eigen/Dense>
#include <string_view>

#include "lcs-sim/src/Optimization/ECOS/ECOSData.hpp"
#include "lcs-sim/src/Optimization/QuadraticProgramSolver.hpp"

namespace lcs_sim
{

/**
 * @brief ECOS interior-point backend for convex QPs
 *
 * The QP is lifted into an SOCP with an epigraph variable t. With
 * H = F F^T (F from the eigendecomposition of H, rank r):
 *
 *   minimize    q^T x + t
 *   subject to  A x <= b                                   (orthant, l rows)
 *               || [ (1 - t)/sqrt(2) ; F^T x ] || <= (1 + t)/sqrt(2)
 *               Aeq x == beq
 *
 * The cone is equivalent to (1/2) ||F^T x||^2 <= t. In ECOS form
 * h - G [x; t] is in K, so the cone block of G has r + 2 rows:
 *
 *   row 0:       G = [ 0,    -1/sqrt(2) ],  h = 1/sqrt(2)
 *   rows 1..r:   G = [ -F^T,  0         ],  h = 0
 *   row r + 1:   G = [ 0,    +1/sqrt(2) ],  h = 1/sqrt(2)
 *
 * Interior-point methods cannot use a primal warm start; it is ignored.
 *
 * @ticket 0008_ecos_qp_backend
 */
class ECOSQPSolver final : public QuadraticProgramSolver
{
public:
  /// Default settings (1e-9 tolerances, 100 iterations)
  ECOSQPSolver() = default;

  ECOSQPSolver(double tolerance, int maxIterations);

  ~ECOSQPSolver() override = default;

  [[nodiscard]] std::string_view name() const override
  {
    return "ECOS";
  }

  /// Set abstol, reltol and feastol (default: 1e-9)
  void setTolerance(double tol)
  {
    tolerance_ = tol;
  }

  /// Set maximum interior-point iterations (default: 100)
  void setMaxIterations(int n)
  {
    max_iterations_ = n;
  }

  [[nodiscard]] double getTolerance() const
  {
    return tolerance_;
  }

  [[nodiscard]] int getMaxIterations() const
  {
    return max_iterations_;
  }

  /**
   * @brief Build the SOCP data for a problem without calling ECOS_setup()
   *
   * Variables are [x; t]. Exposed so the lifting can be inspected.
   *
   * @throws std::invalid_argument if H has a negative eigenvalue beyond
   *         round-off
   */
  [[nodiscard]] static ECOSData buildConicProblem(const QuadraticProgram& problem);

  ECOSQPSolver(const ECOSQPSolver&) = default;
  ECOSQPSolver& operator=(const ECOSQPSolver&) = default;
  ECOSQPSolver(ECOSQPSolver&&) noexcept = default;
  ECOSQPSolver& operator=(ECOSQPSolver&&) noexcept = default;

protected:
  [[nodiscard]] Result solveReduced(const QuadraticProgram& problem) override;

private:
  double tolerance_{1e-9};
  int max_iterations_{100};
};

}  // namespace lcs_sim

#endif  // LCS_SIM_OPTIMIZATION_ECOS_ECOS_QP_SOLVER_HPP
