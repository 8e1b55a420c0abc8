// Ticket: 0007_nlopt_qp_backend

#include "lcs-sim/src/Optimization/NLoptQPSolver.hpp"

#include <nlopt.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace lcs_sim
{

NLoptQPSolver::NLoptQPSolver(double tolerance, int maxIterations)
  : tolerance_{tolerance}, max_iterations_{maxIterations}
{
}

QuadraticProgramSolver::Result NLoptQPSolver::solveReduced(
  const QuadraticProgram& problem)
{
  const auto num_vars = static_cast<unsigned>(problem.numVariables());

  nlopt::opt opt{nlopt::LD_SLSQP, num_vars};

  ObjectiveData obj_data{&problem.hessian, &problem.linear};
  opt.set_min_objective(objective, &obj_data);

  LinearConstraintData ineq_data{&problem.inequalityMatrix, &problem.inequalityBound};
  if (problem.inequalityMatrix.rows() > 0)
  {
    opt.add_inequality_mconstraint(
      linearConstraint,
      &ineq_data,
      std::vector<double>(static_cast<size_t>(problem.inequalityMatrix.rows()),
                          constraint_tolerance_));
  }

  LinearConstraintData eq_data{&problem.equalityMatrix, &problem.equalityBound};
  if (problem.equalityMatrix.rows() > 0)
  {
    opt.add_equality_mconstraint(
      linearConstraint,
      &eq_data,
      std::vector<double>(static_cast<size_t>(problem.equalityMatrix.rows()),
                          constraint_tolerance_));
  }

  opt.set_ftol_rel(tolerance_);
  opt.set_xtol_rel(tolerance_);
  opt.set_maxeval(max_iterations_);

  // Initial point: warm start if provided, otherwise the origin
  std::vector<double> x(num_vars, 0.0);
  if (problem.warmStart.size() == problem.numVariables())
  {
    Eigen::Map<Eigen::VectorXd>{x.data(), problem.numVariables()} = problem.warmStart;
  }

  Result result;
  nlopt::result code = nlopt::FAILURE;
  try
  {
    double final_obj = 0.0;
    code = opt.optimize(x, final_obj);
  }
  catch (const nlopt::roundoff_limited&)
  {
    // x holds the last iterate; feasibility is verified by the caller
    spdlog::warn("NLoptQPSolver: roundoff-limited stop after {} evaluations",
                 opt.get_numevals());
    code = nlopt::ROUNDOFF_LIMITED;
  }
  catch (const std::exception& e)
  {
    result.status = std::string{"NLopt optimization failed: "} + e.what();
    result.iterations = static_cast<int>(opt.get_numevals());
    return result;
  }

  result.solution = Eigen::Map<const Eigen::VectorXd>{x.data(), problem.numVariables()};
  result.iterations = static_cast<int>(opt.get_numevals());
  result.converged = (code == nlopt::SUCCESS ||
                      code == nlopt::FTOL_REACHED ||
                      code == nlopt::XTOL_REACHED ||
                      code == nlopt::ROUNDOFF_LIMITED);

  switch (code)
  {
    case nlopt::SUCCESS:
      result.status = "success";
      break;
    case nlopt::FTOL_REACHED:
      result.status = "ftol reached";
      break;
    case nlopt::XTOL_REACHED:
      result.status = "xtol reached";
      break;
    case nlopt::ROUNDOFF_LIMITED:
      result.status = "roundoff limited";
      break;
    case nlopt::MAXEVAL_REACHED:
      result.status = "evaluation limit reached";
      break;
    default:
      result.status = "NLopt result code " + std::to_string(static_cast<int>(code));
      break;
  }

  return result;
}

double NLoptQPSolver::objective(unsigned n, const double* x, double* grad, void* data)
{
  const auto* obj_data = static_cast<const ObjectiveData*>(data);
  const Eigen::Map<const Eigen::VectorXd> xv{x, static_cast<Eigen::Index>(n)};

  const Eigen::VectorXd Hx = (*obj_data->H) * xv;
  if (grad != nullptr)
  {
    Eigen::Map<Eigen::VectorXd>{grad, static_cast<Eigen::Index>(n)} = Hx + *obj_data->q;
  }
  return 0.5 * xv.dot(Hx) + obj_data->q->dot(xv);
}

void NLoptQPSolver::linearConstraint(unsigned m,
                                     double* result,
                                     unsigned n,
                                     const double* x,
                                     double* grad,
                                     void* data)
{
  const auto* con_data = static_cast<const LinearConstraintData*>(data);
  const auto rows = static_cast<Eigen::Index>(m);
  const auto cols = static_cast<Eigen::Index>(n);
  const Eigen::Map<const Eigen::VectorXd> xv{x, cols};

  Eigen::Map<Eigen::VectorXd>{result, rows} = (*con_data->A) * xv - *con_data->b;

  if (grad != nullptr)
  {
    // NLopt expects grad[i * n + j] = d result_i / d x_j
    using RowMajorMatrix =
      Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    Eigen::Map<RowMajorMatrix>{grad, rows, cols} = *con_data->A;
  }
}

}  // namespace lcs_sim
