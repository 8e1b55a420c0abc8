// Ticket: 0006_qp_solver_interface

#include "lcs-sim/src/Optimization/QuadraticProgramSolver.hpp"

#include <stdexcept>

#include "lcs-sim/src/Optimization/ECOS/ECOSQPSolver.hpp"
#include "lcs-sim/src/Optimization/NLoptQPSolver.hpp"

namespace lcs_sim
{

std::string_view toString(QPBackend backend)
{
  switch (backend)
  {
    case QPBackend::NLoptSLSQP:
      return "NLopt SLSQP";
    case QPBackend::ECOS:
      return "ECOS";
  }
  return "unknown";
}

QuadraticProgramSolver::Result QuadraticProgramSolver::solve(
  const QuadraticProgram& problem)
{
  const PresolvedProgram presolved =
    presolveQuadraticProgram(problem, feasibility_tolerance_);

  Result result;
  if (!presolved.feasible)
  {
    result.status = "infeasible: " + presolved.infeasibility;
    return result;
  }

  if (presolved.fullyDetermined())
  {
    result.solution = presolved.fixedValues;
    result.converged = true;
    result.status = "solved by presolve";
  }
  else
  {
    result = solveReduced(presolved.reduced);
    if (result.solution.size() != presolved.reduced.numVariables())
    {
      result.converged = false;
      result.solution.resize(0);
      return result;
    }
    result.solution = presolved.expand(result.solution);
  }

  if (!result.solution.allFinite())
  {
    result.converged = false;
    result.status += "; non-finite solution";
    return result;
  }

  result.objective = problem.objective(result.solution);
  result.maxViolation = problem.maxViolation(result.solution);
  if (result.converged && result.maxViolation > feasibility_tolerance_)
  {
    result.converged = false;
    result.status += "; constraint violation " + std::to_string(result.maxViolation);
  }
  return result;
}

std::unique_ptr<QuadraticProgramSolver> makeQuadraticProgramSolver(
  QPBackend backend,
  double tolerance,
  int maxIterations,
  double feasibilityTolerance)
{
  std::unique_ptr<QuadraticProgramSolver> solver;
  switch (backend)
  {
    case QPBackend::NLoptSLSQP:
      solver = std::make_unique<NLoptQPSolver>(tolerance, maxIterations);
      break;
    case QPBackend::ECOS:
      solver = std::make_unique<ECOSQPSolver>(tolerance, maxIterations);
      break;
  }
  if (!solver)
  {
    throw std::invalid_argument{"makeQuadraticProgramSolver: unknown backend"};
  }
  solver->setFeasibilityTolerance(feasibilityTolerance);
  return solver;
}

}  // namespace lcs_sim
