// Ticket: 0006_qp_solver_interface

#include "lcs-sim/src/Optimization/QuadraticProgram.hpp"

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lcs_sim;

namespace
{

// Five-row friction pyramid on (fx, fy, fz) at column offset `offset`
void addPyramidRows(QuadraticProgram& problem, Eigen::Index offset, double mu)
{
  const Eigen::Index row = problem.inequalityMatrix.rows();
  problem.inequalityMatrix.conservativeResize(row + 5, problem.numVariables());
  problem.inequalityMatrix.bottomRows(5).setZero();
  problem.inequalityBound.conservativeResize(row + 5);
  problem.inequalityBound.tail(5).setZero();

  Eigen::Matrix<double, 5, 3> block;
  block << 1.0, 0.0, -mu,
           -1.0, 0.0, -mu,
           0.0, 1.0, -mu,
           0.0, -1.0, -mu,
           0.0, 0.0, -1.0;
  problem.inequalityMatrix.block(row, offset, 5, 3) = block;
}

QuadraticProgram twoVertexProblem()
{
  QuadraticProgram problem;
  problem.hessian = Eigen::MatrixXd::Identity(6, 6);
  problem.linear = Eigen::VectorXd::LinSpaced(6, -3.0, 2.0);
  problem.inequalityMatrix.resize(0, 6);
  problem.inequalityBound.resize(0);
  addPyramidRows(problem, 0, 0.5);
  addPyramidRows(problem, 3, 0.5);
  problem.warmStart = Eigen::VectorXd::Constant(6, 100.0);
  return problem;
}

}  // namespace

// ============================================================================
// Validation and evaluation
// ============================================================================

TEST(QuadraticProgram, ValidateAcceptsUnconstrainedProblem)
{
  QuadraticProgram problem;
  problem.hessian = Eigen::MatrixXd::Identity(2, 2);
  problem.linear = Eigen::VectorXd::Zero(2);

  EXPECT_NO_THROW(problem.validate());
  EXPECT_EQ(problem.numVariables(), 2);
}

TEST(QuadraticProgram, ValidateRejectsInconsistentDimensions)
{
  QuadraticProgram empty;
  EXPECT_THROW(empty.validate(), std::invalid_argument);

  QuadraticProgram hessian = twoVertexProblem();
  hessian.hessian = Eigen::MatrixXd::Identity(5, 5);
  EXPECT_THROW(hessian.validate(), std::invalid_argument);

  QuadraticProgram bound = twoVertexProblem();
  bound.inequalityBound.resize(3);
  EXPECT_THROW(bound.validate(), std::invalid_argument);

  QuadraticProgram warm = twoVertexProblem();
  warm.warmStart = Eigen::VectorXd::Zero(4);
  EXPECT_THROW(warm.validate(), std::invalid_argument);
}

TEST(QuadraticProgram, ObjectiveAndViolation)
{
  QuadraticProgram problem;
  problem.hessian = 2.0 * Eigen::MatrixXd::Identity(2, 2);
  problem.linear = Eigen::Vector2d{1.0, -1.0};
  problem.inequalityMatrix = Eigen::RowVector2d{1.0, 0.0};
  problem.inequalityBound = Eigen::VectorXd::Constant(1, 0.5);
  problem.equalityMatrix = Eigen::RowVector2d{0.0, 1.0};
  problem.equalityBound = Eigen::VectorXd::Constant(1, 1.0);

  const Eigen::Vector2d x{2.0, 0.25};

  // (1/2)(2 * 4 + 2 * 0.0625) + 2 - 0.25
  EXPECT_DOUBLE_EQ(problem.objective(x), 5.8125);
  // Inequality exceeds by 1.5, equality misses by 0.75
  EXPECT_DOUBLE_EQ(problem.maxViolation(x), 1.5);
  EXPECT_DOUBLE_EQ(problem.maxViolation(Eigen::Vector2d{0.0, 1.0}), 0.0);
}

// ============================================================================
// Presolve
// ============================================================================

TEST(QuadraticProgram, PresolveKeepsUnpinnedProblemIntact)
{
  const QuadraticProgram problem = twoVertexProblem();
  const PresolvedProgram presolved = presolveQuadraticProgram(problem, 1e-9);

  ASSERT_TRUE(presolved.feasible);
  EXPECT_EQ(presolved.freeVariables.size(), 6u);
  EXPECT_EQ(presolved.reduced.inequalityMatrix.rows(), 10);
  EXPECT_TRUE(presolved.reduced.hessian == problem.hessian);
  EXPECT_TRUE(presolved.reduced.linear == problem.linear);
  EXPECT_TRUE(presolved.reduced.warmStart == problem.warmStart);
}

TEST(QuadraticProgram, PinnedNormalForceEliminatesVertex)
{
  QuadraticProgram problem = twoVertexProblem();
  problem.equalityMatrix = Eigen::MatrixXd::Zero(2, 6);
  problem.equalityMatrix(1, 5) = 1.0;
  problem.equalityBound = Eigen::VectorXd::Zero(2);

  const PresolvedProgram presolved = presolveQuadraticProgram(problem, 1e-9);

  ASSERT_TRUE(presolved.feasible);
  EXPECT_EQ(presolved.freeVariables, (std::vector<Eigen::Index>{0, 1, 2}));
  EXPECT_EQ(presolved.reduced.numVariables(), 3);
  EXPECT_EQ(presolved.reduced.inequalityMatrix.rows(), 5);
  EXPECT_EQ(presolved.reduced.inequalityMatrix.cols(), 3);
  // The all-zero equality row and the pinned row are both gone
  EXPECT_EQ(presolved.reduced.equalityMatrix.rows(), 0);
  EXPECT_EQ(presolved.reduced.warmStart.size(), 3);
  EXPECT_TRUE(presolved.fixedValues.isZero(0.0));
}

TEST(QuadraticProgram, AllVerticesPinnedIsFullyDetermined)
{
  QuadraticProgram problem = twoVertexProblem();
  problem.equalityMatrix = Eigen::MatrixXd::Zero(2, 6);
  problem.equalityMatrix(0, 2) = 1.0;
  problem.equalityMatrix(1, 5) = 1.0;
  problem.equalityBound = Eigen::VectorXd::Zero(2);

  const PresolvedProgram presolved = presolveQuadraticProgram(problem, 1e-9);

  ASSERT_TRUE(presolved.feasible);
  EXPECT_TRUE(presolved.fullyDetermined());
  EXPECT_TRUE(presolved.fixedValues.isZero(0.0));
}

TEST(QuadraticProgram, FixedValuesShiftLinearTerm)
{
  QuadraticProgram problem;
  problem.hessian.resize(2, 2);
  problem.hessian << 2.0, 1.0,
                     1.0, 2.0;
  problem.linear = Eigen::Vector2d{1.0, 1.0};
  problem.equalityMatrix = Eigen::RowVector2d{0.0, 1.0};
  problem.equalityBound = Eigen::VectorXd::Constant(1, 3.0);

  const PresolvedProgram presolved = presolveQuadraticProgram(problem, 1e-9);

  ASSERT_TRUE(presolved.feasible);
  ASSERT_EQ(presolved.reduced.numVariables(), 1);
  EXPECT_DOUBLE_EQ(presolved.reduced.hessian(0, 0), 2.0);
  EXPECT_DOUBLE_EQ(presolved.reduced.linear(0), 4.0);

  const Eigen::VectorXd full = presolved.expand(Eigen::VectorXd::Constant(1, 5.0));
  EXPECT_TRUE(full.isApprox(Eigen::Vector2d{5.0, 3.0}));
  EXPECT_THROW((void)presolved.expand(Eigen::VectorXd::Zero(2)), std::invalid_argument);
}

TEST(QuadraticProgram, CollapsedBoundsFixVariable)
{
  QuadraticProgram problem;
  problem.hessian = Eigen::MatrixXd::Identity(2, 2);
  problem.linear = Eigen::VectorXd::Zero(2);
  problem.inequalityMatrix.resize(2, 2);
  problem.inequalityMatrix << 1.0, 0.0,
                              -1.0, 0.0;
  problem.inequalityBound = Eigen::Vector2d{1.0, -1.0};

  const PresolvedProgram presolved = presolveQuadraticProgram(problem, 1e-9);

  ASSERT_TRUE(presolved.feasible);
  EXPECT_EQ(presolved.freeVariables, (std::vector<Eigen::Index>{1}));
  EXPECT_DOUBLE_EQ(presolved.fixedValues(0), 1.0);
  EXPECT_EQ(presolved.reduced.inequalityMatrix.rows(), 0);
}

TEST(QuadraticProgram, EmptyBoundsAreInfeasible)
{
  QuadraticProgram problem;
  problem.hessian = Eigen::MatrixXd::Identity(1, 1);
  problem.linear = Eigen::VectorXd::Zero(1);
  problem.inequalityMatrix.resize(2, 1);
  problem.inequalityMatrix << 1.0,
                              -1.0;
  problem.inequalityBound = Eigen::Vector2d{0.0, -1.0};

  const PresolvedProgram presolved = presolveQuadraticProgram(problem, 1e-9);

  EXPECT_FALSE(presolved.feasible);
  EXPECT_NE(presolved.infeasibility.find("variable 0"), std::string::npos);
}

TEST(QuadraticProgram, FixedValueViolatingInequalityIsInfeasible)
{
  // x == 1 and x >= 2
  QuadraticProgram problem;
  problem.hessian = Eigen::MatrixXd::Identity(1, 1);
  problem.linear = Eigen::VectorXd::Zero(1);
  problem.inequalityMatrix = Eigen::MatrixXd::Constant(1, 1, -1.0);
  problem.inequalityBound = Eigen::VectorXd::Constant(1, -2.0);
  problem.equalityMatrix = Eigen::MatrixXd::Constant(1, 1, 1.0);
  problem.equalityBound = Eigen::VectorXd::Constant(1, 1.0);

  const PresolvedProgram presolved = presolveQuadraticProgram(problem, 1e-9);

  EXPECT_FALSE(presolved.feasible);
  EXPECT_NE(presolved.infeasibility.find("inequality row 0"), std::string::npos);
}
