// Ticket: 0001_foot_contact_solver
// Ticket: 0010_contact_step_diagnostics

#include "lcs-sim/src/Contact/ContactSolver.hpp"

#include <spdlog/fmt/ranges.h>
#include <stdexcept>
#include <string>
#include <utility>

#include "lcs-sim/src/Contact/ContactErrors.hpp"
#include "lcs-sim/src/Contact/FootKinematics.hpp"
#include "lcs-sim/src/Contact/WrenchAssembly.hpp"

namespace lcs_sim
{

namespace
{

const ContactSolverConfig& validated(const ContactSolverConfig& config)
{
  config.validate();
  return config;
}

ContactSolverConfig defaultConfig(const Eigen::MatrixXd& footprint,
                                  int actuatedDofs,
                                  double frictionCoefficient)
{
  ContactSolverConfig config;
  config.footprint = footprint;
  config.actuatedDofs = actuatedDofs;
  config.frictionCoefficient = frictionCoefficient;
  return config;
}

/// "11110000" style rendering, left foot first
std::string flagsToString(const ContactFlags& flags)
{
  std::string text;
  text.reserve(flags.size());
  for (bool flag : flags)
  {
    text.push_back(flag ? '1' : '0');
  }
  return text;
}

void requireSize(const char* name, Eigen::Index actual, Eigen::Index expected)
{
  if (actual != expected)
  {
    throw std::invalid_argument{std::string{"ContactSolver::computeContact: "} +
                                name + " has " + std::to_string(actual) +
                                " entries, expected " + std::to_string(expected)};
  }
}

template <typename Derived>
void requireFinite(const char* name, const Eigen::MatrixBase<Derived>& value)
{
  if (!value.allFinite())
  {
    throw std::invalid_argument{std::string{"ContactSolver::computeContact: "} +
                                name + " contains non-finite values"};
  }
}

}  // namespace

ContactSolver::ContactSolver(const ContactSolverConfig& config,
                             std::shared_ptr<spdlog::logger> logger)
  : ContactSolver{config,
                  makeQuadraticProgramSolver(validated(config).backend,
                                             config.solverTolerance,
                                             config.solverMaxIterations,
                                             config.feasibilityTolerance),
                  std::move(logger)}
{
}

ContactSolver::ContactSolver(const Eigen::MatrixXd& footprint,
                             int actuatedDofs,
                             double frictionCoefficient)
  : ContactSolver{defaultConfig(footprint, actuatedDofs, frictionCoefficient)}
{
}

ContactSolver::ContactSolver(const ContactSolverConfig& config,
                             std::unique_ptr<QuadraticProgramSolver> qpSolver,
                             std::shared_ptr<spdlog::logger> logger)
  : config_{validated(config)},
    logger_{logger ? std::move(logger) : spdlog::default_logger()},
    geometry_{config_.footprint},
    pyramid_{config_.frictionCoefficient},
    selector_{config_.actuatedDofs},
    impact_projector_{config_.impactRankTolerance},
    qp_solver_{std::move(qpSolver)},
    equality_matrix_{Eigen::MatrixXd::Zero(kNumVertices, kNumForceVariables)},
    equality_bound_{Eigen::VectorXd::Zero(kNumVertices)},
    warm_start_{Eigen::VectorXd::Constant(kNumForceVariables, config_.warmStartForce)}
{
  if (!qp_solver_)
  {
    throw std::invalid_argument{"ContactSolver: QP solver must not be null"};
  }

  logger_->debug("ContactSolver: {} actuated DOFs, mu = {}, QP backend = {}, "
                 "impact rank tolerance = {}",
                 config_.actuatedDofs, config_.frictionCoefficient,
                 qp_solver_->name(), impact_projector_.getRankTolerance());
}

ContactStepResult ContactSolver::computeContact(const RobotDynamics& robot,
                                                const Eigen::VectorXd& torque,
                                                const Eigen::VectorXd& externalWrench,
                                                const Vector6d& baseVelocity,
                                                const Eigen::VectorXd& jointVelocity)
{
  const Eigen::Index n = selector_.generalizedDofs();
  requireSize("torque", torque.size(), selector_.actuatedDofs());
  requireSize("externalWrench", externalWrench.size(), n);
  requireSize("jointVelocity", jointVelocity.size(), selector_.actuatedDofs());
  requireFinite("torque", torque);
  requireFinite("externalWrench", externalWrench);
  requireFinite("baseVelocity", baseVelocity);
  requireFinite("jointVelocity", jointVelocity);

  const Eigen::MatrixXd mass = robot.massMatrix();
  const Eigen::VectorXd bias = robot.biasForces();
  if (mass.rows() != n || mass.cols() != n)
  {
    throw std::invalid_argument{
      "ContactSolver::computeContact: mass matrix is " +
      std::to_string(mass.rows()) + "x" + std::to_string(mass.cols()) +
      ", expected " + std::to_string(n) + "x" + std::to_string(n)};
  }
  requireSize("biasForces", bias.size(), n);
  requireFinite("mass matrix", mass);
  requireFinite("biasForces", bias);

  const FeetPair<Eigen::Matrix4d> transforms = robot.feetTransforms();
  requireFinite("left foot transform", transforms.left);
  requireFinite("right foot transform", transforms.right);

  // Jacobian assembly
  const VertexJacobians kinematics = foot_kinematics::assembleVertexJacobians(
    geometry_, transforms, robot.feetJacobians(), robot.feetJacobianDotNu());
  if (kinematics.jacobian.cols() != n)
  {
    throw std::invalid_argument{
      "ContactSolver::computeContact: foot Jacobians have " +
      std::to_string(kinematics.jacobian.cols()) + " columns, expected " +
      std::to_string(n)};
  }
  requireFinite("foot Jacobians", kinematics.jacobian);
  requireFinite("foot Jacobian derivative terms", kinematics.jacobianDotNu);

  // Contact detection on a working copy; committed only if the step succeeds
  ContactState state = state_;
  const VertexHeights heights =
    foot_kinematics::computeVertexHeights(geometry_, transforms);
  state.current = foot_kinematics::detectContact(heights);
  logger_->trace("ContactSolver: contact flags previous = {}, current = {} ({} in contact)",
                 flagsToString(state.previous), flagsToString(state.current),
                 state.currentContactCount());

  // Free dynamics
  const Eigen::LLT<Eigen::MatrixXd> massLlt{mass};
  if (massLlt.info() != Eigen::Success)
  {
    logger_->error("ContactSolver: mass matrix is not positive definite");
    throw SolverFailure{SolverFailure::Stage::FreeDynamics,
                        "ContactSolver: mass matrix is not positive definite"};
  }
  const Eigen::VectorXd freeAcceleration =
    massLlt.solve(selector_.apply(torque) + externalWrench - bias);
  const ContactForceVector vertexAcceleration =
    kinematics.jacobian * freeAcceleration + kinematics.jacobianDotNu;

  // Force solve
  Eigen::MatrixXd equalityMatrix = equalityConstraints(state.current);

  QuadraticProgram problem;
  problem.hessian = kinematics.jacobian * massLlt.solve(kinematics.jacobian.transpose());
  if (problem.hessian != problem.hessian.transpose())
  {
    problem.hessian = 0.5 * (problem.hessian + problem.hessian.transpose()).eval();
  }
  problem.linear = vertexAcceleration;
  problem.inequalityMatrix = pyramid_.inequalityMatrix();
  problem.inequalityBound = pyramid_.inequalityBound();
  problem.equalityMatrix = equalityMatrix;
  problem.equalityBound = equality_bound_;
  problem.warmStart = warm_start_;

  const QuadraticProgramSolver::Result solve = qp_solver_->solve(problem);
  if (!solve.converged)
  {
    logger_->error("ContactSolver: {} failed after {} iterations: {}",
                   qp_solver_->name(), solve.iterations, solve.status);
    throw SolverFailure{SolverFailure::Stage::ForceOptimization,
                        "ContactSolver: contact force optimization failed (" +
                          std::string{qp_solver_->name()} + ": " + solve.status +
                          ")"};
  }
  const ContactForceVector forces = solve.solution;

  // Wrenches
  ContactStepResult result;
  result.totalWrench =
    externalWrench + wrench_assembly::generalizedContactWrench(kinematics.jacobian, forces);
  const FeetPair<Vector6d> soleWrenches =
    wrench_assembly::soleWrenches(geometry_, transforms, forces);
  result.leftFootWrench = soleWrenches.left;
  result.rightFootWrench = soleWrenches.right;

  // Impact
  Eigen::VectorXd velocity(n);
  velocity << baseVelocity, jointVelocity;
  const ImpactProjector::Correction correction =
    impact_projector_.correct(massLlt, kinematics.jacobian, state, velocity);
  if (correction.applied)
  {
    logger_->debug("ContactSolver: impact at vertices [{}], {} constrained vertices, rank {}",
                   fmt::join(correction.impactVertices, ", "),
                   correction.constrainedVertices.size(), correction.rank);
  }
  result.baseVelocity = correction.velocity.head<kBaseDofs>();
  result.jointVelocity = correction.velocity.tail(selector_.actuatedDofs());

  result.contactForces = forces;
  result.vertexHeights = heights;
  result.contactState = state;
  result.impactDetected = correction.applied;
  result.impactVertices = correction.impactVertices;
  result.solverIterations = solve.iterations;
  result.solverObjective = solve.objective;

  // Commit
  state.commit();
  state_ = state;
  equality_matrix_ = std::move(equalityMatrix);

  return result;
}

void ContactSolver::resetContactState(const ContactState& state)
{
  logger_->debug("ContactSolver: contact history reset to previous = {}, current = {}",
                 flagsToString(state.previous), flagsToString(state.current));
  state_ = state;
}

Eigen::MatrixXd ContactSolver::equalityConstraints(const ContactFlags& flags)
{
  Eigen::MatrixXd equality = Eigen::MatrixXd::Zero(kNumVertices, kNumForceVariables);
  for (int i = 0; i < kNumVertices; ++i)
  {
    equality(i, forceOffset(i) + 2) = flags[static_cast<size_t>(i)] ? 0.0 : 1.0;
  }
  return equality;
}

}  // namespace lcs_sim
