// Ticket: 0014_contact_solver_test_suite

#include <benchmark/benchmark.h>
#include <Eigen/Dense>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

#include "lcs-sim/src/Contact/ContactSolver.hpp"
#include "lcs-sim/src/Contact/ContactState.hpp"
#include "lcs-sim/src/Robot/HumanoidPreset.hpp"
#include "lcs-sim/test/Helpers/RigidBiped.hpp"

using namespace lcs_sim;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

std::shared_ptr<spdlog::logger> benchLogger()
{
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  return std::make_shared<spdlog::logger>("bench_logger", sink);
}

ContactSolverConfig benchConfig(int actuatedDofs, QPBackend backend)
{
  ContactSolverConfig config;
  config.footprint = rectangularFootprint(0.1, -0.05, 0.03);
  config.actuatedDofs = actuatedDofs;
  config.frictionCoefficient = 0.7;
  config.backend = backend;
  return config;
}

test::RigidBiped makeBiped(int actuatedDofs)
{
  test::RigidBiped::Parameters parameters;
  parameters.actuatedDofs = actuatedDofs;
  return test::RigidBiped{parameters};
}

}  // namespace

// ============================================================================
// Double Support
// ============================================================================

/**
 * @brief Full computeContact() step with all eight vertices in contact
 *
 * Arg 0 selects the backend, arg 1 the number of actuated joints.
 *
 * @ticket 0014_contact_solver_test_suite
 */
static void BM_ContactSolver_DoubleSupport(benchmark::State& state)
{
  const auto backend = static_cast<QPBackend>(state.range(0));
  const int joints = static_cast<int>(state.range(1));
  const test::RigidBiped biped = makeBiped(joints);
  ContactSolver solver{benchConfig(joints, backend), benchLogger()};

  const Eigen::VectorXd torque = Eigen::VectorXd::Zero(joints);
  const Eigen::VectorXd wrench = Eigen::VectorXd::Zero(biped.generalizedDofs());
  const Vector6d baseVelocity = Vector6d::Zero();

  for (auto _ : state)
  {
    ContactStepResult result =
      solver.computeContact(biped, torque, wrench, baseVelocity, torque);
    benchmark::DoNotOptimize(result);
  }
  state.SetLabel(std::string{solver.qpSolver().name()});
}
BENCHMARK(BM_ContactSolver_DoubleSupport)
  ->Args({static_cast<int>(QPBackend::NLoptSLSQP), 6})
  ->Args({static_cast<int>(QPBackend::NLoptSLSQP), 23})
  ->Args({static_cast<int>(QPBackend::ECOS), 6})
  ->Args({static_cast<int>(QPBackend::ECOS), 23});

// ============================================================================
// Touchdown
// ============================================================================

/**
 * @brief Step with a double touchdown, including the impact projection
 *
 * The contact history is reset to airborne before every iteration.
 *
 * @ticket 0014_contact_solver_test_suite
 */
static void BM_ContactSolver_Touchdown(benchmark::State& state)
{
  const int joints = static_cast<int>(state.range(0));
  test::RigidBiped biped = makeBiped(joints);
  ContactSolver solver{benchConfig(joints, QPBackend::NLoptSLSQP), benchLogger()};

  const Eigen::VectorXd torque = Eigen::VectorXd::Zero(joints);
  const Eigen::VectorXd wrench = Eigen::VectorXd::Zero(biped.generalizedDofs());
  Vector6d baseVelocity;
  baseVelocity << 0.1, 0.0, -0.8, 0.0, 0.2, 0.0;
  biped.setBaseVelocity(baseVelocity);

  for (auto _ : state)
  {
    solver.resetContactState(ContactState::airborne());
    ContactStepResult result =
      solver.computeContact(biped, torque, wrench, baseVelocity, torque);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_ContactSolver_Touchdown)
  ->Arg(6)
  ->Arg(23);

BENCHMARK_MAIN();
