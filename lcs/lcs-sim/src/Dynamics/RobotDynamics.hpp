// Ticket: 0001_foot_contact_solver

#ifndef LCS_SIM_DYNAMICS_ROBOT_DYNAMICS_HPP
#define LCS_SIM_DYNAMICS_ROBOT_DYNAMICS_HPP

#include <Eigen/Dense>

#include "lcs-sim/src/Contact/ContactTypes.hpp"

namespace lcs_sim
{

/// Per-foot quantity, left foot first
template <typename T>
struct FeetPair
{
  T left;
  T right;

  [[nodiscard]] const T& operator[](int foot) const
  {
    return foot == 0 ? left : right;
  }
};

/**
 * @brief Read-only view of a floating-base rigid-body system at one instant
 *
 * Implemented by the host's rigid-body dynamics library. The generalized
 * velocity is nu = [v_base (6); qdot (N)], so every matrix below has
 * n = 6 + N columns. The contact solver never mutates the provider.
 *
 * Frames:
 * - feetTransforms() returns world <- sole homogeneous transforms.
 * - feetJacobians() rows are [linear (3); angular (3)] world-frame
 *   velocities of the sole frame origin.
 *
 * Thread safety: Implementations are only read from a single thread.
 *
 * @ticket 0001_foot_contact_solver
 */
class RobotDynamics
{
public:
  virtual ~RobotDynamics() = default;

  /// Generalized mass matrix M (n x n), symmetric positive definite
  [[nodiscard]] virtual Eigen::MatrixXd massMatrix() const = 0;

  /// Coriolis, centrifugal and gravity terms h (n)
  [[nodiscard]] virtual Eigen::VectorXd biasForces() const = 0;

  /// World <- sole homogeneous transforms
  [[nodiscard]] virtual FeetPair<Eigen::Matrix4d> feetTransforms() const = 0;

  /// Sole-frame Jacobians (6 x n each)
  [[nodiscard]] virtual FeetPair<Eigen::MatrixXd> feetJacobians() const = 0;

  /// Jacobian-derivative contraction Jdot * nu for each sole frame
  [[nodiscard]] virtual FeetPair<Vector6d> feetJacobianDotNu() const = 0;

protected:
  RobotDynamics() = default;
  RobotDynamics(const RobotDynamics&) = default;
  RobotDynamics& operator=(const RobotDynamics&) = default;
  RobotDynamics(RobotDynamics&&) noexcept = default;
  RobotDynamics& operator=(RobotDynamics&&) noexcept = default;
};

}  // namespace lcs_sim

#endif  // LCS_SIM_DYNAMICS_ROBOT_DYNAMICS_HPP
