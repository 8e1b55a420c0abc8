// Ticket: 0014_contact_solver_test_suite

#ifndef LCS_SIM_TEST_HELPERS_RIGID_BIPED_HPP
#define LCS_SIM_TEST_HELPERS_RIGID_BIPED_HPP

#include <Eigen/Dense>

#include "lcs-sim/src/Contact/ContactTypes.hpp"
#include "lcs-sim/src/Dynamics/RobotDynamics.hpp"

namespace lcs_sim::test
{

/**
 * @brief Analytic floating-base model with feet welded to the base
 *
 * A single rigid body (the base, coincident with the CoM) carries two feet
 * at fixed offsets and N rotor joints that are dynamically decoupled from
 * the base. Generalized velocity nu = [v (world); omega (world); qdot].
 *
 *   M = blockdiag(m I3, R I_body R^T, I_rotor)
 *   h = [0, 0, m g, omega x (I_world omega), 0]
 *   J_foot = [ I3  -skew(R o)  0 ]
 *            [ 0    I3         0 ]
 *   Jdot nu = [ omega x (omega x R o); 0 ]
 *
 * Sole frames share the base orientation. Small enough to verify contact
 * forces and impact maps by hand.
 *
 * Thread safety: Not thread-safe; single-threaded test use only.
 *
 * @ticket 0014_contact_solver_test_suite
 */
class RigidBiped : public RobotDynamics
{
public:
  struct Parameters
  {
    double mass{30.0};                                      ///< [kg]
    Eigen::Vector3d principalInertia{1.2, 1.0, 0.4};        ///< Body frame [kg m^2]
    Eigen::Vector3d leftFootOffset{0.0, 0.1, -0.5};         ///< Base frame [m]
    Eigen::Vector3d rightFootOffset{0.0, -0.1, -0.5};       ///< Base frame [m]
    int actuatedDofs{6};
    double rotorInertia{0.05};                              ///< [kg m^2]
    double gravity{9.81};                                   ///< [m/s^2]
  };

  /// Default parameters, base 0.5 m above ground so both soles touch z = 0
  RigidBiped();

  explicit RigidBiped(const Parameters& parameters);

  /// Base (CoM) position and orientation in the world frame
  void setBasePose(const Eigen::Vector3d& position,
                   const Eigen::Matrix3d& rotation = Eigen::Matrix3d::Identity());

  /// Base velocity [v; omega], world frame; enters h and Jdot nu
  void setBaseVelocity(const Vector6d& velocity);

  [[nodiscard]] Eigen::MatrixXd massMatrix() const override;
  [[nodiscard]] Eigen::VectorXd biasForces() const override;
  [[nodiscard]] FeetPair<Eigen::Matrix4d> feetTransforms() const override;
  [[nodiscard]] FeetPair<Eigen::MatrixXd> feetJacobians() const override;
  [[nodiscard]] FeetPair<Vector6d> feetJacobianDotNu() const override;

  [[nodiscard]] int generalizedDofs() const
  {
    return kBaseDofs + parameters_.actuatedDofs;
  }

  [[nodiscard]] double weight() const
  {
    return parameters_.mass * parameters_.gravity;
  }

  /// (1/2) nu^T M nu
  [[nodiscard]] double kineticEnergy(const Eigen::VectorXd& nu) const;

  [[nodiscard]] const Parameters& parameters() const
  {
    return parameters_;
  }

private:
  /// World-frame lever from base to sole origin
  [[nodiscard]] Eigen::Vector3d footLever(int foot) const;

  Parameters parameters_;
  Eigen::Vector3d position_{0.0, 0.0, 0.5};
  Eigen::Matrix3d rotation_{Eigen::Matrix3d::Identity()};
  Vector6d base_velocity_{Vector6d::Zero()};
};

}  // namespace lcs_sim::test

#endif  // LCS_SIM_TEST_HELPERS_RIGID_BIPED_HPP
