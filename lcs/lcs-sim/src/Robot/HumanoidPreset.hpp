// Ticket: 0013_humanoid_preset

#ifndef LCS_SIM_ROBOT_HUMANOID_PRESET_HPP
#define LCS_SIM_ROBOT_HUMANOID_PRESET_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

#include "lcs-sim/src/Contact/ContactSolverConfig.hpp"

namespace lcs_sim
{

/**
 * @brief Controller-side layout of a humanoid as plain data
 *
 * Joint order, frame names and the initial pose a host needs to wire a
 * dynamics provider and a ContactSolver together.
 *
 * @ticket 0013_humanoid_preset
 */
struct HumanoidPreset
{
  std::vector<std::string> jointOrder;
  double gravity{9.81};  ///< [m/s^2]
  std::string baseFrame;
  std::string comFrame;
  std::string leftSoleFrame;
  std::string rightSoleFrame;
  Eigen::Vector3d initialBasePosition{Eigen::Vector3d::Zero()};
  Eigen::Matrix3d initialBaseOrientation{Eigen::Matrix3d::Identity()};
  Eigen::VectorXd initialJointPositions;  ///< [rad], jointOrder order

  [[nodiscard]] int actuatedDofs() const
  {
    return static_cast<int>(jointOrder.size());
  }

  /// Index of a joint in jointOrder
  /// @throws std::out_of_range if the joint is unknown
  [[nodiscard]] int jointIndex(const std::string& name) const;

  /**
   * @brief Solver configuration for this robot
   * @throws ConfigurationError if the footprint or mu is invalid
   */
  [[nodiscard]] ContactSolverConfig contactConfig(const Eigen::MatrixXd& footprint,
                                                  double frictionCoefficient) const;
};

/**
 * @brief 23-joint humanoid (torso, two 4-joint arms, two 6-joint legs)
 *
 * Base starts 0.70 m above ground, rotated by pi about z.
 *
 * @ticket 0013_humanoid_preset
 */
[[nodiscard]] HumanoidPreset referenceHumanoid();

/**
 * @brief Rectangular sole footprint
 *
 * Vertex order: front-left, front-right, back-left, back-right, all at z = 0.
 *
 * @param front x of the toe edge [m]
 * @param back x of the heel edge [m], front > back
 * @param halfWidth Half of the sole width [m], > 0
 * @throws ConfigurationError if the rectangle is degenerate
 * @ticket 0013_humanoid_preset
 */
[[nodiscard]] Eigen::MatrixXd rectangularFootprint(double front, double back, double halfWidth);

}  // namespace lcs_sim

#endif  // LCS_SIM_ROBOT_HUMANOID_PRESET_HPP
