// Ticket: 0013_humanoid_preset

#include "lcs-sim/src/Robot/HumanoidPreset.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include "lcs-sim/src/Contact/ContactErrors.hpp"

namespace lcs_sim
{

int HumanoidPreset::jointIndex(const std::string& name) const
{
  const auto it = std::find(jointOrder.begin(), jointOrder.end(), name);
  if (it == jointOrder.end())
  {
    throw std::out_of_range{"HumanoidPreset::jointIndex: unknown joint '" + name + "'"};
  }
  return static_cast<int>(std::distance(jointOrder.begin(), it));
}

ContactSolverConfig HumanoidPreset::contactConfig(const Eigen::MatrixXd& footprint,
                                                  double frictionCoefficient) const
{
  ContactSolverConfig config;
  config.footprint = footprint;
  config.actuatedDofs = actuatedDofs();
  config.frictionCoefficient = frictionCoefficient;
  config.validate();
  return config;
}

HumanoidPreset referenceHumanoid()
{
  HumanoidPreset preset;
  preset.jointOrder = {
    "torso_pitch", "torso_roll", "torso_yaw",
    "l_shoulder_pitch", "l_shoulder_roll", "l_shoulder_yaw", "l_elbow",
    "r_shoulder_pitch", "r_shoulder_roll", "r_shoulder_yaw", "r_elbow",
    "l_hip_pitch", "l_hip_roll", "l_hip_yaw", "l_knee", "l_ankle_pitch", "l_ankle_roll",
    "r_hip_pitch", "r_hip_roll", "r_hip_yaw", "r_knee", "r_ankle_pitch", "r_ankle_roll"};
  preset.gravity = 9.81;
  preset.baseFrame = "root_link";
  preset.comFrame = "com";
  preset.leftSoleFrame = "l_sole";
  preset.rightSoleFrame = "r_sole";
  preset.initialBasePosition = Eigen::Vector3d{0.0, 0.0, 0.70};
  preset.initialBaseOrientation = Eigen::Vector3d{-1.0, -1.0, 1.0}.asDiagonal();

  preset.initialJointPositions.resize(preset.actuatedDofs());
  preset.initialJointPositions << 0.1744, 0.0007, 0.0001,
                                  -0.1745, 0.4363, 0.6981, 0.2618,
                                  -0.1745, 0.4363, 0.6981, 0.2618,
                                  0.0003, 0.0000, -0.0001, 0.0004, -0.0004, 0.3,
                                  0.0002, 0.0001, -0.0002, 0.0004, -0.0005, 0.0003;
  return preset;
}

Eigen::MatrixXd rectangularFootprint(double front, double back, double halfWidth)
{
  if (!(front > back) || !(halfWidth > 0.0))
  {
    throw ConfigurationError{
      "rectangularFootprint: need front > back and halfWidth > 0, got front = " +
      std::to_string(front) + ", back = " + std::to_string(back) +
      ", halfWidth = " + std::to_string(halfWidth)};
  }

  Eigen::MatrixXd footprint(4, 3);
  footprint << front, halfWidth, 0.0,
               front, -halfWidth, 0.0,
               back, halfWidth, 0.0,
               back, -halfWidth, 0.0;
  return footprint;
}

}  // namespace lcs_sim
