// Ticket: 0002_vertex_jacobian_assembly
// Ticket: 0003_contact_detection

#include "lcs-sim/src/Contact/FootKinematics.hpp"

#include <stdexcept>
#include <string>

#include "lcs-sim/src/Math/SkewSymmetric.hpp"

namespace lcs_sim::foot_kinematics
{

VertexJacobians assembleVertexJacobians(
  const FootGeometry& geometry,
  const FeetPair<Eigen::Matrix4d>& transforms,
  const FeetPair<Eigen::MatrixXd>& jacobians,
  const FeetPair<Vector6d>& jacobianDotNu)
{
  const Eigen::Index n = jacobians.left.cols();
  if (jacobians.left.rows() != 6 || jacobians.right.rows() != 6 ||
      jacobians.right.cols() != n)
  {
    throw std::invalid_argument{
      "assembleVertexJacobians: foot Jacobians must both be 6 x n, got " +
      std::to_string(jacobians.left.rows()) + "x" + std::to_string(n) +
      " and " + std::to_string(jacobians.right.rows()) + "x" +
      std::to_string(jacobians.right.cols())};
  }

  VertexJacobians result;
  result.jacobian.resize(kNumForceVariables, n);

  for (int foot = 0; foot < kNumFeet; ++foot)
  {
    const Eigen::Matrix3d rotation = transforms[foot].topLeftCorner<3, 3>();
    const Eigen::MatrixXd& footJacobian = jacobians[foot];
    const Vector6d& footJacobianDotNu = jacobianDotNu[foot];

    for (int k = 0; k < kVerticesPerFoot; ++k)
    {
      const int row = forceOffset(firstVertexOfFoot(foot) + k);
      const Eigen::Matrix3d lever = skew(rotation * geometry.vertex(k));

      result.jacobian.middleRows<3>(row) =
        footJacobian.topRows<3>() - lever * footJacobian.bottomRows<3>();
      result.jacobianDotNu.segment<3>(row) =
        footJacobianDotNu.head<3>() - lever * footJacobianDotNu.tail<3>();
    }
  }

  return result;
}

VertexHeights computeVertexHeights(const FootGeometry& geometry,
                                   const FeetPair<Eigen::Matrix4d>& transforms)
{
  VertexHeights heights;
  for (int foot = 0; foot < kNumFeet; ++foot)
  {
    for (int k = 0; k < kVerticesPerFoot; ++k)
    {
      const Eigen::Vector4d worldPoint =
        transforms[foot] * geometry.vertex(k).homogeneous();
      heights(firstVertexOfFoot(foot) + k) = worldPoint.z();
    }
  }
  return heights;
}

ContactFlags detectContact(const VertexHeights& heights)
{
  ContactFlags flags{};
  for (int i = 0; i < kNumVertices; ++i)
  {
    flags[static_cast<size_t>(i)] = heights(i) <= 0.0;
  }
  return flags;
}

}  // namespace lcs_sim::foot_kinematics
