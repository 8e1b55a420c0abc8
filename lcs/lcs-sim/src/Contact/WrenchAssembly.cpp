// Ticket: 0005_wrench_assembly

#include "lcs-sim/src/Contact/WrenchAssembly.hpp"

#include <stdexcept>
#include <string>

#include "lcs-sim/src/Math/SkewSymmetric.hpp"

namespace lcs_sim::wrench_assembly
{

Eigen::VectorXd generalizedContactWrench(const Eigen::MatrixXd& vertexJacobian,
                                         const ContactForceVector& forces)
{
  if (vertexJacobian.rows() != kNumForceVariables)
  {
    throw std::invalid_argument{
      "generalizedContactWrench: vertex Jacobian must have 24 rows, got " +
      std::to_string(vertexJacobian.rows())};
  }
  return vertexJacobian.transpose() * forces;
}

Vector6d soleWrench(const FootGeometry& geometry,
                    const Eigen::Matrix3d& rotation,
                    const FootForceVector& footForces)
{
  Vector6d wrench = Vector6d::Zero();
  for (int k = 0; k < kVerticesPerFoot; ++k)
  {
    const Eigen::Vector3d soleForce =
      rotation.transpose() * footForces.segment<3>(forceOffset(k));
    wrench.head<3>() += soleForce;
    wrench.tail<3>() -= skew(geometry.vertex(k)) * soleForce;
  }
  return wrench;
}

FeetPair<Vector6d> soleWrenches(const FootGeometry& geometry,
                                const FeetPair<Eigen::Matrix4d>& transforms,
                                const ContactForceVector& forces)
{
  constexpr int kFootBlock = kVerticesPerFoot * kForcesPerVertex;
  return FeetPair<Vector6d>{
    soleWrench(geometry,
               transforms.left.topLeftCorner<3, 3>(),
               forces.head<kFootBlock>()),
    soleWrench(geometry,
               transforms.right.topLeftCorner<3, 3>(),
               forces.tail<kFootBlock>())};
}

}  // namespace lcs_sim::wrench_assembly
