// Ticket: 0002_vertex_jacobian_assembly

#ifndef LCS_SIM_MATH_SKEW_SYMMETRIC_HPP
#define LCS_SIM_MATH_SKEW_SYMMETRIC_HPP

#include <Eigen/Dense>

namespace lcs_sim
{

/**
 * @brief Cross-product matrix of a 3-vector
 *
 * Returns S(v) such that S(v) * w == v.cross(w) for every w:
 *
 *   [  0   -vz   vy ]
 *   [  vz   0   -vx ]
 *   [ -vy   vx   0  ]
 *
 * @param v Vector on the left of the cross product
 * @return Skew-symmetric 3x3 matrix
 * @ticket 0002_vertex_jacobian_assembly
 */
[[nodiscard]] inline Eigen::Matrix3d skew(const Eigen::Vector3d& v)
{
  Eigen::Matrix3d s;
  s << 0.0, -v.z(), v.y(),
       v.z(), 0.0, -v.x(),
       -v.y(), v.x(), 0.0;
  return s;
}

}  // namespace lcs_sim

#endif  // LCS_SIM_MATH_SKEW_SYMMETRIC_HPP
