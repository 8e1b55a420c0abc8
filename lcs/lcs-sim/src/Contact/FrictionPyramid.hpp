// Ticket: 0004_friction_pyramid_constraints

#ifndef LCS_SIM_CONTACT_FRICTION_PYRAMID_HPP
#define LCS_SIM_CONTACT_FRICTION_PYRAMID_HPP

#include <Eigen/Dense>

#include "lcs-sim/src/Contact/ContactTypes.hpp"

namespace lcs_sim
{

/**
 * @brief Linearized Coulomb friction for all eight vertices
 *
 * Each vertex force f = (fx, fy, fz) must satisfy the five rows
 *
 *    fx - mu fz <= 0
 *    fy - mu fz <= 0
 *   -fx - mu fz <= 0
 *   -fy - mu fz <= 0
 *        -fz   <= 0
 *
 * i.e. the four-sided pyramid |fx| <= mu fz, |fy| <= mu fz with a
 * non-negative normal force. The pyramid circumscribes the circular cone of
 * radius mu fz, so the tangential magnitude may reach sqrt(2) mu fz along a
 * diagonal.
 *
 * The stacked system A f <= b (A is 40 x 24 block diagonal, b = 0) is built
 * once and never changes.
 *
 * @ticket 0004_friction_pyramid_constraints
 */
class FrictionPyramid
{
public:
  static constexpr int kRowsPerVertex = 5;
  static constexpr int kNumRows = kRowsPerVertex * kNumVertices;

  /**
   * @param frictionCoefficient mu, must be positive and finite
   * @throws ConfigurationError otherwise
   */
  explicit FrictionPyramid(double frictionCoefficient);

  [[nodiscard]] double frictionCoefficient() const
  {
    return mu_;
  }

  /// A (40 x 24)
  [[nodiscard]] const Eigen::MatrixXd& inequalityMatrix() const
  {
    return inequality_matrix_;
  }

  /// b (40), all zero
  [[nodiscard]] const Eigen::VectorXd& inequalityBound() const
  {
    return inequality_bound_;
  }

  /// Five pyramid rows acting on one vertex force
  [[nodiscard]] static Eigen::Matrix<double, kRowsPerVertex, 3> vertexBlock(double mu);

  /// True if every pyramid row of one vertex force is <= tolerance
  [[nodiscard]] bool contains(const Eigen::Vector3d& force, double tolerance) const;

private:
  double mu_;
  Eigen::MatrixXd inequality_matrix_;
  Eigen::VectorXd inequality_bound_;
};

}  // namespace lcs_sim

#endif  // LCS_SIM_CONTACT_FRICTION_PYRAMID_HPP
