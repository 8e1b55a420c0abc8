// Ticket: 0001_foot_contact_solver

#ifndef LCS_SIM_CONTACT_FOOT_GEOMETRY_HPP
#define LCS_SIM_CONTACT_FOOT_GEOMETRY_HPP

#include <Eigen/Dense>
#include <array>

#include "lcs-sim/src/Contact/ContactTypes.hpp"

namespace lcs_sim
{

/**
 * @brief Support polygon of a foot, shared by both feet
 *
 * Four contact vertices expressed in the sole frame. The vertex order is the
 * row order of the footprint matrix and fixes the ordering of the force
 * unknowns. Immutable after construction.
 *
 * @ticket 0001_foot_contact_solver
 */
class FootGeometry
{
public:
  /**
   * @brief Build from a footprint matrix
   * @param footprint 4x3 matrix, one vertex (x, y, z) per row, sole frame [m]
   * @throws ConfigurationError if the footprint is not 4x3 or not finite
   */
  explicit FootGeometry(const Eigen::MatrixXd& footprint);

  /// @throws std::out_of_range if index is not in [0, 4)
  [[nodiscard]] const Eigen::Vector3d& vertex(int index) const;

  [[nodiscard]] const std::array<Eigen::Vector3d, kVerticesPerFoot>& vertices() const
  {
    return vertices_;
  }

  /// Footprint as a 4x3 matrix (one vertex per row)
  [[nodiscard]] Eigen::Matrix<double, kVerticesPerFoot, 3> footprint() const;

private:
  std::array<Eigen::Vector3d, kVerticesPerFoot> vertices_;
};

}  // namespace lcs_sim

#endif  // LCS_SIM_CONTACT_FOOT_GEOMETRY_HPP
