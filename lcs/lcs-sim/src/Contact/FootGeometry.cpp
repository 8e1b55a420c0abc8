// Ticket: 0001_foot_contact_solver

#include "lcs-sim/src/Contact/FootGeometry.hpp"

#include <stdexcept>
#include <string>

#include "lcs-sim/src/Contact/ContactErrors.hpp"

namespace lcs_sim
{

FootGeometry::FootGeometry(const Eigen::MatrixXd& footprint)
{
  if (footprint.rows() != kVerticesPerFoot || footprint.cols() != 3)
  {
    throw ConfigurationError{
      "FootGeometry: footprint must be 4x3 (one vertex per row), got " +
      std::to_string(footprint.rows()) + "x" +
      std::to_string(footprint.cols())};
  }
  if (!footprint.allFinite())
  {
    throw ConfigurationError{"FootGeometry: footprint contains non-finite values"};
  }

  for (int i = 0; i < kVerticesPerFoot; ++i)
  {
    vertices_[static_cast<size_t>(i)] = footprint.row(i).transpose();
  }
}

const Eigen::Vector3d& FootGeometry::vertex(int index) const
{
  if (index < 0 || index >= kVerticesPerFoot)
  {
    throw std::out_of_range{"FootGeometry::vertex: index " +
                            std::to_string(index) + " out of range [0, 4)"};
  }
  return vertices_[static_cast<size_t>(index)];
}

Eigen::Matrix<double, kVerticesPerFoot, 3> FootGeometry::footprint() const
{
  Eigen::Matrix<double, kVerticesPerFoot, 3> result;
  for (int i = 0; i < kVerticesPerFoot; ++i)
  {
    result.row(i) = vertices_[static_cast<size_t>(i)].transpose();
  }
  return result;
}

}  // namespace lcs_sim
