// Ticket: 0001_foot_contact_solver

#ifndef LCS_SIM_CONTACT_CONTACT_TYPES_HPP
#define LCS_SIM_CONTACT_CONTACT_TYPES_HPP

#include <Eigen/Dense>
#include <array>

namespace lcs_sim
{

/// Vertices of one foot's support polygon
constexpr int kVerticesPerFoot = 4;

/// Feet in contact with the ground (left, right)
constexpr int kNumFeet = 2;

/// Vertices of both feet; left foot occupies [0, 4), right foot [4, 8)
constexpr int kNumVertices = kNumFeet * kVerticesPerFoot;

/// World-frame force components per vertex (fx, fy, fz)
constexpr int kForcesPerVertex = 3;

/// Unknowns of the contact force problem
constexpr int kNumForceVariables = kNumVertices * kForcesPerVertex;

/// Generalized coordinates of the floating base (linear + angular)
constexpr int kBaseDofs = 6;

using Vector6d = Eigen::Matrix<double, 6, 1>;

/// Stacked vertex forces [f_0; f_1; ...; f_7], 3 world components each
using ContactForceVector = Eigen::Matrix<double, kNumForceVariables, 1>;

/// World z-coordinate of each vertex
using VertexHeights = Eigen::Matrix<double, kNumVertices, 1>;

/// Per-vertex contact flags
using ContactFlags = std::array<bool, kNumVertices>;

/// Index of the first vertex of a foot (0 for the left foot, 4 for the right)
[[nodiscard]] constexpr int firstVertexOfFoot(int foot)
{
  return foot * kVerticesPerFoot;
}

/// Offset of a vertex's force block in ContactForceVector
[[nodiscard]] constexpr int forceOffset(int vertex)
{
  return vertex * kForcesPerVertex;
}

}  // namespace lcs_sim

#endif  // LCS_SIM_CONTACT_CONTACT_TYPES_HPP
