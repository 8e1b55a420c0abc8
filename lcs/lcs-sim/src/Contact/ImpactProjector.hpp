// Ticket: 0011_impact_velocity_projection

#ifndef LCS_SIM_CONTACT_IMPACT_PROJECTOR_HPP
#define LCS_SIM_CONTACT_IMPACT_PROJECTOR_HPP

#include <Eigen/Dense>
#include <vector>

#include "lcs-sim/src/Contact/ContactState.hpp"

namespace lcs_sim
{

/**
 * @brief Inelastic impact map for vertices touching down
 *
 * When at least one vertex goes from free to contact, the generalized
 * velocity is projected onto the null space of the contact constraints
 *
 *   N  = I - M^{-1} J_c^T (J_c M^{-1} J_c^T)^+ J_c
 *   nu+ = N nu-
 *
 * where J_c stacks the rows of the impacting vertices followed by the rows
 * of every vertex that was already in contact. Afterwards J_c nu+ = 0 and the
 * kinetic energy does not increase.
 *
 * The four vertices of a rigid foot give 12 rows of rank 6, so the
 * operational-space inertia J_c M^{-1} J_c^T is singular whenever a whole foot
 * is involved. The pseudo-inverse (complete orthogonal decomposition with a
 * relative rank cutoff) yields the same projection as a full-rank inverse on
 * the independent rows.
 *
 * @ticket 0011_impact_velocity_projection
 */
class ImpactProjector
{
public:
  struct Correction
  {
    Eigen::VectorXd velocity;            ///< nu+ (nu- unchanged if !applied)
    bool applied{false};
    std::vector<int> impactVertices;     ///< Free -> contact, ascending
    std::vector<int> constrainedVertices;///< Row order of J_c
    Eigen::Index rank{0};                ///< Rank of J_c M^{-1} J_c^T
  };

  /// @param rankTolerance Relative cutoff of the pseudo-inverse (default: 1e-10)
  explicit ImpactProjector(double rankTolerance = 1e-10);

  /**
   * @brief Apply the impact map if the contact state has a touchdown
   *
   * @param massLlt Cholesky factorization of M
   * @param vertexJacobian 24 x n vertex Jacobian
   * @param state Contact history of this step (before commit)
   * @param velocity nu- (n)
   * @throws std::invalid_argument on dimension mismatch
   * @throws SolverFailure (ImpactProjection) if nu+ is not finite
   */
  [[nodiscard]] Correction correct(const Eigen::LLT<Eigen::MatrixXd>& massLlt,
                                   const Eigen::MatrixXd& vertexJacobian,
                                   const ContactState& state,
                                   const Eigen::VectorXd& velocity) const;

  /**
   * @brief N for an arbitrary constraint Jacobian (k x n)
   * @param rank Optional output: numerical rank of J M^{-1} J^T
   */
  [[nodiscard]] Eigen::MatrixXd projector(const Eigen::LLT<Eigen::MatrixXd>& massLlt,
                                          const Eigen::MatrixXd& constraintJacobian,
                                          Eigen::Index* rank = nullptr) const;

  /// Impacting vertices followed by previously contacting vertices
  [[nodiscard]] static std::vector<int> constrainedVertices(const ContactState& state);

  /// Stack the three rows of each listed vertex
  [[nodiscard]] static Eigen::MatrixXd stackVertexRows(const Eigen::MatrixXd& vertexJacobian,
                                                       const std::vector<int>& vertices);

  [[nodiscard]] double getRankTolerance() const
  {
    return rank_tolerance_;
  }

private:
  double rank_tolerance_;
};

}  // namespace lcs_sim

#endif  // LCS_SIM_CONTACT_IMPACT_PROJECTOR_HPP
