// Ticket: 0001_foot_contact_solver

#ifndef LCS_SIM_CONTACT_CONTACT_STATE_HPP
#define LCS_SIM_CONTACT_CONTACT_STATE_HPP

#include <vector>

#include "lcs-sim/src/Contact/ContactTypes.hpp"

namespace lcs_sim
{

/**
 * @brief Per-vertex contact history across two consecutive steps
 *
 * `previous` holds the flags committed by the last completed step,
 * `current` the flags detected in the step being computed. A vertex is
 * impacting when it is in contact now but was not before.
 *
 * The only cross-step mutation is commit(), called once at the end of a
 * successful step.
 *
 * @ticket 0001_foot_contact_solver
 */
struct ContactState
{
  ContactFlags previous{};
  ContactFlags current{};

  /// History at start-up: every vertex assumed in contact
  [[nodiscard]] static ContactState initial();

  /// History with every vertex out of contact
  [[nodiscard]] static ContactState airborne();

  /// Free -> contact transition of one vertex
  [[nodiscard]] bool isImpact(int vertex) const
  {
    const auto i = static_cast<size_t>(vertex);
    return current.at(i) && !previous.at(i);
  }

  [[nodiscard]] bool hasImpact() const;

  /// Impacting vertices in ascending order
  [[nodiscard]] std::vector<int> impactVertices() const;

  /// Vertices that were in contact during the previous step, ascending
  [[nodiscard]] std::vector<int> previousContactVertices() const;

  [[nodiscard]] int currentContactCount() const;

  /// previous <- current
  void commit()
  {
    previous = current;
  }

  bool operator==(const ContactState&) const = default;
};

}  // namespace lcs_sim

#endif  // LCS_SIM_CONTACT_CONTACT_STATE_HPP
