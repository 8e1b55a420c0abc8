// Ticket: 0008_ecos_qp_backend

#ifndef LCS_SIM_OPTIMIZATION_ECOS_ECOS_DATA_HPP
#define LCS_SIM_OPTIMIZATION_ECOS_ECOS_DATA_HPP

#include <ecos/ecos.h>
#include <memory>
#include <vector>

#include "lcs-sim/src/Optimization/ECOS/ECOSSparseMatrix.hpp"

namespace lcs_sim
{

/**
 * @brief Deleter calling ECOS_cleanup() on a workspace
 * @ticket 0008_ecos_qp_backend
 */
struct ECOSWorkspaceDeleter
{
  void operator()(pwork* w) const noexcept;
};

using ECOSWorkspacePtr = std::unique_ptr<pwork, ECOSWorkspaceDeleter>;

/**
 * @brief RAII owner of an ECOS problem and its workspace
 *
 * Holds every array handed to ECOS_setup() so they outlive the workspace.
 * The cone is ordered as ECOS requires: the positive orthant (num_orthant_
 * rows of G) first, then one block per second-order cone in cone_sizes_.
 *
 * Usage:
 * 1. Construct with the problem dimensions
 * 2. Fill G_, h_, c_, cone_sizes_ (and A_eq_, b_eq_ when num_equality_ > 0)
 * 3. setup(), then ECOS_solve(workspace_.get())
 * 4. The workspace is released on destruction or cleanup()
 *
 * Move-only. Not thread-safe.
 *
 * @ticket 0008_ecos_qp_backend
 */
struct ECOSData
{
  idxint num_variables_{0};
  idxint num_orthant_{0};   // Rows of G in the positive orthant (l)
  idxint num_equality_{0};  // Rows of A_eq (p)

  ECOSSparseMatrix G_;
  ECOSSparseMatrix A_eq_;

  std::vector<pfloat> h_;
  std::vector<pfloat> c_;
  std::vector<pfloat> b_eq_;

  std::vector<idxint> cone_sizes_;

  // Declared last so it is destroyed first: ECOS_cleanup() writes back into
  // G_, h_ and c_ when it undoes the equilibration.
  ECOSWorkspacePtr workspace_{nullptr};

  /**
   * @param numVariables Decision variables (n)
   * @param numOrthant Linear inequality rows (l)
   * @param numEquality Equality rows (p)
   */
  ECOSData(idxint numVariables, idxint numOrthant, idxint numEquality = 0);

  ~ECOSData() = default;

  ECOSData(ECOSData&& other) noexcept;

  /// Releases our workspace before taking over the other's arrays
  ECOSData& operator=(ECOSData&& other) noexcept;

  ECOSData(const ECOSData&) = delete;
  ECOSData& operator=(const ECOSData&) = delete;

  /// Total rows of G: orthant plus all second-order cones (m)
  [[nodiscard]] idxint numConeRows() const;

  /**
   * @brief Create the ECOS workspace from the owned arrays
   *
   * @throws std::runtime_error if already set up, if an array does not match
   *         the declared dimensions, or if ECOS_setup() fails
   */
  void setup();

  [[nodiscard]] bool isSetup() const
  {
    return workspace_ != nullptr;
  }

  /// Idempotent
  void cleanup();
};

}  // namespace lcs_sim

#endif  // LCS_SIM_OPTIMIZATION_ECOS_ECOS_DATA_HPP
