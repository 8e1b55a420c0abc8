// Ticket: 0008_ecos_qp_backend

#ifndef LCS_SIM_OPTIMIZATION_ECOS_ECOS_SPARSE_MATRIX_HPP
#define LCS_SIM_OPTIMIZATION_ECOS_ECOS_SPARSE_MATRIX_HPP

#include <ecos/ecos.h>
#include <Eigen/Dense>
#include <vector>

namespace lcs_sim
{

/**
 * @brief Eigen matrix in the CSC layout ECOS expects
 *
 * - data: non-zero values, column by column
 * - row_indices: row of each value
 * - col_ptrs: start of each column in data (ncols + 1 entries)
 *
 * Example:
 *   [1.0  0.0  2.0]
 *   [0.0  3.0  0.0]      data        = [1.0, 3.0, 2.0]
 *                        row_indices = [0, 1, 0]
 *                        col_ptrs    = [0, 1, 2, 3]
 *
 * @ticket 0008_ecos_qp_backend
 */
struct ECOSSparseMatrix
{
  std::vector<pfloat> data;
  std::vector<idxint> row_indices;
  std::vector<idxint> col_ptrs;
  idxint nrows{0};
  idxint ncols{0};
  idxint nnz{0};

  ECOSSparseMatrix() = default;

  /**
   * @brief Collect entries with |value| > sparsity_threshold
   * @throws std::invalid_argument if the matrix has a zero dimension or a
   *         non-finite entry
   */
  static ECOSSparseMatrix fromDense(const Eigen::MatrixXd& mat,
                                    double sparsity_threshold = 1e-12);
};

}  // namespace lcs_sim

#endif  // LCS_SIM_OPTIMIZATION_ECOS_ECOS_SPARSE_MATRIX_HPP
