// Ticket: 0008_ecos_qp_backend

#include "lcs-sim/src/Optimization/ECOS/ECOSSparseMatrix.hpp"

#include <Eigen/SparseCore>
#include <stdexcept>
#include <string>

namespace lcs_sim
{

ECOSSparseMatrix ECOSSparseMatrix::fromDense(const Eigen::MatrixXd& mat,
                                             double sparsity_threshold)
{
  if (mat.rows() == 0 || mat.cols() == 0)
  {
    throw std::invalid_argument{
      "ECOSSparseMatrix::fromDense: matrix must have non-zero dimensions, got " +
      std::to_string(mat.rows()) + "x" + std::to_string(mat.cols())};
  }
  if (!mat.allFinite())
  {
    throw std::invalid_argument{
      "ECOSSparseMatrix::fromDense: matrix contains non-finite values"};
  }

  // |value| <= sparsity_threshold is dropped; the result is compressed CSC
  Eigen::SparseMatrix<double, Eigen::ColMajor> sparse =
    mat.sparseView(1.0, sparsity_threshold);
  sparse.makeCompressed();

  ECOSSparseMatrix result{};
  result.nrows = static_cast<idxint>(sparse.rows());
  result.ncols = static_cast<idxint>(sparse.cols());
  result.nnz = static_cast<idxint>(sparse.nonZeros());

  const auto nnz = static_cast<size_t>(result.nnz);
  result.data.assign(sparse.valuePtr(), sparse.valuePtr() + nnz);
  result.row_indices.assign(sparse.innerIndexPtr(), sparse.innerIndexPtr() + nnz);
  result.col_ptrs.assign(sparse.outerIndexPtr(),
                         sparse.outerIndexPtr() + sparse.outerSize() + 1);

  return result;
}

}  // namespace lcs_sim
