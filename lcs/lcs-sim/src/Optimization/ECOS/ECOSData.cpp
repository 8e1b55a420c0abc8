// Ticket: 0008_ecos_qp_backend

#include "lcs-sim/src/Optimization/ECOS/ECOSData.hpp"

#include <numeric>
#include <stdexcept>
#include <string>

namespace lcs_sim
{

void ECOSWorkspaceDeleter::operator()(pwork* w) const noexcept
{
  if (w != nullptr)
  {
    ECOS_cleanup(w, 0);
  }
}

ECOSData::ECOSData(idxint numVariables, idxint numOrthant, idxint numEquality)
  : num_variables_{numVariables},
    num_orthant_{numOrthant},
    num_equality_{numEquality}
{
  c_.reserve(static_cast<size_t>(numVariables));
  if (numEquality > 0)
  {
    b_eq_.reserve(static_cast<size_t>(numEquality));
  }
}

ECOSData::ECOSData(ECOSData&& other) noexcept
  : num_variables_{other.num_variables_},
    num_orthant_{other.num_orthant_},
    num_equality_{other.num_equality_},
    G_{std::move(other.G_)},
    A_eq_{std::move(other.A_eq_)},
    h_{std::move(other.h_)},
    c_{std::move(other.c_)},
    b_eq_{std::move(other.b_eq_)},
    cone_sizes_{std::move(other.cone_sizes_)},
    workspace_{std::move(other.workspace_)}
{
}

ECOSData& ECOSData::operator=(ECOSData&& other) noexcept
{
  if (this != &other)
  {
    // ECOS_cleanup() touches G_, h_, c_; release while they are still ours
    cleanup();

    num_variables_ = other.num_variables_;
    num_orthant_ = other.num_orthant_;
    num_equality_ = other.num_equality_;
    G_ = std::move(other.G_);
    A_eq_ = std::move(other.A_eq_);
    h_ = std::move(other.h_);
    c_ = std::move(other.c_);
    b_eq_ = std::move(other.b_eq_);
    cone_sizes_ = std::move(other.cone_sizes_);
    workspace_ = std::move(other.workspace_);
  }
  return *this;
}

idxint ECOSData::numConeRows() const
{
  return std::accumulate(cone_sizes_.begin(), cone_sizes_.end(), num_orthant_);
}

void ECOSData::setup()
{
  if (workspace_ != nullptr)
  {
    throw std::runtime_error{
      "ECOSData::setup: workspace already set up (call cleanup() first)"};
  }

  const idxint m = numConeRows();

  if (G_.nnz == 0)
  {
    throw std::runtime_error{"ECOSData::setup: G matrix is empty (nnz == 0)"};
  }
  if (G_.nrows != m || G_.ncols != num_variables_)
  {
    throw std::runtime_error{
      "ECOSData::setup: G is " + std::to_string(G_.nrows) + "x" +
      std::to_string(G_.ncols) + ", expected " + std::to_string(m) + "x" +
      std::to_string(num_variables_)};
  }
  if (static_cast<idxint>(h_.size()) != m)
  {
    throw std::runtime_error{"ECOSData::setup: h size mismatch (expected " +
                             std::to_string(m) + ", got " +
                             std::to_string(h_.size()) + ")"};
  }
  if (static_cast<idxint>(c_.size()) != num_variables_)
  {
    throw std::runtime_error{"ECOSData::setup: c size mismatch (expected " +
                             std::to_string(num_variables_) + ", got " +
                             std::to_string(c_.size()) + ")"};
  }

  if (num_equality_ > 0)
  {
    if (A_eq_.nnz == 0)
    {
      throw std::runtime_error{
        "ECOSData::setup: A_eq matrix is empty but num_equality_ = " +
        std::to_string(num_equality_)};
    }
    if (static_cast<idxint>(b_eq_.size()) != num_equality_)
    {
      throw std::runtime_error{"ECOSData::setup: b_eq size mismatch (expected " +
                               std::to_string(num_equality_) + ", got " +
                               std::to_string(b_eq_.size()) + ")"};
    }
  }

  pfloat* Apr = (num_equality_ > 0) ? A_eq_.data.data() : nullptr;
  idxint* Ajc = (num_equality_ > 0) ? A_eq_.col_ptrs.data() : nullptr;
  idxint* Air = (num_equality_ > 0) ? A_eq_.row_indices.data() : nullptr;
  pfloat* beq = (num_equality_ > 0) ? b_eq_.data() : nullptr;
  idxint* q = cone_sizes_.empty() ? nullptr : cone_sizes_.data();

  pwork* raw = ECOS_setup(num_variables_,                          // n
                          m,                                       // m
                          num_equality_,                           // p
                          num_orthant_,                            // l
                          static_cast<idxint>(cone_sizes_.size()), // ncones
                          q,                                       // q
                          0,                                       // e
                          G_.data.data(),
                          G_.col_ptrs.data(),
                          G_.row_indices.data(),
                          Apr,
                          Ajc,
                          Air,
                          c_.data(),
                          h_.data(),
                          beq);

  if (raw == nullptr)
  {
    throw std::runtime_error{"ECOS_setup failed: invalid problem data"};
  }

  workspace_.reset(raw);
}

void ECOSData::cleanup()
{
  workspace_.reset();
}

}  // namespace lcs_sim
