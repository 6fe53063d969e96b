#include "pmatch/matching/compatibility_matrix.h"

#include <algorithm>
#include <stdexcept>

namespace pmatch::matching {

CompatibilityMatrix CompatibilityMatrix::make_dense(const std::size_t rows, const std::size_t cols,
                                                    std::vector<double> cells) {
  if (cells.size() != rows * cols) {
    throw std::invalid_argument("dense matrix cell count does not match rows x cols");
  }
  CompatibilityMatrix m;
  m.layout_ = Layout::kDense;
  m.rows_ = rows;
  m.cols_ = cols;
  m.dense_ = std::move(cells);
  return m;
}

CompatibilityMatrix CompatibilityMatrix::make_sparse(
    const std::size_t rows, const std::size_t cols,
    std::vector<std::vector<ScoredCell>> candidates) {
  if (candidates.size() != rows) {
    throw std::invalid_argument("sparse matrix needs one candidate list per row");
  }
  for (auto& list : candidates) {
    std::sort(list.begin(), list.end(), ranks_before);
  }
  CompatibilityMatrix m;
  m.layout_ = Layout::kSparse;
  m.rows_ = rows;
  m.cols_ = cols;
  m.sparse_ = std::move(candidates);
  return m;
}

double CompatibilityMatrix::at(const std::size_t row, const std::size_t col) const {
  if (layout_ != Layout::kDense) {
    throw std::logic_error("CompatibilityMatrix::at requires a dense matrix");
  }
  return dense_[row * cols_ + col];
}

std::vector<ScoredCell> CompatibilityMatrix::top_candidates(const std::size_t row,
                                                            const std::size_t k) const {
  if (layout_ == Layout::kSparse) {
    const auto& list = sparse_[row];
    const std::size_t n = std::min(k, list.size());
    return {list.begin(), list.begin() + static_cast<std::ptrdiff_t>(n)};
  }

  std::vector<ScoredCell> cells;
  cells.reserve(cols_);
  for (std::size_t c = 0; c < cols_; ++c) {
    cells.push_back({static_cast<std::uint32_t>(row), static_cast<std::uint32_t>(c),
                     dense_[row * cols_ + c]});
  }
  const std::size_t n = std::min(k, cells.size());
  std::partial_sort(cells.begin(), cells.begin() + static_cast<std::ptrdiff_t>(n), cells.end(),
                    ranks_before);
  cells.resize(n);
  return cells;
}

std::size_t CompatibilityMatrix::retained_cells() const {
  if (layout_ == Layout::kDense) {
    return dense_.size();
  }
  std::size_t total = 0;
  for (const auto& list : sparse_) {
    total += list.size();
  }
  return total;
}

}  // namespace pmatch::matching
