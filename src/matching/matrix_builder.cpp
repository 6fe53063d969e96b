#include "pmatch/matching/matrix_builder.h"

#include "pmatch/core/errors.h"

#include <algorithm>
#include <limits>
#include <new>
#include <string>

namespace pmatch::matching {

namespace {

void check_index_range(const IScoreSource& source) {
  constexpr std::size_t kMaxIndex = std::numeric_limits<std::uint32_t>::max();
  if (source.rows() > kMaxIndex || source.cols() > kMaxIndex) {
    throw core::MatchError(core::MatchErrorKind::kResourceExhaustion,
                           "collection too large to index: " + std::to_string(source.rows()) +
                               " x " + std::to_string(source.cols()));
  }
}

// Bounded selection of the k best cells. The heap keeps the worst retained cell on top
// so a better newcomer can replace it in O(log k).
class TopK {
 public:
  explicit TopK(std::size_t k) : k_(k) { heap_.reserve(k); }

  void offer(const ScoredCell& cell) {
    if (k_ == 0) {
      return;
    }
    if (heap_.size() < k_) {
      heap_.push_back(cell);
      std::push_heap(heap_.begin(), heap_.end(), ranks_before);
      return;
    }
    if (ranks_before(cell, heap_.front())) {
      std::pop_heap(heap_.begin(), heap_.end(), ranks_before);
      heap_.back() = cell;
      std::push_heap(heap_.begin(), heap_.end(), ranks_before);
    }
  }

  std::vector<ScoredCell> take_sorted() {
    std::sort_heap(heap_.begin(), heap_.end(), ranks_before);
    return std::move(heap_);
  }

 private:
  std::size_t k_;
  std::vector<ScoredCell> heap_;
};

}  // namespace

CompatibilityMatrix MatrixBuilder::build_dense(const IScoreSource& source) const {
  check_index_range(source);
  const std::size_t rows = source.rows();
  const std::size_t cols = source.cols();
  if (cols != 0 && rows > options_.dense_cell_limit / cols) {
    throw core::MatchError(core::MatchErrorKind::kResourceExhaustion,
                           "dense matrix of " + std::to_string(rows) + " x " +
                               std::to_string(cols) + " exceeds the cell limit of " +
                               std::to_string(options_.dense_cell_limit));
  }

  std::vector<double> cells;
  try {
    cells.resize(rows * cols);
  } catch (const std::bad_alloc&) {
    throw core::MatchError(core::MatchErrorKind::kResourceExhaustion,
                           "unable to allocate dense matrix of " + std::to_string(rows) + " x " +
                               std::to_string(cols));
  }

  pool_.run_blocks(rows, options_.row_block_size, [&](std::size_t begin, std::size_t end) {
    for (std::size_t r = begin; r < end; ++r) {
      double* row = cells.data() + r * cols;
      for (std::size_t c = 0; c < cols; ++c) {
        row[c] = source.score(r, c);
      }
    }
  });

  return CompatibilityMatrix::make_dense(rows, cols, std::move(cells));
}

CompatibilityMatrix MatrixBuilder::build_sparse(const IScoreSource& source) const {
  check_index_range(source);
  const std::size_t rows = source.rows();
  const std::size_t cols = source.cols();
  const std::size_t k = std::min(options_.candidates_per_row, cols);

  std::vector<std::vector<ScoredCell>> candidates;
  try {
    candidates.resize(rows);
    pool_.run_blocks(rows, options_.row_block_size, [&](std::size_t begin, std::size_t end) {
      for (std::size_t r = begin; r < end; ++r) {
        TopK top(k);
        for (std::size_t c = 0; c < cols; ++c) {
          top.offer({static_cast<std::uint32_t>(r), static_cast<std::uint32_t>(c),
                     source.score(r, c)});
        }
        candidates[r] = top.take_sorted();
      }
    });
  } catch (const std::bad_alloc&) {
    throw core::MatchError(core::MatchErrorKind::kResourceExhaustion,
                           "unable to allocate candidate lists for " + std::to_string(rows) +
                               " rows");
  }

  return CompatibilityMatrix::make_sparse(rows, cols, std::move(candidates));
}

std::vector<std::vector<ScoredCell>> MatrixBuilder::top_candidates_subset(
    const IScoreSource& source, const std::vector<std::uint32_t>& rows,
    const std::vector<std::uint32_t>& cols, const std::size_t k) const {
  const std::size_t keep = std::min(k, cols.size());
  std::vector<std::vector<ScoredCell>> result;
  try {
    result.resize(rows.size());
    pool_.run_blocks(rows.size(), options_.row_block_size,
                     [&](std::size_t begin, std::size_t end) {
                       for (std::size_t i = begin; i < end; ++i) {
                         TopK top(keep);
                         for (const auto c : cols) {
                           top.offer({rows[i], c, source.score(rows[i], c)});
                         }
                         result[i] = top.take_sorted();
                       }
                     });
  } catch (const std::bad_alloc&) {
    throw core::MatchError(core::MatchErrorKind::kResourceExhaustion,
                           "unable to allocate refill candidates for " +
                               std::to_string(rows.size()) + " rows");
  }
  return result;
}

}  // namespace pmatch::matching
