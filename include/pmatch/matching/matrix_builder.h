#pragma once

#include "pmatch/matching/compatibility_matrix.h"
#include "pmatch/matching/score_source.h"
#include "pmatch/matching/worker_pool.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pmatch::matching {

struct MatrixBuildOptions {
  std::size_t row_block_size{256};
  std::size_t candidates_per_row{32};
  std::size_t dense_cell_limit{64'000'000};
};

// MatrixBuilder fills a CompatibilityMatrix from an IScoreSource, fanning the rows out
// over a WorkerPool in blocks of row_block_size. Each block writes only its own rows.
//
// Failures:
// - more cells than dense_cell_limit for a dense build, more rows/cols than a 32-bit index
//   can address, or std::bad_alloc while allocating: core::MatchError(kResourceExhaustion)
// - anything the score source throws (e.g. a scorer inconsistency) propagates unchanged
class MatrixBuilder {
 public:
  MatrixBuilder(const WorkerPool& pool, MatrixBuildOptions options)
      : pool_(pool), options_(options) {}

  [[nodiscard]] CompatibilityMatrix build_dense(const IScoreSource& source) const;

  // Keeps the candidates_per_row best cells of each row.
  [[nodiscard]] CompatibilityMatrix build_sparse(const IScoreSource& source) const;

  // Best k cells of each listed row restricted to the listed columns. Row and column
  // values are source indices; result[i] belongs to rows[i] and is in ranks_before order.
  // Used to regenerate candidates for the rows and records left over by a greedy pass.
  [[nodiscard]] std::vector<std::vector<ScoredCell>> top_candidates_subset(
      const IScoreSource& source, const std::vector<std::uint32_t>& rows,
      const std::vector<std::uint32_t>& cols, std::size_t k) const;

  [[nodiscard]] const MatrixBuildOptions& options() const { return options_; }

 private:
  const WorkerPool& pool_;
  MatrixBuildOptions options_;
};

}  // namespace pmatch::matching
