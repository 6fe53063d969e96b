#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pmatch::matching {

// One retained matrix cell. row/col are canonical indices (profiles and records sorted by id).
struct ScoredCell {
  std::uint32_t row{0};
  std::uint32_t col{0};
  double score{0.0};
};

// Strict ordering used wherever cells compete: higher score first, then lower row, then
// lower col. Because rows and cols follow id order this is the (profile_id, record_id)
// lexicographic tie-break.
[[nodiscard]] inline bool ranks_before(const ScoredCell& a, const ScoredCell& b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  if (a.row != b.row) {
    return a.row < b.row;
  }
  return a.col < b.col;
}

// CompatibilityMatrix is the explicit score table handed from the scoring stage to the
// solving stage. It is built once by MatrixBuilder and is read-only afterwards.
//
// kDense  holds all rows x cols scores (row-major).
// kSparse holds, per row, the best-ranked candidate cells only (top-K, ranks_before order);
//         cells outside the lists were discarded while building.
class CompatibilityMatrix {
 public:
  enum class Layout { kDense, kSparse };

  CompatibilityMatrix() = default;

  static CompatibilityMatrix make_dense(std::size_t rows, std::size_t cols,
                                        std::vector<double> cells);
  static CompatibilityMatrix make_sparse(std::size_t rows, std::size_t cols,
                                         std::vector<std::vector<ScoredCell>> candidates);

  [[nodiscard]] Layout layout() const { return layout_; }
  [[nodiscard]] std::size_t rows() const { return rows_; }
  [[nodiscard]] std::size_t cols() const { return cols_; }

  // Dense only. Throws std::logic_error on a sparse matrix.
  [[nodiscard]] double at(std::size_t row, std::size_t col) const;

  // Best k cells of a row in ranks_before order. Works for both layouts; a sparse row
  // yields at most its retained candidates.
  [[nodiscard]] std::vector<ScoredCell> top_candidates(std::size_t row, std::size_t k) const;

  // Number of scores actually held in memory.
  [[nodiscard]] std::size_t retained_cells() const;

 private:
  Layout layout_{Layout::kDense};
  std::size_t rows_{0};
  std::size_t cols_{0};
  std::vector<double> dense_;
  std::vector<std::vector<ScoredCell>> sparse_;
};

}  // namespace pmatch::matching
