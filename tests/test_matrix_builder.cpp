#include "pmatch/core/errors.h"
#include "pmatch/matching/compatibility_matrix.h"
#include "pmatch/matching/matrix_builder.h"
#include "pmatch/matching/score_source.h"
#include "pmatch/matching/worker_pool.h"

#include <catch2/catch.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

using namespace pmatch;

namespace {

// Deterministic synthetic scores with repeated values so ties are exercised.
class FormulaScoreSource final : public matching::IScoreSource {
 public:
  FormulaScoreSource(std::size_t rows, std::size_t cols) : rows_(rows), cols_(cols) {}

  [[nodiscard]] std::size_t rows() const override { return rows_; }
  [[nodiscard]] std::size_t cols() const override { return cols_; }
  [[nodiscard]] double score(std::size_t row, std::size_t col) const override {
    return static_cast<double>((row * 7 + col * 3) % 10) / 10.0;
  }

 private:
  std::size_t rows_;
  std::size_t cols_;
};

class ThrowingScoreSource final : public matching::IScoreSource {
 public:
  [[nodiscard]] std::size_t rows() const override { return 20; }
  [[nodiscard]] std::size_t cols() const override { return 20; }
  [[nodiscard]] double score(std::size_t row, std::size_t col) const override {
    if (row == 13 && col == 4) {
      throw core::MatchError(core::MatchErrorKind::kComputationInconsistency, "bad cell");
    }
    return 0.5;
  }
};

}  // namespace

TEST_CASE("build_dense holds every source score", "[matching][matrix]") {
  const matching::WorkerPool pool(3);
  const matching::MatrixBuilder builder(pool, matching::MatrixBuildOptions{4, 32, 10'000});
  const FormulaScoreSource source(17, 11);

  const auto matrix = builder.build_dense(source);
  REQUIRE(matrix.layout() == matching::CompatibilityMatrix::Layout::kDense);
  REQUIRE(matrix.rows() == 17);
  REQUIRE(matrix.cols() == 11);
  CHECK(matrix.retained_cells() == 17 * 11);
  for (std::size_t r = 0; r < 17; ++r) {
    for (std::size_t c = 0; c < 11; ++c) {
      CHECK(matrix.at(r, c) == source.score(r, c));
    }
  }
}

TEST_CASE("build_sparse keeps the best candidates per row", "[matching][matrix]") {
  const matching::WorkerPool pool(2);
  const matching::MatrixBuilder builder(pool, matching::MatrixBuildOptions{5, 4, 10'000});
  const FormulaScoreSource source(12, 30);

  const auto sparse = builder.build_sparse(source);
  const auto dense = builder.build_dense(source);
  REQUIRE(sparse.layout() == matching::CompatibilityMatrix::Layout::kSparse);
  CHECK(sparse.retained_cells() == 12 * 4);
  CHECK_THROWS_AS(sparse.at(0, 0), std::logic_error);

  for (std::size_t r = 0; r < 12; ++r) {
    const auto kept = sparse.top_candidates(r, 100);
    REQUIRE(kept.size() == 4);
    for (std::size_t i = 1; i < kept.size(); ++i) {
      CHECK(matching::ranks_before(kept[i - 1], kept[i]));
    }
    // Same cells the dense layout ranks first.
    const auto expected = dense.top_candidates(r, 4);
    for (std::size_t i = 0; i < kept.size(); ++i) {
      CHECK(kept[i].row == expected[i].row);
      CHECK(kept[i].col == expected[i].col);
      CHECK(kept[i].score == expected[i].score);
    }
  }
}

TEST_CASE("build_sparse with fewer cols than candidates keeps all cols", "[matching][matrix]") {
  const matching::WorkerPool pool(1);
  const matching::MatrixBuilder builder(pool, matching::MatrixBuildOptions{});
  const FormulaScoreSource source(3, 2);

  const auto sparse = builder.build_sparse(source);
  CHECK(sparse.retained_cells() == 6);
}

TEST_CASE("top_candidates_subset restricts rows and cols", "[matching][matrix]") {
  const matching::WorkerPool pool(2);
  const matching::MatrixBuilder builder(pool, matching::MatrixBuildOptions{2, 3, 10'000});
  const FormulaScoreSource source(10, 10);

  const std::vector<std::uint32_t> rows = {1, 4, 9};
  const std::vector<std::uint32_t> cols = {0, 2, 5, 7};
  const auto lists = builder.top_candidates_subset(source, rows, cols, 2);

  REQUIRE(lists.size() == 3);
  for (std::size_t i = 0; i < lists.size(); ++i) {
    REQUIRE(lists[i].size() == 2);
    CHECK(matching::ranks_before(lists[i][0], lists[i][1]));
    for (const auto& cell : lists[i]) {
      CHECK(cell.row == rows[i]);
      CHECK((cell.col == 0 || cell.col == 2 || cell.col == 5 || cell.col == 7));
      CHECK(cell.score == source.score(cell.row, cell.col));
    }
  }
}

TEST_CASE("build_dense refuses matrices over the cell limit", "[matching][matrix]") {
  const matching::WorkerPool pool(1);
  const matching::MatrixBuilder builder(pool, matching::MatrixBuildOptions{16, 8, 99});
  const FormulaScoreSource source(10, 10);

  try {
    (void)builder.build_dense(source);
    FAIL("expected MatchError");
  } catch (const core::MatchError& e) {
    CHECK(e.kind() == core::MatchErrorKind::kResourceExhaustion);
  }

  // The sparse layout is not bound by the dense limit.
  CHECK(builder.build_sparse(source).retained_cells() == 80);
}

TEST_CASE("score source failures propagate out of the builder", "[matching][matrix]") {
  const matching::WorkerPool pool(4);
  const matching::MatrixBuilder builder(pool, matching::MatrixBuildOptions{3, 5, 10'000});
  const ThrowingScoreSource source;

  CHECK_THROWS_AS(builder.build_dense(source), core::MatchError);
  CHECK_THROWS_AS(builder.build_sparse(source), core::MatchError);
}

TEST_CASE("CompatibilityMatrix factories validate their shape", "[matching][matrix]") {
  CHECK_THROWS_AS(matching::CompatibilityMatrix::make_dense(2, 2, std::vector<double>(3, 0.0)),
                  std::invalid_argument);
  CHECK_THROWS_AS(matching::CompatibilityMatrix::make_sparse(
                      2, 2, std::vector<std::vector<matching::ScoredCell>>(1)),
                  std::invalid_argument);
}
