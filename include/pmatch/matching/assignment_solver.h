#pragma once

#include "pmatch/matching/compatibility_matrix.h"
#include "pmatch/matching/matrix_builder.h"
#include "pmatch/matching/score_source.h"

#include <cstddef>
#include <string>
#include <vector>

namespace pmatch::matching {

// kAuto is only valid as a request; select_mode() always resolves it.
enum class SolverMode { kAuto, kExact, kHeuristic };

// "auto" | "exact" | "heuristic". solver_mode_from_string throws std::invalid_argument.
std::string solver_mode_to_string(SolverMode mode);
SolverMode solver_mode_from_string(const std::string& s);

struct SolverConfig {
  SolverMode requested{SolverMode::kAuto};
  // auto selects exact when rows * cols <= exact_max_cells
  std::size_t exact_max_cells{16'000'000};
  // hard ceiling for any dense matrix; an explicit exact request above it fails the run
  std::size_t dense_cell_limit{64'000'000};
  std::size_t candidates_per_row{32};
  std::size_t repair_passes{4};
};

struct ModeDecision {
  SolverMode mode{SolverMode::kExact};
  std::string reason;
};

// A one-to-one assignment over canonical row/col indices. cells are sorted by row.
struct Assignment {
  std::vector<ScoredCell> cells;
  double total_score{0.0};
  std::size_t refill_rounds{0};
  std::size_t repair_passes{0};
  std::size_t repair_moves{0};
  // heuristic only: the repaired row-greedy pairing scored higher and was kept
  bool from_row_baseline{false};
};

// Local repair accepts a move only if it raises the total by more than this.
constexpr double kImprovementEpsilon = 1e-12;

// AssignmentSolver maximizes the total composite score over one-to-one pairs.
//
// Exact mode runs Kuhn-Munkres with potentials on the dense matrix (transposed internally
// when there are more rows than cols) and is optimal. Among equal-total optima it returns
// the lexicographically first one: rows in canonical order each take the lowest col that
// still allows an optimal completion.
//
// Heuristic mode commits candidate cells greedily in ranks_before order, regenerates
// candidates for whatever is left until the smaller side is exhausted, then runs bounded
// local repair (move to a better free record, reassign a record to a better unmatched
// profile, or swap two records). A settling pass then moves rows to lower cols through
// zero-gain moves and swaps, the same preference exact mode applies. The row-greedy
// baseline goes through the same repair, and the higher of the two totals is returned,
// so heuristic mode never scores below greedy_row_baseline.
//
// Both modes match min(rows, cols) pairs and are deterministic for a given matrix.
class AssignmentSolver {
 public:
  explicit AssignmentSolver(SolverConfig config) : config_(config) {}

  // Throws core::MatchError(kResourceExhaustion) when exact is requested for more cells
  // than dense_cell_limit. Never downgrades an explicit request.
  [[nodiscard]] ModeDecision select_mode(std::size_t rows, std::size_t cols) const;

  // Requires a dense matrix.
  [[nodiscard]] Assignment solve_exact(const CompatibilityMatrix& matrix) const;

  // Requires a sparse matrix built from source; source and builder are used to refill
  // candidates and to score swap partners that were not retained.
  [[nodiscard]] Assignment solve_heuristic(const IScoreSource& source,
                                           const CompatibilityMatrix& matrix,
                                           const MatrixBuilder& builder) const;

  [[nodiscard]] const SolverConfig& config() const { return config_; }

 private:
  SolverConfig config_;
};

// Row-by-row best available record (rows in canonical order, ties to the lower col).
// The classic greedy pairing; kept as a baseline for comparing solver quality.
[[nodiscard]] Assignment greedy_row_baseline(const IScoreSource& source);

// Throws core::MatchError(kComputationInconsistency) if any index repeats or is out of
// range, any score is outside [0, 1], or fewer than min(rows, cols) pairs were produced.
void verify_assignment(const Assignment& assignment, std::size_t rows, std::size_t cols);

}  // namespace pmatch::matching
