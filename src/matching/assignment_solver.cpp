#include "pmatch/matching/assignment_solver.h"

#include "pmatch/core/errors.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

namespace pmatch::matching {

namespace {

constexpr std::uint32_t kUnassigned = std::numeric_limits<std::uint32_t>::max();

// Working state of the heuristic: both directions of the partial matching plus the score
// of each committed row.
struct MatchingState {
  explicit MatchingState(std::size_t rows, std::size_t cols)
      : row_to_col(rows, kUnassigned), col_to_row(cols, kUnassigned), row_score(rows, 0.0) {}

  [[nodiscard]] bool row_free(std::uint32_t r) const { return row_to_col[r] == kUnassigned; }
  [[nodiscard]] bool col_free(std::uint32_t c) const { return col_to_row[c] == kUnassigned; }

  void assign(std::uint32_t r, std::uint32_t c, double score) {
    row_to_col[r] = c;
    col_to_row[c] = r;
    row_score[r] = score;
  }

  void release_row(std::uint32_t r) {
    if (!row_free(r)) {
      col_to_row[row_to_col[r]] = kUnassigned;
      row_to_col[r] = kUnassigned;
      row_score[r] = 0.0;
    }
  }

  std::vector<std::uint32_t> row_to_col;
  std::vector<std::uint32_t> col_to_row;
  std::vector<double> row_score;
  std::size_t matched{0};
};

void commit_greedy(std::vector<ScoredCell>& cells, MatchingState& state) {
  std::sort(cells.begin(), cells.end(), ranks_before);
  for (const auto& cell : cells) {
    if (state.row_free(cell.row) && state.col_free(cell.col)) {
      state.assign(cell.row, cell.col, cell.score);
      ++state.matched;
    }
  }
}

Assignment to_assignment(const MatchingState& state) {
  Assignment out;
  for (std::size_t r = 0; r < state.row_to_col.size(); ++r) {
    if (state.row_to_col[r] != kUnassigned) {
      out.cells.push_back({static_cast<std::uint32_t>(r), state.row_to_col[r], state.row_score[r]});
      out.total_score += state.row_score[r];
    }
  }
  return out;
}

// Tries the candidates of row r best-first and applies the first strict improvement.
bool improve_row(std::uint32_t r, const std::vector<ScoredCell>& candidates,
                 const IScoreSource& source, MatchingState& state) {
  const bool assigned = !state.row_free(r);
  const double current = state.row_score[r];
  for (const auto& cand : candidates) {
    const std::uint32_t target = cand.col;
    if (assigned && target == state.row_to_col[r]) {
      continue;
    }

    if (state.col_free(target)) {
      if (cand.score - current > kImprovementEpsilon) {
        state.release_row(r);
        state.assign(r, target, cand.score);
        if (!assigned) {
          ++state.matched;
        }
        return true;
      }
      continue;
    }

    const std::uint32_t other = state.col_to_row[target];
    const double other_score = state.row_score[other];
    if (!assigned) {
      // r takes the record over; the current holder becomes unmatched
      if (cand.score - other_score > kImprovementEpsilon) {
        state.release_row(other);
        state.assign(r, target, cand.score);
        return true;
      }
      continue;
    }

    const std::uint32_t own = state.row_to_col[r];
    const double other_on_own = source.score(other, own);
    const double gain = (cand.score + other_on_own) - (current + other_score);
    if (gain > kImprovementEpsilon) {
      state.assign(r, target, cand.score);
      state.assign(other, own, other_on_own);
      return true;
    }
  }
  return false;
}

// Repair passes over every row; returns the passes run and adds applied moves to moves.
std::size_t run_repair(const std::vector<std::vector<ScoredCell>>& candidates,
                       const IScoreSource& source, MatchingState& state, std::size_t max_passes,
                       std::size_t& moves) {
  std::size_t passes = 0;
  for (std::size_t pass = 0; pass < max_passes; ++pass) {
    ++passes;
    bool improved = false;
    for (std::uint32_t r = 0; r < state.row_to_col.size(); ++r) {
      if (improve_row(r, candidates[r], source, state)) {
        ++moves;
        improved = true;
      }
    }
    if (!improved) {
      break;
    }
  }
  return passes;
}

// Moves each row, in canonical order, to the lowest record among its candidates that it can
// take from a free column or a later row without lowering the total by more than
// kImprovementEpsilon. Every move makes the row -> col vector lexicographically smaller
// (an unmatched row counts as larger than any col), so the loop terminates.
void settle_ties(const std::vector<std::vector<ScoredCell>>& candidates,
                 const IScoreSource& source, MatchingState& state, std::size_t max_passes) {
  for (std::size_t pass = 0; pass < max_passes; ++pass) {
    bool changed = false;
    for (std::uint32_t r = 0; r < state.row_to_col.size(); ++r) {
      const bool assigned = !state.row_free(r);
      const std::uint32_t own = state.row_to_col[r];
      const ScoredCell* best = nullptr;
      for (const auto& cand : candidates[r]) {
        if ((assigned && cand.col >= own) || (best != nullptr && cand.col >= best->col)) {
          continue;
        }
        double gain = cand.score - state.row_score[r];
        if (!state.col_free(cand.col)) {
          const std::uint32_t other = state.col_to_row[cand.col];
          if (other < r) {
            continue;
          }
          gain -= state.row_score[other];
          if (assigned) {
            gain += source.score(other, own);
          }
        }
        if (gain >= -kImprovementEpsilon) {
          best = &cand;
        }
      }
      if (best == nullptr) {
        continue;
      }

      const std::uint32_t target = best->col;
      if (state.col_free(target)) {
        state.release_row(r);
        state.assign(r, target, best->score);
        if (!assigned) {
          ++state.matched;
        }
      } else {
        const std::uint32_t other = state.col_to_row[target];
        if (assigned) {
          state.assign(r, target, best->score);
          state.assign(other, own, source.score(other, own));
        } else {
          state.release_row(other);
          state.assign(r, target, best->score);
        }
      }
      changed = true;
    }
    if (!changed) {
      break;
    }
  }
}

MatchingState row_greedy_state(const IScoreSource& source) {
  const std::size_t rows = source.rows();
  const std::size_t cols = source.cols();
  MatchingState state(rows, cols);
  for (std::uint32_t r = 0; r < rows && state.matched < cols; ++r) {
    std::uint32_t best = kUnassigned;
    double best_score = -1.0;
    for (std::uint32_t c = 0; c < cols; ++c) {
      if (!state.col_free(c)) {
        continue;
      }
      const double s = source.score(r, c);
      if (s > best_score) {
        best_score = s;
        best = c;
      }
    }
    state.assign(r, best, best_score);
    ++state.matched;
  }
  return state;
}

constexpr double kTightEpsilon = 1e-9;
constexpr std::uint32_t kPadding = kUnassigned - 1;

// Turns one optimal matching into the lexicographically first optimal matching: rows in
// canonical order each take the lowest record that still allows an optimal completion,
// and a row is only left unmatched when no record allows one.
//
// With an optimal dual (row_dual, col_dual) and the smaller side padded with zero-cost
// dummies of dual 0, the optimal matchings are exactly the perfect matchings on tight edges
// (reduced cost within kTightEpsilon of 0). A real row may sit on a padding column when its
// dual is 0, and a real column may be held by a padding row when its dual is 0. row_to /
// col_to use kUnassigned for "matched to padding".
class TightMatching {
 public:
  TightMatching(const CompatibilityMatrix& matrix, std::vector<double> row_dual,
                std::vector<double> col_dual, std::vector<std::uint32_t> row_to,
                std::vector<std::uint32_t> col_to)
      : matrix_(matrix),
        rows_(static_cast<std::uint32_t>(matrix.rows())),
        cols_(static_cast<std::uint32_t>(matrix.cols())),
        row_dual_(std::move(row_dual)),
        col_dual_(std::move(col_dual)),
        row_to_(std::move(row_to)),
        col_to_(std::move(col_to)),
        in_reach_(rows_, 0),
        next_col_(rows_, kUnassigned),
        via_(rows_, kUnassigned) {}

  void canonicalize() {
    for (std::uint32_t r = 0; r < rows_; ++r) {
      settle_row(r);
    }
  }

  [[nodiscard]] const std::vector<std::uint32_t>& row_to_col() const { return row_to_; }

 private:
  [[nodiscard]] bool tight(std::uint32_t r, std::uint32_t c) const {
    return -matrix_.at(r, c) - row_dual_[r] - col_dual_[c] <= kTightEpsilon;
  }
  [[nodiscard]] bool row_may_idle(std::uint32_t r) const {
    return rows_ > cols_ && std::fabs(row_dual_[r]) <= kTightEpsilon;
  }
  [[nodiscard]] bool col_may_idle(std::uint32_t c) const {
    return cols_ > rows_ && std::fabs(col_dual_[c]) <= kTightEpsilon;
  }
  // Columns held by rows before r are fixed.
  [[nodiscard]] bool col_open_for(std::uint32_t c, std::uint32_t r) const {
    return col_to_[c] == kUnassigned || col_to_[c] >= r;
  }

  void settle_row(std::uint32_t r) {
    const std::uint32_t current = row_to_[r];
    std::uint32_t first = kUnassigned;
    for (std::uint32_t c = 0; c < cols_ && first == kUnassigned; ++c) {
      if (col_open_for(c, r) && tight(r, c)) {
        first = c;
      }
    }
    if (first == current) {
      return;
    }

    collect_reach(r);
    for (std::uint32_t c = first; c < cols_ && c != current; ++c) {
      if (!col_open_for(c, r) || !tight(r, c)) {
        continue;
      }
      const std::uint32_t holder = col_to_[c];
      if (holder == kUnassigned ? padding_rows_reach_ : in_reach_[holder] != 0) {
        rotate(r, c);
        return;
      }
    }
  }

  // Marks every later row that can hand over a path ending at row r's current column
  // (or at a padding column when r is unmatched). next_col_[y] is the column y moves to;
  // kPadding means y becomes unmatched and via_[y] is the unmatched row whose padding
  // column it takes (kUnassigned when that column is r's own).
  void collect_reach(std::uint32_t r) {
    std::fill(in_reach_.begin(), in_reach_.end(), 0);
    padding_rows_reach_ = false;
    padding_cols_open_ = false;
    padding_next_col_ = kUnassigned;

    std::vector<std::uint32_t> col_queue;
    std::vector<std::uint32_t> row_queue;

    const auto add_row = [&](std::uint32_t y, std::uint32_t col, std::uint32_t via) {
      in_reach_[y] = 1;
      next_col_[y] = col;
      via_[y] = via;
      row_queue.push_back(y);
    };
    const auto open_padding_cols = [&](std::uint32_t via) {
      if (padding_cols_open_) {
        return;
      }
      padding_cols_open_ = true;
      for (std::uint32_t y = r + 1; y < rows_; ++y) {
        if (in_reach_[y] == 0 && row_to_[y] != kUnassigned && row_may_idle(y)) {
          add_row(y, kPadding, via);
        }
      }
    };

    if (row_to_[r] == kUnassigned) {
      open_padding_cols(kUnassigned);
    } else {
      col_queue.push_back(row_to_[r]);
    }

    std::size_t col_head = 0;
    std::size_t row_head = 0;
    while (col_head < col_queue.size() || row_head < row_queue.size()) {
      if (row_head < row_queue.size()) {
        const std::uint32_t y = row_queue[row_head++];
        if (row_to_[y] != kUnassigned) {
          col_queue.push_back(row_to_[y]);
        } else {
          open_padding_cols(y);
        }
        continue;
      }

      const std::uint32_t x = col_queue[col_head++];
      for (std::uint32_t y = r + 1; y < rows_; ++y) {
        if (in_reach_[y] == 0 && row_to_[y] != x && tight(y, x)) {
          add_row(y, x, kUnassigned);
        }
      }
      if (!padding_rows_reach_ && col_may_idle(x)) {
        padding_rows_reach_ = true;
        padding_next_col_ = x;
        for (std::uint32_t c = 0; c < cols_; ++c) {
          if (col_to_[c] == kUnassigned) {
            col_queue.push_back(c);
          }
        }
      }
    }
  }

  // Gives column c to row r and shifts every displaced holder along its reach path until
  // the column r gave up is taken.
  void rotate(std::uint32_t r, std::uint32_t c) {
    std::uint32_t cur = col_to_[c];
    bool padding = cur == kUnassigned;
    row_to_[r] = c;
    col_to_[c] = r;

    for (std::size_t steps = 0;; ++steps) {
      if (steps > static_cast<std::size_t>(rows_) + cols_ + 1) {
        throw core::MatchError(core::MatchErrorKind::kComputationInconsistency,
                               "tie resolution did not close its path");
      }
      if (padding) {
        const std::uint32_t x = padding_next_col_;
        const std::uint32_t holder = col_to_[x];
        col_to_[x] = kUnassigned;
        if (holder == r) {
          return;
        }
        cur = holder;
        padding = false;
        continue;
      }

      const std::uint32_t x = next_col_[cur];
      if (x == kPadding) {
        row_to_[cur] = kUnassigned;
        if (via_[cur] == kUnassigned) {
          return;
        }
        cur = via_[cur];
        continue;
      }
      const std::uint32_t holder = col_to_[x];
      row_to_[cur] = x;
      col_to_[x] = cur;
      if (holder == r) {
        return;
      }
      if (holder == kUnassigned) {
        padding = true;
      } else {
        cur = holder;
      }
    }
  }

  const CompatibilityMatrix& matrix_;
  std::uint32_t rows_;
  std::uint32_t cols_;
  std::vector<double> row_dual_;
  std::vector<double> col_dual_;
  std::vector<std::uint32_t> row_to_;
  std::vector<std::uint32_t> col_to_;

  std::vector<char> in_reach_;
  std::vector<std::uint32_t> next_col_;
  std::vector<std::uint32_t> via_;
  bool padding_rows_reach_{false};
  bool padding_cols_open_{false};
  std::uint32_t padding_next_col_{kUnassigned};
};

}  // namespace

std::string solver_mode_to_string(const SolverMode mode) {
  switch (mode) {
    case SolverMode::kAuto:
      return "auto";
    case SolverMode::kExact:
      return "exact";
    case SolverMode::kHeuristic:
      return "heuristic";
  }
  return "auto";
}

SolverMode solver_mode_from_string(const std::string& s) {
  if (s == "auto") {
    return SolverMode::kAuto;
  }
  if (s == "exact") {
    return SolverMode::kExact;
  }
  if (s == "heuristic") {
    return SolverMode::kHeuristic;
  }
  throw std::invalid_argument("unknown solver mode: " + s);
}

ModeDecision AssignmentSolver::select_mode(const std::size_t rows, const std::size_t cols) const {
  const bool fits = cols == 0 || rows <= config_.dense_cell_limit / cols;
  const std::string cells = std::to_string(rows) + " x " + std::to_string(cols);

  switch (config_.requested) {
    case SolverMode::kExact:
      if (!fits) {
        throw core::MatchError(core::MatchErrorKind::kResourceExhaustion,
                               "exact mode requested but " + cells +
                                   " exceeds the dense cell limit of " +
                                   std::to_string(config_.dense_cell_limit));
      }
      return {SolverMode::kExact, "exact requested"};
    case SolverMode::kHeuristic:
      return {SolverMode::kHeuristic, "heuristic requested"};
    case SolverMode::kAuto:
      break;
  }

  const std::size_t limit = std::min(config_.exact_max_cells, config_.dense_cell_limit);
  if (cols == 0 || rows <= limit / cols) {
    return {SolverMode::kExact,
            "auto: " + cells + " within exact limit of " + std::to_string(limit) + " cells"};
  }
  return {SolverMode::kHeuristic,
          "auto: " + cells + " exceeds exact limit of " + std::to_string(limit) + " cells"};
}

Assignment AssignmentSolver::solve_exact(const CompatibilityMatrix& matrix) const {
  if (matrix.layout() != CompatibilityMatrix::Layout::kDense) {
    throw std::logic_error("exact solver requires a dense matrix");
  }

  // Minimize cost = -score on an n x m problem with n <= m (1-based, column 0 is the
  // virtual start). When rows > cols the matrix is read transposed.
  const bool transposed = matrix.rows() > matrix.cols();
  const std::size_t n = transposed ? matrix.cols() : matrix.rows();
  const std::size_t m = transposed ? matrix.rows() : matrix.cols();
  const auto cost = [&](std::size_t i, std::size_t j) {
    return transposed ? -matrix.at(j - 1, i - 1) : -matrix.at(i - 1, j - 1);
  };

  constexpr double kInf = std::numeric_limits<double>::infinity();
  std::vector<double> u(n + 1, 0.0);
  std::vector<double> v(m + 1, 0.0);
  std::vector<std::size_t> p(m + 1, 0);
  std::vector<std::size_t> way(m + 1, 0);
  std::vector<double> minv(m + 1);
  std::vector<char> used(m + 1);

  for (std::size_t i = 1; i <= n; ++i) {
    p[0] = i;
    std::size_t j0 = 0;
    std::fill(minv.begin(), minv.end(), kInf);
    std::fill(used.begin(), used.end(), 0);
    do {
      used[j0] = 1;
      const std::size_t i0 = p[j0];
      double delta = kInf;
      std::size_t j1 = 0;
      for (std::size_t j = 1; j <= m; ++j) {
        if (used[j] != 0) {
          continue;
        }
        const double cur = cost(i0, j) - u[i0] - v[j];
        if (cur < minv[j]) {
          minv[j] = cur;
          way[j] = j0;
        }
        if (minv[j] < delta) {
          delta = minv[j];
          j1 = j;
        }
      }
      if (j1 == 0) {
        throw core::MatchError(core::MatchErrorKind::kComputationInconsistency,
                               "assignment search found no augmenting column");
      }
      for (std::size_t j = 0; j <= m; ++j) {
        if (used[j] != 0) {
          u[p[j]] += delta;
          v[j] -= delta;
        } else {
          minv[j] -= delta;
        }
      }
      j0 = j1;
    } while (p[j0] != 0);
    do {
      const std::size_t j1 = way[j0];
      p[j0] = p[j1];
      j0 = j1;
    } while (j0 != 0);
  }

  std::vector<double> row_dual(matrix.rows());
  std::vector<double> col_dual(matrix.cols());
  for (std::size_t i = 1; i <= n; ++i) {
    (transposed ? col_dual : row_dual)[i - 1] = u[i];
  }
  for (std::size_t j = 1; j <= m; ++j) {
    (transposed ? row_dual : col_dual)[j - 1] = v[j];
  }
  std::vector<std::uint32_t> row_to(matrix.rows(), kUnassigned);
  std::vector<std::uint32_t> col_to(matrix.cols(), kUnassigned);
  for (std::size_t j = 1; j <= m; ++j) {
    if (p[j] == 0) {
      continue;
    }
    const std::size_t row = transposed ? j - 1 : p[j] - 1;
    const std::size_t col = transposed ? p[j] - 1 : j - 1;
    row_to[row] = static_cast<std::uint32_t>(col);
    col_to[col] = static_cast<std::uint32_t>(row);
  }

  TightMatching tight(matrix, std::move(row_dual), std::move(col_dual), std::move(row_to),
                      std::move(col_to));
  tight.canonicalize();

  Assignment out;
  out.cells.reserve(n);
  const auto& canonical = tight.row_to_col();
  for (std::size_t row = 0; row < canonical.size(); ++row) {
    if (canonical[row] == kUnassigned) {
      continue;
    }
    const double score = matrix.at(row, canonical[row]);
    out.cells.push_back({static_cast<std::uint32_t>(row), canonical[row], score});
    out.total_score += score;
  }
  return out;
}

Assignment AssignmentSolver::solve_heuristic(const IScoreSource& source,
                                             const CompatibilityMatrix& matrix,
                                             const MatrixBuilder& builder) const {
  if (matrix.layout() != CompatibilityMatrix::Layout::kSparse) {
    throw std::logic_error("heuristic solver requires a sparse matrix");
  }
  const std::size_t rows = matrix.rows();
  const std::size_t cols = matrix.cols();
  const std::size_t k = std::max<std::size_t>(1, config_.candidates_per_row);
  const std::size_t target = std::min(rows, cols);

  std::vector<std::vector<ScoredCell>> candidates(rows);
  std::vector<ScoredCell> pool;
  for (std::size_t r = 0; r < rows; ++r) {
    candidates[r] = matrix.top_candidates(r, k);
    pool.insert(pool.end(), candidates[r].begin(), candidates[r].end());
  }

  MatchingState state(rows, cols);
  commit_greedy(pool, state);

  // Every refill round commits at least the best leftover cell, so this terminates.
  std::size_t refill_rounds = 0;
  while (state.matched < target) {
    std::vector<std::uint32_t> free_rows;
    std::vector<std::uint32_t> free_cols;
    for (std::uint32_t r = 0; r < rows; ++r) {
      if (state.row_free(r)) {
        free_rows.push_back(r);
      }
    }
    for (std::uint32_t c = 0; c < cols; ++c) {
      if (state.col_free(c)) {
        free_cols.push_back(c);
      }
    }
    auto lists = builder.top_candidates_subset(source, free_rows, free_cols, k);
    pool.clear();
    for (auto& list : lists) {
      pool.insert(pool.end(), list.begin(), list.end());
    }
    const std::size_t before = state.matched;
    commit_greedy(pool, state);
    if (state.matched == before) {
      throw core::MatchError(core::MatchErrorKind::kComputationInconsistency,
                             "candidate refill made no progress");
    }
    ++refill_rounds;
  }

  std::size_t moves = 0;
  const std::size_t passes = run_repair(candidates, source, state, config_.repair_passes, moves);
  settle_ties(candidates, source, state, config_.repair_passes);
  Assignment out = to_assignment(state);

  // The row-greedy pairing is one O(rows * cols) sweep; repaired, it bounds the result
  // from below.
  MatchingState baseline = row_greedy_state(source);
  std::size_t baseline_moves = 0;
  const std::size_t baseline_passes =
      run_repair(candidates, source, baseline, config_.repair_passes, baseline_moves);
  settle_ties(candidates, source, baseline, config_.repair_passes);
  Assignment seeded = to_assignment(baseline);
  if (seeded.total_score > out.total_score + kImprovementEpsilon) {
    seeded.refill_rounds = refill_rounds;
    seeded.repair_passes = baseline_passes;
    seeded.repair_moves = baseline_moves;
    seeded.from_row_baseline = true;
    return seeded;
  }

  out.refill_rounds = refill_rounds;
  out.repair_passes = passes;
  out.repair_moves = moves;
  return out;
}

Assignment greedy_row_baseline(const IScoreSource& source) {
  return to_assignment(row_greedy_state(source));
}

void verify_assignment(const Assignment& assignment, const std::size_t rows,
                       const std::size_t cols) {
  const auto fail = [](const std::string& what) {
    throw core::MatchError(core::MatchErrorKind::kComputationInconsistency,
                           "invalid assignment: " + what);
  };

  std::vector<char> row_seen(rows, 0);
  std::vector<char> col_seen(cols, 0);
  for (const auto& cell : assignment.cells) {
    if (cell.row >= rows || cell.col >= cols) {
      fail("index out of range (" + std::to_string(cell.row) + ", " + std::to_string(cell.col) +
           ")");
    }
    if (row_seen[cell.row] != 0) {
      fail("profile index " + std::to_string(cell.row) + " assigned twice");
    }
    if (col_seen[cell.col] != 0) {
      fail("record index " + std::to_string(cell.col) + " assigned twice");
    }
    if (!std::isfinite(cell.score) || cell.score < 0.0 || cell.score > 1.0) {
      fail("score out of range: " + std::to_string(cell.score));
    }
    row_seen[cell.row] = 1;
    col_seen[cell.col] = 1;
  }
  if (assignment.cells.size() != std::min(rows, cols)) {
    fail(std::to_string(assignment.cells.size()) + " pairs, expected " +
         std::to_string(std::min(rows, cols)));
  }
}

}  // namespace pmatch::matching
