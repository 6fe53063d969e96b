#pragma once

#include "pmatch/domain/matched_pair.h"

#include <cstddef>

namespace pmatch::domain {

struct TierCounts {
  std::size_t excellent{0};
  std::size_t good{0};
  std::size_t fair{0};
  std::size_t poor{0};

  [[nodiscard]] std::size_t total() const { return excellent + good + fair + poor; }
};

// Share of pairs per tier, 0-100.
struct TierPercentages {
  double excellent{0.0};
  double good{0.0};
  double fair{0.0};
  double poor{0.0};
};

[[nodiscard]] inline TierPercentages tier_percentages(const TierCounts& counts) {
  const std::size_t total = counts.total();
  if (total == 0) {
    return {};
  }
  const auto pct = [total](std::size_t n) {
    return 100.0 * static_cast<double>(n) / static_cast<double>(total);
  };
  return {pct(counts.excellent), pct(counts.good), pct(counts.fair), pct(counts.poor)};
}

// Distribution of composite scores across the pairing.
struct ScoreStats {
  double mean{0.0};
  double median{0.0};
  double std_dev{0.0};  // population standard deviation
  double min{0.0};
  double max{0.0};
  double p25{0.0};
  double p75{0.0};
};

// Aggregate statistics over one run's MatchedPair set. Recomputed every run.
// has_data == false is the defined "no data" result for an empty pairing: all counts are
// zero and all means are 0.0.
// Gap statistics only cover pairs whose age_gap is known (gap_sample_count of them);
// the within-N percentages are relative to gap_sample_count.
struct RunDiagnostics {
  bool has_data{false};
  std::size_t pair_count{0};

  std::size_t gap_sample_count{0};
  double mean_gap{0.0};
  double median_gap{0.0};
  int max_gap{0};
  std::size_t within_2_years{0};
  std::size_t within_5_years{0};
  double within_2_years_pct{0.0};
  double within_5_years_pct{0.0};

  TierCounts tier_counts;
  TierPercentages tier_percentages;
  double quality_index{0.0};  // mean composite score
  ScoreStats score_stats;
  SubScores sub_score_means;
};

}  // namespace pmatch::domain
