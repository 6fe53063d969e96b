#pragma once

#include "pmatch/domain/matched_pair.h"
#include "pmatch/domain/run_diagnostics.h"

#include <vector>

namespace pmatch::analysis {

// Tier thresholds on the composite score (lower bounds, inclusive).
constexpr double kExcellentThreshold = 0.85;
constexpr double kGoodThreshold = 0.75;
constexpr double kFairThreshold = 0.65;

[[nodiscard]] domain::QualityTier classify_tier(double score);

// QualityAnalyzer turns a run's pairing into RunDiagnostics.
// Stateless; an empty pairing yields the no-data result (has_data == false, all zero).
class QualityAnalyzer {
 public:
  // Sets quality_tier on every pair in place.
  void assign_tiers(std::vector<domain::MatchedPair>& pairs) const;

  [[nodiscard]] domain::RunDiagnostics analyze(const std::vector<domain::MatchedPair>& pairs) const;
};

}  // namespace pmatch::analysis
