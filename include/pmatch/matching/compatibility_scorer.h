#pragma once

#include "pmatch/domain/demographics.h"
#include "pmatch/domain/profile.h"
#include "pmatch/matching/score_weights.h"

#include <optional>
#include <string>
#include <vector>

namespace pmatch::matching {

// Bit flags recording which neutral substitutions were applied to a pair.
enum ScoreFallback : unsigned {
  kNoFallback = 0,
  kAgeFallback = 1U << 0U,    // an age was missing or implausible; age sub-score = 0.5
  kSocioFallback = 1U << 1U,  // no demographic dimension comparable; socio sub-score = 0.5
};

// Neutral sub-score used whenever one side lacks the data for a dimension.
constexpr double kNeutralSubScore = 0.5;

struct PairScore {
  double composite{0.0};
  double age{0.0};
  double socio{0.0};
  unsigned fallbacks{kNoFallback};
};

// Artifact labels for a fallback bit set, in a fixed order.
[[nodiscard]] std::vector<std::string> fallback_labels(unsigned fallbacks);

// Demographic dimensions compared by the socio-economic sub-score.
enum class Dimension { kEducation, kOccupation, kIncome, kMaritalStatus };

// Tiered age proximity: 1.0 for equal ages, 0.9 within 2 years, 0.7 within 5 years, then
// max(0, 1 - gap/20). Monotonically non-increasing in the gap and symmetric.
[[nodiscard]] double age_compatibility(int profile_age, int record_age);

// Maps a free-text occupation (or a tier name) to a skill tier:
// 0 = lower_skilled, 1 = medium_skilled, 2 = high_skilled. nullopt if no keyword applies.
[[nodiscard]] std::optional<int> occupation_skill_tier(const std::string& occupation);

// Similarity of two normalized category values on one dimension: 1.0 exact, 0.5 for
// adjacent categories, 0.0 otherwise. Values outside the known vocabulary only match
// themselves.
[[nodiscard]] double category_similarity(Dimension dimension, const std::string& a,
                                         const std::string& b);

// Average similarity across the dimensions present on both sides.
// nullopt when no dimension is present on both sides.
[[nodiscard]] std::optional<double> socio_compatibility(const domain::Demographics& profile,
                                                        const domain::Demographics& record);

// CompatibilityScorer computes the composite score for one (profile, record) pair.
// score() is a pure function of its arguments and the weights fixed at construction, so a
// single instance is shared read-only by every scoring worker.
class CompatibilityScorer {
 public:
  // Throws std::invalid_argument unless both weights are finite, non-negative and sum to
  // 1 within 1e-9.
  explicit CompatibilityScorer(ScoreWeights weights = ScoreWeights{});

  // Throws core::MatchError(kComputationInconsistency) if any resulting score falls
  // outside [0, 1]; that can only happen through a scorer defect.
  [[nodiscard]] PairScore score(const domain::Profile& profile,
                                const domain::Record& record) const;

  [[nodiscard]] const ScoreWeights& weights() const { return weights_; }

 private:
  ScoreWeights weights_;
};

}  // namespace pmatch::matching
