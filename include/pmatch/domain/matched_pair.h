#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pmatch::domain {

// Bucketed classification of a pair's composite score.
enum class QualityTier { kExcellent, kGood, kFair, kPoor };

// Lower-case tier names as they appear in the artifact ("excellent", ...).
// quality_tier_from_string throws std::invalid_argument for unknown values.
std::string quality_tier_to_string(QualityTier tier);
QualityTier quality_tier_from_string(const std::string& s);

struct SubScores {
  double age{0.0};
  double socio{0.0};
};

// One committed (profile, record) assignment.
// Within one run's output each profile_id and each record_id appears at most once.
// fallbacks lists the neutral substitutions applied while scoring ("age_fallback",
// "socio_fallback"); age_gap is absent when either side has an unusable age.
struct MatchedPair {
  std::string profile_id;
  std::string record_id;
  double score{0.0};
  SubScores sub_scores;
  QualityTier quality_tier{QualityTier::kPoor};
  std::optional<int> age_gap;
  std::vector<std::string> fallbacks;
};

}  // namespace pmatch::domain
