#include "pmatch/matching/compatibility_scorer.h"

#include "pmatch/core/errors.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

namespace pmatch::matching {

namespace {

constexpr double kExactSimilarity = 1.0;
constexpr double kAdjacentSimilarity = 0.5;
constexpr double kWeightTolerance = 1e-9;
// Allowance for floating-point rounding in the weighted sum; anything beyond is a defect.
constexpr double kRangeTolerance = 1e-12;

// Ordinal vocabularies, lowest first. Normalized spelling (see core::normalize_category).
constexpr std::array<std::string_view, 5> kEducationScale = {
    "no_degree", "high_school", "bachelors", "masters", "doctorate"};

constexpr std::array<std::string_view, 5> kIncomeScale = {"low", "lower_middle", "middle",
                                                          "upper_middle", "high"};

constexpr std::array<std::string_view, 3> kSkillTierNames = {"lower_skilled", "medium_skilled",
                                                             "high_skilled"};

// Occupation keywords per tier, checked high tier first.
constexpr std::array<std::string_view, 6> kHighSkilled = {"doctor",   "professor", "scientist",
                                                          "engineer", "lawyer",    "researcher"};
constexpr std::array<std::string_view, 6> kMediumSkilled = {"teacher", "nurse",   "accountant",
                                                            "manager", "analyst", "designer"};
constexpr std::array<std::string_view, 6> kLowerSkilled = {"clerk",     "cashier", "retail",
                                                           "assistant", "driver",  "worker"};

// Marital statuses that count as adjacent to each other.
constexpr std::array<std::string_view, 3> kPartneredGroup = {"married", "partnered",
                                                             "domestic_partnership"};
constexpr std::array<std::string_view, 2> kSeparatedGroup = {"divorced", "separated"};

template <std::size_t N>
std::optional<int> ordinal_index(const std::array<std::string_view, N>& scale,
                                 const std::string& value) {
  const auto it = std::find(scale.begin(), scale.end(), value);
  if (it == scale.end()) {
    return std::nullopt;
  }
  return static_cast<int>(it - scale.begin());
}

template <std::size_t N>
bool contains_keyword(const std::array<std::string_view, N>& keywords, const std::string& text) {
  return std::any_of(keywords.begin(), keywords.end(), [&text](std::string_view kw) {
    return text.find(kw) != std::string::npos;
  });
}

template <std::size_t N>
bool in_group(const std::array<std::string_view, N>& group, const std::string& value) {
  return std::find(group.begin(), group.end(), value) != group.end();
}

double ordinal_similarity(std::optional<int> a, std::optional<int> b) {
  const int distance = std::abs(*a - *b);
  if (distance == 0) {
    return kExactSimilarity;
  }
  return distance == 1 ? kAdjacentSimilarity : 0.0;
}

double marital_similarity(const std::string& a, const std::string& b) {
  if (a == b) {
    return kExactSimilarity;
  }
  if ((in_group(kPartneredGroup, a) && in_group(kPartneredGroup, b)) ||
      (in_group(kSeparatedGroup, a) && in_group(kSeparatedGroup, b))) {
    return kAdjacentSimilarity;
  }
  return 0.0;
}

bool in_unit_range(double value) {
  return !std::isnan(value) && value >= -kRangeTolerance && value <= 1.0 + kRangeTolerance;
}

}  // namespace

std::vector<std::string> fallback_labels(const unsigned fallbacks) {
  std::vector<std::string> labels;
  if ((fallbacks & kAgeFallback) != 0U) {
    labels.emplace_back("age_fallback");
  }
  if ((fallbacks & kSocioFallback) != 0U) {
    labels.emplace_back("socio_fallback");
  }
  return labels;
}

double age_compatibility(const int profile_age, const int record_age) {
  const int gap = std::abs(profile_age - record_age);
  if (gap == 0) {
    return 1.0;
  }
  if (gap <= 2) {
    return 0.9;
  }
  if (gap <= 5) {
    return 0.7;
  }
  return std::max(0.0, 1.0 - static_cast<double>(gap) / 20.0);
}

std::optional<int> occupation_skill_tier(const std::string& occupation) {
  if (auto tier = ordinal_index(kSkillTierNames, occupation)) {
    return tier;
  }
  if (contains_keyword(kHighSkilled, occupation)) {
    return 2;
  }
  if (contains_keyword(kMediumSkilled, occupation)) {
    return 1;
  }
  if (contains_keyword(kLowerSkilled, occupation)) {
    return 0;
  }
  return std::nullopt;
}

double category_similarity(const Dimension dimension, const std::string& a,
                           const std::string& b) {
  std::optional<int> ia;
  std::optional<int> ib;

  switch (dimension) {
    case Dimension::kEducation:
      ia = ordinal_index(kEducationScale, a);
      ib = ordinal_index(kEducationScale, b);
      break;
    case Dimension::kIncome:
      ia = ordinal_index(kIncomeScale, a);
      ib = ordinal_index(kIncomeScale, b);
      break;
    case Dimension::kOccupation:
      ia = occupation_skill_tier(a);
      ib = occupation_skill_tier(b);
      break;
    case Dimension::kMaritalStatus:
      return marital_similarity(a, b);
  }

  if (ia.has_value() && ib.has_value()) {
    return ordinal_similarity(ia, ib);
  }
  return a == b ? kExactSimilarity : 0.0;
}

std::optional<double> socio_compatibility(const domain::Demographics& profile,
                                          const domain::Demographics& record) {
  double total = 0.0;
  int compared = 0;

  const auto compare = [&](Dimension dim, const std::optional<std::string>& a,
                           const std::optional<std::string>& b) {
    if (a.has_value() && b.has_value()) {
      total += category_similarity(dim, *a, *b);
      ++compared;
    }
  };

  compare(Dimension::kEducation, profile.education, record.education);
  compare(Dimension::kOccupation, profile.occupation_category, record.occupation_category);
  compare(Dimension::kIncome, profile.income_bracket, record.income_bracket);
  compare(Dimension::kMaritalStatus, profile.marital_status, record.marital_status);

  if (compared == 0) {
    return std::nullopt;
  }
  return total / static_cast<double>(compared);
}

CompatibilityScorer::CompatibilityScorer(const ScoreWeights weights) : weights_(weights) {
  if (!std::isfinite(weights.age) || !std::isfinite(weights.socio) || weights.age < 0.0 ||
      weights.socio < 0.0) {
    throw std::invalid_argument("score weights must be finite and non-negative");
  }
  if (std::fabs(weights.age + weights.socio - 1.0) > kWeightTolerance) {
    throw std::invalid_argument("score weights must sum to 1 (got age=" +
                                std::to_string(weights.age) +
                                ", socio=" + std::to_string(weights.socio) + ")");
  }
}

PairScore CompatibilityScorer::score(const domain::Profile& profile,
                                     const domain::Record& record) const {
  PairScore result;

  if (domain::is_plausible_age(profile.age) && domain::is_plausible_age(record.age)) {
    result.age = age_compatibility(*profile.age, *record.age);
  } else {
    result.age = kNeutralSubScore;
    result.fallbacks |= kAgeFallback;
  }

  if (auto socio = socio_compatibility(profile.demographics, record.demographics)) {
    result.socio = *socio;
  } else {
    result.socio = kNeutralSubScore;
    result.fallbacks |= kSocioFallback;
  }

  result.composite = weights_.age * result.age + weights_.socio * result.socio;

  if (!in_unit_range(result.age) || !in_unit_range(result.socio) ||
      !in_unit_range(result.composite)) {
    throw core::MatchError(core::MatchErrorKind::kComputationInconsistency,
                           "score out of [0,1] for profile " + profile.id + " / record " +
                               record.id + ": composite=" + std::to_string(result.composite));
  }
  return result;
}

}  // namespace pmatch::matching
