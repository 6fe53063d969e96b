#pragma once

#include <optional>
#include <string>

namespace pmatch::domain {

// Inclusive bounds for an age to be considered usable in scoring.
// Ages outside the range are kept as loaded; the scorer substitutes a neutral sub-score.
constexpr int kMinPlausibleAge = 1;
constexpr int kMaxPlausibleAge = 120;

[[nodiscard]] inline bool is_plausible_age(const std::optional<int>& age) {
  return age.has_value() && *age >= kMinPlausibleAge && *age <= kMaxPlausibleAge;
}

// Categorical demographic attributes shared by profiles and records.
// Every field is optional; values are stored normalized (see core::normalize_category),
// and nullopt means "absent or unknown". Absent dimensions are excluded from the
// socio-economic average rather than scored as mismatches.
struct Demographics {
  std::optional<std::string> education;            // NOLINT(readability-identifier-naming)
  std::optional<std::string> occupation_category;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> income_bracket;       // NOLINT(readability-identifier-naming)
  std::optional<std::string> marital_status;       // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool empty() const {
    return !education && !occupation_category && !income_bracket && !marital_status;
  }
};

}  // namespace pmatch::domain
