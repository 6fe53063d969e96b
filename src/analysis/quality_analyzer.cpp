#include "pmatch/analysis/quality_analyzer.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace pmatch::analysis {

namespace {

// Median of an already sorted sample.
double sorted_median(const std::vector<double>& v) {
  const std::size_t n = v.size();
  if (n == 0) {
    return 0.0;
  }
  if (n % 2 == 1) {
    return v[n / 2];
  }
  return (v[n / 2 - 1] + v[n / 2]) / 2.0;
}

// Linear interpolation between closest ranks; q in [0, 1].
double sorted_percentile(const std::vector<double>& v, double q) {
  if (v.empty()) {
    return 0.0;
  }
  const double pos = q * static_cast<double>(v.size() - 1);
  const auto lo = static_cast<std::size_t>(std::floor(pos));
  const auto hi = static_cast<std::size_t>(std::ceil(pos));
  const double frac = pos - static_cast<double>(lo);
  return v[lo] + (v[hi] - v[lo]) * frac;
}

}  // namespace

domain::QualityTier classify_tier(const double score) {
  if (score >= kExcellentThreshold) {
    return domain::QualityTier::kExcellent;
  }
  if (score >= kGoodThreshold) {
    return domain::QualityTier::kGood;
  }
  if (score >= kFairThreshold) {
    return domain::QualityTier::kFair;
  }
  return domain::QualityTier::kPoor;
}

void QualityAnalyzer::assign_tiers(std::vector<domain::MatchedPair>& pairs) const {
  for (auto& pair : pairs) {
    pair.quality_tier = classify_tier(pair.score);
  }
}

domain::RunDiagnostics QualityAnalyzer::analyze(
    const std::vector<domain::MatchedPair>& pairs) const {
  domain::RunDiagnostics d;
  if (pairs.empty()) {
    return d;
  }
  d.has_data = true;
  d.pair_count = pairs.size();

  std::vector<double> scores;
  std::vector<double> gaps;
  scores.reserve(pairs.size());
  double age_sum = 0.0;
  double socio_sum = 0.0;

  for (const auto& pair : pairs) {
    scores.push_back(pair.score);
    age_sum += pair.sub_scores.age;
    socio_sum += pair.sub_scores.socio;

    switch (classify_tier(pair.score)) {
      case domain::QualityTier::kExcellent:
        ++d.tier_counts.excellent;
        break;
      case domain::QualityTier::kGood:
        ++d.tier_counts.good;
        break;
      case domain::QualityTier::kFair:
        ++d.tier_counts.fair;
        break;
      case domain::QualityTier::kPoor:
        ++d.tier_counts.poor;
        break;
    }

    if (pair.age_gap.has_value()) {
      const int gap = *pair.age_gap;
      gaps.push_back(static_cast<double>(gap));
      d.max_gap = std::max(d.max_gap, gap);
      if (gap <= 2) {
        ++d.within_2_years;
      }
      if (gap <= 5) {
        ++d.within_5_years;
      }
    }
  }

  d.tier_percentages = domain::tier_percentages(d.tier_counts);

  const auto n = static_cast<double>(pairs.size());
  d.sub_score_means = {age_sum / n, socio_sum / n};

  std::sort(scores.begin(), scores.end());
  double score_sum = 0.0;
  for (const double s : scores) {
    score_sum += s;
  }
  const double mean = score_sum / n;
  double sq = 0.0;
  for (const double s : scores) {
    sq += (s - mean) * (s - mean);
  }
  d.quality_index = mean;
  d.score_stats.mean = mean;
  d.score_stats.median = sorted_median(scores);
  d.score_stats.std_dev = std::sqrt(sq / n);
  d.score_stats.min = scores.front();
  d.score_stats.max = scores.back();
  d.score_stats.p25 = sorted_percentile(scores, 0.25);
  d.score_stats.p75 = sorted_percentile(scores, 0.75);

  d.gap_sample_count = gaps.size();
  if (!gaps.empty()) {
    std::sort(gaps.begin(), gaps.end());
    double gap_sum = 0.0;
    for (const double g : gaps) {
      gap_sum += g;
    }
    const auto samples = static_cast<double>(gaps.size());
    d.mean_gap = gap_sum / samples;
    d.median_gap = sorted_median(gaps);
    d.within_2_years_pct = 100.0 * static_cast<double>(d.within_2_years) / samples;
    d.within_5_years_pct = 100.0 * static_cast<double>(d.within_5_years) / samples;
  }
  return d;
}

}  // namespace pmatch::analysis
