#include "pmatch/domain/matched_pair.h"

#include <stdexcept>

namespace pmatch::domain {

std::string quality_tier_to_string(QualityTier tier) {
  switch (tier) {
    case QualityTier::kExcellent:
      return "excellent";
    case QualityTier::kGood:
      return "good";
    case QualityTier::kFair:
      return "fair";
    case QualityTier::kPoor:
      return "poor";
  }
  return "unknown";
}

QualityTier quality_tier_from_string(const std::string& s) {
  if (s == "excellent")
    return QualityTier::kExcellent;
  if (s == "good")
    return QualityTier::kGood;
  if (s == "fair")
    return QualityTier::kFair;
  if (s == "poor")
    return QualityTier::kPoor;
  throw std::invalid_argument("Unknown QualityTier: " + s);
}

}  // namespace pmatch::domain
