#pragma once

namespace pmatch::matching {

// Composite = age * age_score + socio * socio_score. The two weights must sum to 1.
struct ScoreWeights {
  double age{0.6};
  double socio{0.4};
};

// Default blend: demographic proximity (age) dominates.
inline ScoreWeights demographic_proximity_preset() {
  return ScoreWeights{0.6, 0.4};
}

// Even blend, for pools where age data is known to be noisy.
inline ScoreWeights balanced_preset() {
  return ScoreWeights{0.5, 0.5};
}

}  // namespace pmatch::matching
