#pragma once

#include "pmatch/core/version.h"
#include "pmatch/domain/matched_pair.h"
#include "pmatch/domain/run_diagnostics.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace pmatch::domain {

// How the assignment was produced. requested_mode is what the caller asked for
// ("auto" | "exact" | "heuristic"); mode is what actually ran, reason says why.
struct SolverSummary {
  std::string requested_mode;  // NOLINT(readability-identifier-naming)
  std::string mode;            // NOLINT(readability-identifier-naming)
  std::string reason;          // NOLINT(readability-identifier-naming)
  std::size_t repair_passes{0};
  std::size_t repair_moves{0};
  double total_score{0.0};
};

// The single output artifact of a run, consumed by the interview orchestration.
// pairs are sorted by (profile_id, record_id); unmatched id lists are sorted.
struct MatchArtifact {
  std::string run_timestamp;
  std::vector<MatchedPair> pairs;
  std::vector<std::string> unmatched_profiles;
  std::vector<std::string> unmatched_records;
  RunDiagnostics diagnostics;
  SolverSummary solver;
  double weight_age{0.0};
  double weight_socio{0.0};
  std::string version{core::kArtifactVersion};
};

// Deterministic JSON serialization: nlohmann::json keeps object keys in a std::map, so
// output keys are sorted and identical artifacts dump to identical bytes.
[[nodiscard]] nlohmann::json match_artifact_to_json(const MatchArtifact& artifact);

// The persisted document: two-space indented JSON followed by a newline.
[[nodiscard]] std::string serialize_match_artifact(const MatchArtifact& artifact);

// Throws nlohmann::json::exception on missing required fields or type mismatches.
[[nodiscard]] MatchArtifact match_artifact_from_json(const nlohmann::json& j);

}  // namespace pmatch::domain
