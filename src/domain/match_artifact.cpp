#include "pmatch/domain/match_artifact.h"

namespace pmatch::domain {

namespace {

using json = nlohmann::json;

json pair_to_json(const MatchedPair& pair) {
  json j;
  j["profile_id"] = pair.profile_id;
  j["record_id"] = pair.record_id;
  j["score"] = pair.score;
  j["sub_scores"] = {{"age", pair.sub_scores.age}, {"socio", pair.sub_scores.socio}};
  j["quality_tier"] = quality_tier_to_string(pair.quality_tier);
  if (pair.age_gap.has_value()) {
    j["age_gap"] = pair.age_gap.value();
  }
  if (!pair.fallbacks.empty()) {
    j["fallbacks"] = pair.fallbacks;
  }
  return j;
}

MatchedPair pair_from_json(const json& j) {
  MatchedPair pair;
  pair.profile_id = j.at("profile_id").get<std::string>();
  pair.record_id = j.at("record_id").get<std::string>();
  pair.score = j.at("score").get<double>();
  pair.sub_scores.age = j.at("sub_scores").at("age").get<double>();
  pair.sub_scores.socio = j.at("sub_scores").at("socio").get<double>();
  pair.quality_tier = quality_tier_from_string(j.at("quality_tier").get<std::string>());
  if (j.contains("age_gap")) {
    pair.age_gap = j.at("age_gap").get<int>();
  }
  if (j.contains("fallbacks")) {
    pair.fallbacks = j.at("fallbacks").get<std::vector<std::string>>();
  }
  return pair;
}

json diagnostics_to_json(const RunDiagnostics& d) {
  json j;
  j["status"] = d.has_data ? "ok" : "no_data";
  j["pair_count"] = d.pair_count;
  j["gap_sample_count"] = d.gap_sample_count;
  j["mean_gap"] = d.mean_gap;
  j["median_gap"] = d.median_gap;
  j["max_gap"] = d.max_gap;
  j["within_2_years"] = d.within_2_years;
  j["within_5_years"] = d.within_5_years;
  j["within_2_years_pct"] = d.within_2_years_pct;
  j["within_5_years_pct"] = d.within_5_years_pct;
  j["tier_counts"] = {{"excellent", d.tier_counts.excellent},
                      {"good", d.tier_counts.good},
                      {"fair", d.tier_counts.fair},
                      {"poor", d.tier_counts.poor}};
  j["tier_percentages"] = {{"excellent", d.tier_percentages.excellent},
                           {"good", d.tier_percentages.good},
                           {"fair", d.tier_percentages.fair},
                           {"poor", d.tier_percentages.poor}};
  j["quality_index"] = d.quality_index;
  j["score_stats"] = {{"mean", d.score_stats.mean},       {"median", d.score_stats.median},
                      {"std_dev", d.score_stats.std_dev}, {"min", d.score_stats.min},
                      {"max", d.score_stats.max},         {"p25", d.score_stats.p25},
                      {"p75", d.score_stats.p75}};
  j["sub_score_means"] = {{"age", d.sub_score_means.age}, {"socio", d.sub_score_means.socio}};
  return j;
}

RunDiagnostics diagnostics_from_json(const json& j) {
  RunDiagnostics d;
  d.has_data = j.at("status").get<std::string>() == "ok";
  d.pair_count = j.at("pair_count").get<std::size_t>();
  d.gap_sample_count = j.at("gap_sample_count").get<std::size_t>();
  d.mean_gap = j.at("mean_gap").get<double>();
  d.median_gap = j.at("median_gap").get<double>();
  d.max_gap = j.at("max_gap").get<int>();
  d.within_2_years = j.at("within_2_years").get<std::size_t>();
  d.within_5_years = j.at("within_5_years").get<std::size_t>();
  d.within_2_years_pct = j.at("within_2_years_pct").get<double>();
  d.within_5_years_pct = j.at("within_5_years_pct").get<double>();

  const auto& tiers = j.at("tier_counts");
  d.tier_counts.excellent = tiers.at("excellent").get<std::size_t>();
  d.tier_counts.good = tiers.at("good").get<std::size_t>();
  d.tier_counts.fair = tiers.at("fair").get<std::size_t>();
  d.tier_counts.poor = tiers.at("poor").get<std::size_t>();
  // absent in artifacts written before the field existed
  if (j.contains("tier_percentages")) {
    const auto& pct = j.at("tier_percentages");
    d.tier_percentages.excellent = pct.at("excellent").get<double>();
    d.tier_percentages.good = pct.at("good").get<double>();
    d.tier_percentages.fair = pct.at("fair").get<double>();
    d.tier_percentages.poor = pct.at("poor").get<double>();
  } else {
    d.tier_percentages = tier_percentages(d.tier_counts);
  }

  d.quality_index = j.at("quality_index").get<double>();

  const auto& stats = j.at("score_stats");
  d.score_stats.mean = stats.at("mean").get<double>();
  d.score_stats.median = stats.at("median").get<double>();
  d.score_stats.std_dev = stats.at("std_dev").get<double>();
  d.score_stats.min = stats.at("min").get<double>();
  d.score_stats.max = stats.at("max").get<double>();
  d.score_stats.p25 = stats.at("p25").get<double>();
  d.score_stats.p75 = stats.at("p75").get<double>();

  d.sub_score_means.age = j.at("sub_score_means").at("age").get<double>();
  d.sub_score_means.socio = j.at("sub_score_means").at("socio").get<double>();
  return d;
}

}  // namespace

nlohmann::json match_artifact_to_json(const MatchArtifact& artifact) {
  json pairs = json::array();
  for (const auto& pair : artifact.pairs) {
    pairs.push_back(pair_to_json(pair));
  }

  json solver;
  solver["requested_mode"] = artifact.solver.requested_mode;
  solver["mode"] = artifact.solver.mode;
  solver["reason"] = artifact.solver.reason;
  solver["repair_passes"] = artifact.solver.repair_passes;
  solver["repair_moves"] = artifact.solver.repair_moves;
  solver["total_score"] = artifact.solver.total_score;

  json j;
  j["run_timestamp"] = artifact.run_timestamp;
  j["pairs"] = std::move(pairs);
  j["unmatched_profiles"] = artifact.unmatched_profiles;
  j["unmatched_records"] = artifact.unmatched_records;
  j["diagnostics"] = diagnostics_to_json(artifact.diagnostics);
  j["solver"] = std::move(solver);
  j["weights"] = {{"age", artifact.weight_age}, {"socio", artifact.weight_socio}};
  j["version"] = artifact.version;
  return j;
}

std::string serialize_match_artifact(const MatchArtifact& artifact) {
  return match_artifact_to_json(artifact).dump(2) + "\n";
}

MatchArtifact match_artifact_from_json(const nlohmann::json& j) {
  MatchArtifact artifact;
  artifact.run_timestamp = j.at("run_timestamp").get<std::string>();
  for (const auto& pair_json : j.at("pairs")) {
    artifact.pairs.push_back(pair_from_json(pair_json));
  }
  artifact.unmatched_profiles = j.at("unmatched_profiles").get<std::vector<std::string>>();
  artifact.unmatched_records = j.at("unmatched_records").get<std::vector<std::string>>();
  artifact.diagnostics = diagnostics_from_json(j.at("diagnostics"));

  const auto& solver = j.at("solver");
  artifact.solver.requested_mode = solver.at("requested_mode").get<std::string>();
  artifact.solver.mode = solver.at("mode").get<std::string>();
  artifact.solver.reason = solver.at("reason").get<std::string>();
  artifact.solver.repair_passes = solver.at("repair_passes").get<std::size_t>();
  artifact.solver.repair_moves = solver.at("repair_moves").get<std::size_t>();
  artifact.solver.total_score = solver.at("total_score").get<double>();

  artifact.weight_age = j.at("weights").at("age").get<double>();
  artifact.weight_socio = j.at("weights").at("socio").get<double>();
  artifact.version = j.at("version").get<std::string>();
  return artifact;
}

}  // namespace pmatch::domain
