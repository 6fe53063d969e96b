#include "pmatch/domain/match_artifact.h"
#include "pmatch/domain/matched_pair.h"

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

using namespace pmatch;
using Catch::Matchers::WithinAbs;

static domain::MatchArtifact sample_artifact() {
  domain::MatchArtifact a;
  a.run_timestamp = "2025-01-01T00:00:00Z";

  domain::MatchedPair full;
  full.profile_id = "p-1";
  full.record_id = "r-7";
  full.score = 0.74;
  full.sub_scores = {0.9, 0.5};
  full.quality_tier = domain::QualityTier::kFair;
  full.age_gap = 2;
  full.fallbacks = {"socio_fallback"};
  a.pairs.push_back(full);

  domain::MatchedPair bare;
  bare.profile_id = "p-2";
  bare.record_id = "r-3";
  bare.score = 0.5;
  bare.sub_scores = {0.5, 0.5};
  bare.quality_tier = domain::QualityTier::kPoor;
  a.pairs.push_back(bare);

  a.unmatched_profiles = {"p-9"};
  a.diagnostics.has_data = true;
  a.diagnostics.pair_count = 2;
  a.diagnostics.tier_counts.fair = 1;
  a.diagnostics.tier_counts.poor = 1;
  a.diagnostics.tier_percentages = domain::tier_percentages(a.diagnostics.tier_counts);
  a.diagnostics.quality_index = 0.62;
  a.solver = {"auto", "exact", "auto: 3 x 2 within exact limit of 16000000 cells", 0, 0, 1.24};
  a.weight_age = 0.6;
  a.weight_socio = 0.4;
  return a;
}

TEST_CASE("quality tier names", "[domain][artifact]") {
  CHECK(domain::quality_tier_to_string(domain::QualityTier::kExcellent) == "excellent");
  CHECK(domain::quality_tier_from_string("good") == domain::QualityTier::kGood);
  CHECK_THROWS_AS(domain::quality_tier_from_string("great"), std::invalid_argument);
}

TEST_CASE("artifact JSON has sorted keys and a trailing newline", "[domain][artifact]") {
  const auto text = domain::serialize_match_artifact(sample_artifact());

  CHECK(text.rfind("{\n  \"diagnostics\"", 0) == 0);
  CHECK(text.back() == '\n');
  CHECK(text.find("\"pairs\"") < text.find("\"run_timestamp\""));
  CHECK(text.find("\"solver\"") < text.find("\"unmatched_profiles\""));
  CHECK(text.find("\"version\"") > text.find("\"weights\""));
}

TEST_CASE("optional pair fields are omitted when absent", "[domain][artifact]") {
  const auto j = domain::match_artifact_to_json(sample_artifact());
  const auto& pairs = j.at("pairs");
  REQUIRE(pairs.size() == 2);

  CHECK(pairs[0].at("age_gap") == 2);
  CHECK(pairs[0].at("fallbacks") == nlohmann::json::array({"socio_fallback"}));
  CHECK_FALSE(pairs[1].contains("age_gap"));
  CHECK_FALSE(pairs[1].contains("fallbacks"));
  CHECK(j.at("diagnostics").at("status") == "ok");
  CHECK(j.at("unmatched_records") == nlohmann::json::array());
}

TEST_CASE("an empty pairing reports no_data", "[domain][artifact]") {
  domain::MatchArtifact a;
  a.run_timestamp = "2025-01-01T00:00:00Z";
  const auto j = domain::match_artifact_to_json(a);
  CHECK(j.at("diagnostics").at("status") == "no_data");
  CHECK(j.at("pairs").empty());
  CHECK(j.at("version") == core::kArtifactVersion);
}

TEST_CASE("artifact survives a parse of its own output", "[domain][artifact]") {
  const auto original = sample_artifact();
  const auto text = domain::serialize_match_artifact(original);
  const auto parsed = domain::match_artifact_from_json(nlohmann::json::parse(text));

  CHECK(domain::serialize_match_artifact(parsed) == text);
  REQUIRE(parsed.pairs.size() == 2);
  CHECK(parsed.pairs[0].age_gap == 2);
  CHECK_FALSE(parsed.pairs[1].age_gap.has_value());
  CHECK(parsed.solver.mode == "exact");
}

TEST_CASE("tier percentages are written and derived for older artifacts",
          "[domain][artifact]") {
  auto j = domain::match_artifact_to_json(sample_artifact());
  CHECK(j.at("diagnostics").at("tier_percentages").at("fair") == 50.0);
  CHECK(j.at("diagnostics").at("tier_percentages").at("excellent") == 0.0);

  j.at("diagnostics").erase("tier_percentages");
  const auto parsed = domain::match_artifact_from_json(j);
  CHECK_THAT(parsed.diagnostics.tier_percentages.fair, WithinAbs(50.0, 1e-12));
  CHECK_THAT(parsed.diagnostics.tier_percentages.poor, WithinAbs(50.0, 1e-12));
}

TEST_CASE("artifact parsing rejects missing fields", "[domain][artifact]") {
  auto j = domain::match_artifact_to_json(sample_artifact());
  j.erase("solver");
  CHECK_THROWS_AS(domain::match_artifact_from_json(j), nlohmann::json::exception);
}
