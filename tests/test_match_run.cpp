#include "pmatch/core/clock.h"
#include "pmatch/core/id_generator.h"
#include "pmatch/pipeline/match_run.h"
#include "pmatch/storage/audit_log.h"

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace pmatch;
using Catch::Matchers::WithinAbs;
using pipeline::RunStage;

namespace {

class RecordingRepository final : public storage::IMatchRepository {
 public:
  core::Result<bool, std::string> save(const std::string& run_id,
                                       const domain::MatchArtifact& artifact) override {
    run_ids.push_back(run_id);
    documents.push_back(domain::serialize_match_artifact(artifact));
    latest = artifact;
    return core::Result<bool, std::string>::ok(true);
  }

  core::Result<std::optional<domain::MatchArtifact>, std::string> load_latest() const override {
    return core::Result<std::optional<domain::MatchArtifact>, std::string>::ok(latest);
  }

  std::vector<std::string> run_ids;
  std::vector<std::string> documents;
  std::optional<domain::MatchArtifact> latest;
};

class FailingRepository final : public storage::IMatchRepository {
 public:
  core::Result<bool, std::string> save(const std::string&, const domain::MatchArtifact&) override {
    ++attempts;
    return core::Result<bool, std::string>::err("disk full");
  }

  core::Result<std::optional<domain::MatchArtifact>, std::string> load_latest() const override {
    return core::Result<std::optional<domain::MatchArtifact>, std::string>::ok(std::nullopt);
  }

  int attempts{0};
};

// Forwards to an in-memory log until the occurrence-th event of type fail_on arrives; that
// append and every later one throw, like a SQLite log whose database became unwritable.
class BreakingAuditLog final : public storage::IAuditLog {
 public:
  BreakingAuditLog(std::string fail_on, int occurrence)
      : fail_on_(std::move(fail_on)), occurrence_(occurrence) {}

  void append(const storage::AuditEvent& event) override {
    if (!broken_ && event.event_type == fail_on_ && ++seen_ == occurrence_) {
      broken_ = true;
    }
    if (broken_) {
      ++rejected;
      throw std::runtime_error("audit append failed: disk I/O error");
    }
    inner_.append(event);
  }

  [[nodiscard]] std::vector<storage::AuditEvent> query(const std::string& trace_id) const override {
    return inner_.query(trace_id);
  }

  [[nodiscard]] std::vector<std::string> list_trace_ids() const override {
    return inner_.list_trace_ids();
  }

  int rejected{0};

 private:
  storage::InMemoryAuditLog inner_;
  std::string fail_on_;
  int occurrence_;
  int seen_{0};
  bool broken_{false};
};

domain::Profile profile(const std::string& id, int age) {
  domain::Profile p;
  p.id = id;
  p.age = age;
  return p;
}

domain::Record record(const std::string& id, int age) {
  domain::Record r;
  r.id = id;
  r.age = age;
  return r;
}

std::vector<std::string> event_types(const storage::IAuditLog& log, const std::string& run_id) {
  std::vector<std::string> types;
  for (const auto& event : log.query(run_id)) {
    types.push_back(event.event_type);
  }
  return types;
}

// Ages chosen so the closest-age pairing is the unique optimum.
std::vector<domain::Profile> three_profiles() {
  return {profile("p-c", 40), profile("p-a", 28), profile("p-b", 32)};
}

std::vector<domain::Record> three_records() {
  return {record("r-2", 33), record("r-3", 41), record("r-1", 30)};
}

}  // namespace

TEST_CASE("MatchRun completes and persists the artifact", "[pipeline][run]") {
  RecordingRepository repo;
  storage::InMemoryAuditLog audit;
  core::DeterministicIdGenerator ids;
  core::FixedClock clock("2025-06-01T09:00:00Z");

  pipeline::MatchRun run(config::EngineConfig{}, repo, audit, ids, clock);
  const auto outcome = run.execute(three_profiles(), three_records());

  REQUIRE(outcome.succeeded());
  CHECK(outcome.run_id == "run-0");
  CHECK_FALSE(outcome.failure.has_value());
  CHECK(run.stage() == RunStage::kDone);
  CHECK(run.stage_history() ==
        std::vector<RunStage>{RunStage::kInit, RunStage::kScoring, RunStage::kSolving,
                              RunStage::kReporting, RunStage::kPersisting, RunStage::kDone});

  REQUIRE(outcome.artifact.has_value());
  const auto& artifact = *outcome.artifact;
  CHECK(artifact.run_timestamp == "2025-06-01T09:00:00Z");
  REQUIRE(artifact.pairs.size() == 3);
  CHECK(artifact.pairs[0].profile_id == "p-a");
  CHECK(artifact.pairs[0].record_id == "r-1");
  CHECK(artifact.pairs[1].profile_id == "p-b");
  CHECK(artifact.pairs[1].record_id == "r-2");
  CHECK(artifact.pairs[2].profile_id == "p-c");
  CHECK(artifact.pairs[2].record_id == "r-3");
  for (const auto& pair : artifact.pairs) {
    CHECK_THAT(pair.score, WithinAbs(0.74, 1e-12));
    CHECK(pair.quality_tier == domain::QualityTier::kFair);
    CHECK(pair.fallbacks == std::vector<std::string>{"socio_fallback"});
  }
  CHECK(artifact.unmatched_profiles.empty());
  CHECK(artifact.unmatched_records.empty());
  CHECK(artifact.solver.mode == "exact");
  CHECK(artifact.solver.requested_mode == "auto");
  CHECK_THAT(artifact.diagnostics.quality_index, WithinAbs(0.74, 1e-12));
  CHECK_THAT(artifact.diagnostics.mean_gap, WithinAbs(4.0 / 3.0, 1e-12));
  CHECK(artifact.diagnostics.within_2_years == 3);
  CHECK(artifact.diagnostics.tier_counts.fair == 3);

  REQUIRE(repo.run_ids == std::vector<std::string>{"run-0"});

  SECTION("audit trail follows the stages") {
    const auto types = event_types(audit, outcome.run_id);
    REQUIRE(types.size() == 8);
    CHECK(types.front() == "RunStarted");
    CHECK(types[1] == "CollectionsLoaded");
    CHECK(types[2] == "SolverModeSelected");
    CHECK(std::count(types.begin(), types.end(), "StageCompleted") == 4);
    CHECK(types.back() == "RunCompleted");

    const auto events = audit.query(outcome.run_id);
    const auto mode = nlohmann::json::parse(events[2].payload);
    CHECK(mode.at("mode") == "exact");
    CHECK(mode.at("reason") == "auto: 3 x 3 within exact limit of 16000000 cells");
    for (const auto& event : events) {
      CHECK(event.trace_id == "run-0");
      CHECK(event.created_at == "2025-06-01T09:00:00Z");
      CHECK(event.event_id.rfind("evt-", 0) == 0);
    }
    CHECK(events.front().event_type == storage::event_type::kRunStarted);
    CHECK(events.front().refs == std::vector<std::string>{"run-0"});
    CHECK(events.back().event_type == storage::event_type::kRunCompleted);
    CHECK(events.back().refs == std::vector<std::string>{"run-0"});
    const auto stage = nlohmann::json::parse(events[6].payload);
    CHECK(stage.at("stage") == "PERSISTING");
    CHECK(events[6].refs.empty());
  }
}

TEST_CASE("MatchRun is byte-identical across reruns", "[pipeline][run][determinism]") {
  const auto run_once = [](config::EngineConfig config) {
    RecordingRepository repo;
    storage::InMemoryAuditLog audit;
    core::DeterministicIdGenerator ids;
    core::FixedClock clock("2025-06-01T09:00:00Z");
    pipeline::MatchRun run(std::move(config), repo, audit, ids, clock);
    const auto outcome = run.execute(three_profiles(), three_records());
    REQUIRE(outcome.succeeded());
    REQUIRE(repo.documents.size() == 1);
    return repo.documents.front();
  };

  config::EngineConfig exact;
  CHECK(run_once(exact) == run_once(exact));

  config::EngineConfig heuristic;
  heuristic.solver_mode = matching::SolverMode::kHeuristic;
  heuristic.candidates_per_row = 2;
  heuristic.workers = 3;
  CHECK(run_once(heuristic) == run_once(heuristic));
}

TEST_CASE("MatchRun heuristic mode reaches the same pairing here", "[pipeline][run]") {
  RecordingRepository repo;
  storage::InMemoryAuditLog audit;
  core::DeterministicIdGenerator ids;
  core::FixedClock clock("2025-06-01T09:00:00Z");

  config::EngineConfig config;
  config.solver_mode = matching::SolverMode::kHeuristic;
  config.candidates_per_row = 1;

  pipeline::MatchRun run(config, repo, audit, ids, clock);
  const auto outcome = run.execute(three_profiles(), three_records());
  REQUIRE(outcome.succeeded());
  CHECK(outcome.artifact->solver.mode == "heuristic");
  CHECK(outcome.artifact->solver.reason == "heuristic requested");
  CHECK_THAT(outcome.artifact->solver.total_score, WithinAbs(3 * 0.74, 1e-9));
}

TEST_CASE("MatchRun fails at INIT on duplicate ids", "[pipeline][run][failure]") {
  RecordingRepository repo;
  storage::InMemoryAuditLog audit;
  core::DeterministicIdGenerator ids;
  core::FixedClock clock("2025-06-01T09:00:00Z");

  pipeline::MatchRun run(config::EngineConfig{}, repo, audit, ids, clock);
  auto profiles = three_profiles();
  profiles.push_back(profile("p-a", 50));
  const auto outcome = run.execute(profiles, three_records());

  REQUIRE_FALSE(outcome.succeeded());
  CHECK(outcome.final_stage == RunStage::kFailed);
  REQUIRE(outcome.failure.has_value());
  CHECK(outcome.failure->stage == RunStage::kInit);
  CHECK(outcome.failure->kind == core::MatchErrorKind::kInvalidInput);
  CHECK(outcome.failure->message.find("p-a") != std::string::npos);
  CHECK_FALSE(outcome.artifact.has_value());
  CHECK(run.stage_history() == std::vector<RunStage>{RunStage::kInit, RunStage::kFailed});
  CHECK(repo.run_ids.empty());

  const auto types = event_types(audit, outcome.run_id);
  REQUIRE(types.size() == 2);
  CHECK(types[0] == "RunStarted");
  CHECK(types[1] == "RunFailed");
  const auto payload = nlohmann::json::parse(audit.query(outcome.run_id)[1].payload);
  CHECK(payload.at("stage") == "INIT");
  CHECK(payload.at("kind") == core::match_error_kind_to_string(core::MatchErrorKind::kInvalidInput));
}

TEST_CASE("MatchRun fails at SCORING when exact mode cannot fit", "[pipeline][run][failure]") {
  RecordingRepository repo;
  storage::InMemoryAuditLog audit;
  core::DeterministicIdGenerator ids;
  core::FixedClock clock("2025-06-01T09:00:00Z");

  config::EngineConfig config;
  config.solver_mode = matching::SolverMode::kExact;
  config.exact_max_cells = 4;
  config.dense_cell_limit = 4;

  pipeline::MatchRun run(config, repo, audit, ids, clock);
  const auto outcome = run.execute(three_profiles(), three_records());

  REQUIRE(outcome.failure.has_value());
  CHECK(outcome.failure->stage == RunStage::kScoring);
  CHECK(outcome.failure->kind == core::MatchErrorKind::kResourceExhaustion);
  CHECK(run.stage_history().back() == RunStage::kFailed);
  CHECK(repo.run_ids.empty());
}

TEST_CASE("MatchRun fails at PERSISTING when the save fails", "[pipeline][run][failure]") {
  FailingRepository repo;
  storage::InMemoryAuditLog audit;
  core::DeterministicIdGenerator ids;
  core::FixedClock clock("2025-06-01T09:00:00Z");

  pipeline::MatchRun run(config::EngineConfig{}, repo, audit, ids, clock);
  const auto outcome = run.execute(three_profiles(), three_records());

  REQUIRE(outcome.failure.has_value());
  CHECK(outcome.failure->stage == RunStage::kPersisting);
  CHECK(outcome.failure->kind == core::MatchErrorKind::kPersistenceFailure);
  CHECK(outcome.failure->message == "disk full");
  CHECK(repo.attempts == 1);
  CHECK(event_types(audit, outcome.run_id).back() == "RunFailed");
}

TEST_CASE("MatchRun with no records leaves every profile unmatched", "[pipeline][run]") {
  RecordingRepository repo;
  storage::InMemoryAuditLog audit;
  core::DeterministicIdGenerator ids;
  core::FixedClock clock("2025-06-01T09:00:00Z");

  pipeline::MatchRun run(config::EngineConfig{}, repo, audit, ids, clock);
  const auto outcome = run.execute(three_profiles(), {});

  REQUIRE(outcome.succeeded());
  const auto& artifact = *outcome.artifact;
  CHECK(artifact.pairs.empty());
  CHECK(artifact.unmatched_profiles == std::vector<std::string>{"p-a", "p-b", "p-c"});
  CHECK_FALSE(artifact.diagnostics.has_data);
  CHECK(repo.run_ids.size() == 1);
}

TEST_CASE("MatchRun reports surplus records as unmatched", "[pipeline][run]") {
  RecordingRepository repo;
  storage::InMemoryAuditLog audit;
  core::DeterministicIdGenerator ids;
  core::FixedClock clock("2025-06-01T09:00:00Z");

  auto records = three_records();
  records.push_back(record("r-0", 90));

  pipeline::MatchRun run(config::EngineConfig{}, repo, audit, ids, clock);
  const auto outcome = run.execute(three_profiles(), records);

  REQUIRE(outcome.succeeded());
  CHECK(outcome.artifact->pairs.size() == 3);
  CHECK(outcome.artifact->unmatched_records == std::vector<std::string>{"r-0"});
  CHECK(outcome.artifact->unmatched_profiles.empty());
}

TEST_CASE("MatchRun reports loader notices as FieldFallback events", "[pipeline][run]") {
  RecordingRepository repo;
  storage::InMemoryAuditLog audit;
  core::DeterministicIdGenerator ids;
  core::FixedClock clock("2025-06-01T09:00:00Z");

  const std::vector<ingest::LoadNotice> notices = {
      {"profile", "p-b", "age", "not an integer"},
      {"record", "r-1", "demographics.education", "not a string"},
      {"profile", "p-b", "demographics.income_bracket", "not a string"},
  };

  pipeline::MatchRun run(config::EngineConfig{}, repo, audit, ids, clock);
  const auto outcome = run.execute(three_profiles(), three_records(), notices);
  REQUIRE(outcome.succeeded());

  std::vector<nlohmann::json> fallbacks;
  for (const auto& event : audit.query(outcome.run_id)) {
    if (event.event_type == "FieldFallback") {
      fallbacks.push_back(nlohmann::json::parse(event.payload));
    }
  }
  REQUIRE(fallbacks.size() == 2);
  CHECK(fallbacks[0].at("entity_kind") == "profile");
  CHECK(fallbacks[0].at("entity_id") == "p-b");
  CHECK(fallbacks[0].at("fields").size() == 2);
  CHECK(fallbacks[1].at("entity_kind") == "record");
  CHECK(fallbacks[1].at("entity_id") == "r-1");
}

TEST_CASE("MatchRun fails at INIT when a collection file is missing", "[pipeline][run][failure]") {
  RecordingRepository repo;
  storage::InMemoryAuditLog audit;
  core::DeterministicIdGenerator ids;
  core::FixedClock clock("2025-06-01T09:00:00Z");

  pipeline::MatchRun run(config::EngineConfig{}, repo, audit, ids, clock);
  const auto outcome = run.execute_files("/nonexistent/profiles.json", "/nonexistent/records.json");

  REQUIRE(outcome.failure.has_value());
  CHECK(outcome.failure->stage == RunStage::kInit);
  CHECK(outcome.failure->kind == core::MatchErrorKind::kInvalidInput);
  CHECK(repo.run_ids.empty());
}

TEST_CASE("MatchRun is single-use", "[pipeline][run]") {
  RecordingRepository repo;
  storage::InMemoryAuditLog audit;
  core::DeterministicIdGenerator ids;
  core::FixedClock clock("2025-06-01T09:00:00Z");

  pipeline::MatchRun run(config::EngineConfig{}, repo, audit, ids, clock);
  REQUIRE(run.execute(three_profiles(), three_records()).succeeded());
  CHECK_THROWS_AS(run.execute(three_profiles(), three_records()), std::logic_error);
}

TEST_CASE("MatchRun stays DONE when the audit log breaks after the commit",
          "[pipeline][run][audit]") {
  RecordingRepository repo;
  core::DeterministicIdGenerator ids;
  core::FixedClock clock("2025-06-01T09:00:00Z");

  SECTION("RunCompleted rejected") {
    BreakingAuditLog audit("RunCompleted", 1);
    pipeline::MatchRun run(config::EngineConfig{}, repo, audit, ids, clock);
    const auto outcome = run.execute(three_profiles(), three_records());

    REQUIRE(outcome.succeeded());
    CHECK(run.stage() == RunStage::kDone);
    REQUIRE(outcome.artifact.has_value());
    CHECK(outcome.artifact->pairs.size() == 3);
    REQUIRE(outcome.audit_error.has_value());
    CHECK(outcome.audit_error->find("disk I/O error") != std::string::npos);
    CHECK(repo.run_ids.size() == 1);

    const auto types = event_types(audit, outcome.run_id);
    REQUIRE(types.size() == 7);
    CHECK(types.back() == "StageCompleted");
  }

  SECTION("PERSISTING StageCompleted rejected") {
    BreakingAuditLog audit("StageCompleted", 4);
    pipeline::MatchRun run(config::EngineConfig{}, repo, audit, ids, clock);
    const auto outcome = run.execute(three_profiles(), three_records());

    REQUIRE(outcome.succeeded());
    CHECK_FALSE(outcome.failure.has_value());
    CHECK(outcome.audit_error.has_value());
    CHECK(repo.run_ids.size() == 1);
    CHECK(audit.rejected == 1);
    CHECK(event_types(audit, outcome.run_id).size() == 6);
    CHECK(run.stage_history().back() == RunStage::kDone);
  }
}

TEST_CASE("MatchRun fails without persisting when the audit log breaks early",
          "[pipeline][run][audit]") {
  RecordingRepository repo;
  core::DeterministicIdGenerator ids;
  core::FixedClock clock("2025-06-01T09:00:00Z");

  SECTION("during SCORING") {
    BreakingAuditLog audit("SolverModeSelected", 1);
    pipeline::MatchRun run(config::EngineConfig{}, repo, audit, ids, clock);
    const auto outcome = run.execute(three_profiles(), three_records());

    REQUIRE(outcome.failure.has_value());
    CHECK(outcome.failure->stage == RunStage::kScoring);
    CHECK(outcome.failure->kind == core::MatchErrorKind::kComputationInconsistency);
    CHECK_FALSE(outcome.artifact.has_value());
    CHECK(repo.run_ids.empty());
    // RunFailed could not be written either
    CHECK(outcome.audit_error.has_value());
    CHECK(run.stage_history() ==
          std::vector<RunStage>{RunStage::kInit, RunStage::kScoring, RunStage::kFailed});
  }

  SECTION("at RunStarted") {
    BreakingAuditLog audit("RunStarted", 1);
    pipeline::MatchRun run(config::EngineConfig{}, repo, audit, ids, clock);
    const auto outcome = run.execute(three_profiles(), three_records());

    REQUIRE(outcome.failure.has_value());
    CHECK(outcome.failure->stage == RunStage::kInit);
    CHECK(outcome.audit_error.has_value());
    CHECK(repo.run_ids.empty());
    CHECK(audit.list_trace_ids().empty());
  }
}
