#include "pmatch/pipeline/match_run.h"

#include "pmatch/analysis/quality_analyzer.h"
#include "pmatch/matching/assignment_solver.h"
#include "pmatch/matching/compatibility_scorer.h"
#include "pmatch/matching/matrix_builder.h"
#include "pmatch/matching/score_source.h"
#include "pmatch/matching/worker_pool.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <map>
#include <new>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace pmatch::pipeline {

namespace {

using json = nlohmann::json;

// Sorts a collection by id and rejects empty or repeated ids. The sorted order is the
// canonical row/col order every later stage relies on for tie-breaking.
template <typename T>
void canonicalize(std::vector<T>& items, const std::string& kind) {
  for (const auto& item : items) {
    if (item.id.empty()) {
      throw core::MatchError(core::MatchErrorKind::kInvalidInput, kind + " with empty id");
    }
  }
  std::sort(items.begin(), items.end(), [](const T& a, const T& b) { return a.id < b.id; });
  const auto dup = std::adjacent_find(items.begin(), items.end(),
                                      [](const T& a, const T& b) { return a.id == b.id; });
  if (dup != items.end()) {
    throw core::MatchError(core::MatchErrorKind::kInvalidInput,
                           "duplicate " + kind + " id: " + dup->id);
  }
}

std::optional<int> age_gap(const domain::Profile& profile, const domain::Record& record) {
  if (!domain::is_plausible_age(profile.age) || !domain::is_plausible_age(record.age)) {
    return std::nullopt;
  }
  return std::abs(*profile.age - *record.age);
}

}  // namespace

MatchRun::MatchRun(config::EngineConfig config, storage::IMatchRepository& repository,
                   storage::IAuditLog& audit_log, core::IIdGenerator& id_gen, core::IClock& clock)
    : config_(std::move(config)),
      repository_(repository),
      audit_log_(audit_log),
      id_gen_(id_gen),
      clock_(clock) {}

RunOutcome MatchRun::execute(std::vector<domain::Profile> profiles,
                             std::vector<domain::Record> records,
                             const std::vector<ingest::LoadNotice>& notices) {
  begin();
  return run_stages([&]() {
    return RunInputs{std::move(profiles), std::move(records), notices};
  });
}

RunOutcome MatchRun::execute_files(const std::string& profiles_path,
                                   const std::string& records_path) {
  begin();
  return run_stages([&]() {
    auto profiles = ingest::load_profiles_file(profiles_path);
    if (!profiles.has_value()) {
      throw core::MatchError(core::MatchErrorKind::kInvalidInput, profiles.error());
    }
    auto records = ingest::load_records_file(records_path);
    if (!records.has_value()) {
      throw core::MatchError(core::MatchErrorKind::kInvalidInput, records.error());
    }

    RunInputs inputs{std::move(profiles.value().items), std::move(records.value().items),
                     std::move(profiles.value().notices)};
    inputs.notices.insert(inputs.notices.end(), records.value().notices.begin(),
                          records.value().notices.end());
    return inputs;
  });
}

void MatchRun::begin() {
  if (started_) {
    throw std::logic_error("MatchRun::execute called more than once");
  }
  started_ = true;
  run_id_ = id_gen_.next("run");
  history_.push_back(RunStage::kInit);
}

RunOutcome MatchRun::run_stages(const std::function<RunInputs()>& load) {
  domain::MatchArtifact artifact;
  try {
    {
      json payload;
      payload["run_id"] = run_id_;
      payload["weights"] = {{"age", config_.weights.age}, {"socio", config_.weights.socio}};
      payload["requested_mode"] = matching::solver_mode_to_string(config_.solver_mode);
      payload["workers"] = config_.workers;
      emit(storage::event_type::kRunStarted, payload.dump(), {run_id_});
    }
    const std::string run_timestamp = clock_.now_iso8601();

    // ── INIT ────────────────────────────────────────────────────────────────
    RunInputs inputs = load();
    std::vector<domain::Profile>& profiles = inputs.profiles;
    std::vector<domain::Record>& records = inputs.records;
    const std::vector<ingest::LoadNotice>& notices = inputs.notices;
    canonicalize(profiles, "profile");
    canonicalize(records, "record");

    json loaded;
    loaded["profiles"] = profiles.size();
    loaded["records"] = records.size();
    loaded["notices"] = notices.size();
    emit(storage::event_type::kCollectionsLoaded, loaded.dump());

    std::map<std::pair<std::string, std::string>, json> fallbacks;
    for (const auto& notice : notices) {
      auto& fields = fallbacks[{notice.entity_kind, notice.entity_id}];
      if (fields.is_null()) {
        fields = json::array();
      }
      fields.push_back({{"field", notice.field}, {"detail", notice.detail}});
    }
    for (const auto& [entity, fields] : fallbacks) {
      json payload;
      payload["entity_kind"] = entity.first;
      payload["entity_id"] = entity.second;
      payload["fields"] = fields;
      emit(storage::event_type::kFieldFallback, payload.dump(), {entity.second});
    }

    const matching::CompatibilityScorer scorer(config_.weights);
    const matching::PairwiseScoreSource source(profiles, records, scorer);
    const matching::WorkerPool pool(config_.workers);
    const matching::MatrixBuilder builder(pool, config::to_build_options(config_));
    const matching::AssignmentSolver solver(config::to_solver_config(config_));
    const std::size_t rows = profiles.size();
    const std::size_t cols = records.size();

    // ── SCORING ─────────────────────────────────────────────────────────────
    transition(RunStage::kScoring);
    const matching::ModeDecision decision = solver.select_mode(rows, cols);
    const bool exact = decision.mode == matching::SolverMode::kExact;
    {
      json payload;
      payload["requested_mode"] = matching::solver_mode_to_string(config_.solver_mode);
      payload["mode"] = matching::solver_mode_to_string(decision.mode);
      payload["reason"] = decision.reason;
      emit(storage::event_type::kSolverModeSelected, payload.dump());
    }

    matching::CompatibilityMatrix matrix =
        exact ? builder.build_dense(source) : builder.build_sparse(source);
    {
      json payload;
      payload["stage"] = run_stage_to_string(RunStage::kScoring);
      payload["layout"] = exact ? "dense" : "sparse";
      payload["retained_cells"] = matrix.retained_cells();
      payload["workers"] = pool.workers();
      emit(storage::event_type::kStageCompleted, payload.dump());
    }

    // ── SOLVING ─────────────────────────────────────────────────────────────
    transition(RunStage::kSolving);
    matching::Assignment assignment =
        exact ? solver.solve_exact(matrix) : solver.solve_heuristic(source, matrix, builder);
    matrix = matching::CompatibilityMatrix{};
    matching::verify_assignment(assignment, rows, cols);
    {
      json payload;
      payload["stage"] = run_stage_to_string(RunStage::kSolving);
      payload["pairs"] = assignment.cells.size();
      payload["total_score"] = assignment.total_score;
      payload["refill_rounds"] = assignment.refill_rounds;
      payload["repair_moves"] = assignment.repair_moves;
      payload["from_row_baseline"] = assignment.from_row_baseline;
      emit(storage::event_type::kStageCompleted, payload.dump());
    }

    // ── REPORTING ───────────────────────────────────────────────────────────
    transition(RunStage::kReporting);
    artifact.run_timestamp = run_timestamp;
    artifact.weight_age = config_.weights.age;
    artifact.weight_socio = config_.weights.socio;
    artifact.solver.requested_mode = matching::solver_mode_to_string(config_.solver_mode);
    artifact.solver.mode = matching::solver_mode_to_string(decision.mode);
    artifact.solver.reason = decision.reason;
    artifact.solver.repair_passes = assignment.repair_passes;
    artifact.solver.repair_moves = assignment.repair_moves;
    artifact.solver.total_score = assignment.total_score;

    std::vector<char> profile_used(rows, 0);
    std::vector<char> record_used(cols, 0);
    artifact.pairs.reserve(assignment.cells.size());
    for (const auto& cell : assignment.cells) {
      const auto& profile = profiles[cell.row];
      const auto& record = records[cell.col];
      const matching::PairScore s = scorer.score(profile, record);
      if (std::abs(s.composite - cell.score) > matching::kImprovementEpsilon) {
        throw core::MatchError(core::MatchErrorKind::kComputationInconsistency,
                               "score of (" + profile.id + ", " + record.id +
                                   ") changed between scoring and reporting");
      }
      domain::MatchedPair pair;
      pair.profile_id = profile.id;
      pair.record_id = record.id;
      pair.score = s.composite;
      pair.sub_scores = {s.age, s.socio};
      pair.age_gap = age_gap(profile, record);
      pair.fallbacks = matching::fallback_labels(s.fallbacks);
      artifact.pairs.push_back(std::move(pair));
      profile_used[cell.row] = 1;
      record_used[cell.col] = 1;
    }
    // rows follow profile id order, so sorting by profile id keeps cells in row order
    std::sort(artifact.pairs.begin(), artifact.pairs.end(),
              [](const domain::MatchedPair& a, const domain::MatchedPair& b) {
                return std::tie(a.profile_id, a.record_id) < std::tie(b.profile_id, b.record_id);
              });
    for (std::size_t r = 0; r < rows; ++r) {
      if (profile_used[r] == 0) {
        artifact.unmatched_profiles.push_back(profiles[r].id);
      }
    }
    for (std::size_t c = 0; c < cols; ++c) {
      if (record_used[c] == 0) {
        artifact.unmatched_records.push_back(records[c].id);
      }
    }

    const analysis::QualityAnalyzer analyzer;
    analyzer.assign_tiers(artifact.pairs);
    artifact.diagnostics = analyzer.analyze(artifact.pairs);
    {
      json payload;
      payload["stage"] = run_stage_to_string(RunStage::kReporting);
      payload["status"] = artifact.diagnostics.has_data ? "ok" : "no_data";
      payload["quality_index"] = artifact.diagnostics.quality_index;
      payload["unmatched_profiles"] = artifact.unmatched_profiles.size();
      payload["unmatched_records"] = artifact.unmatched_records.size();
      emit(storage::event_type::kStageCompleted, payload.dump());
    }

    // ── PERSISTING ──────────────────────────────────────────────────────────
    transition(RunStage::kPersisting);
    const auto saved = repository_.save(run_id_, artifact);
    if (!saved.has_value()) {
      throw core::MatchError(core::MatchErrorKind::kPersistenceFailure, saved.error());
    }
  } catch (const core::MatchError& e) {
    return fail(e.kind(), e.what());
  } catch (const std::bad_alloc&) {
    return fail(core::MatchErrorKind::kResourceExhaustion, "out of memory");
  } catch (const std::invalid_argument& e) {
    return fail(core::MatchErrorKind::kInvalidInput, e.what());
  } catch (const std::exception& e) {
    return fail(core::MatchErrorKind::kComputationInconsistency, e.what());
  }

  // The artifact is committed; from here on the run is DONE whatever the audit log does.
  transition(RunStage::kDone);
  RunOutcome outcome;
  outcome.run_id = run_id_;
  outcome.final_stage = RunStage::kDone;
  try {
    {
      json payload;
      payload["stage"] = run_stage_to_string(RunStage::kPersisting);
      emit(storage::event_type::kStageCompleted, payload.dump());
    }
    json payload;
    payload["pair_count"] = artifact.pairs.size();
    payload["quality_index"] = artifact.diagnostics.quality_index;
    payload["mode"] = artifact.solver.mode;
    emit(storage::event_type::kRunCompleted, payload.dump(), {run_id_});
  } catch (const std::exception& e) {
    outcome.audit_error = e.what();
  }
  outcome.artifact = std::move(artifact);
  return outcome;
}

void MatchRun::transition(const RunStage next) {
  if (!is_valid_transition(stage_, next)) {
    throw std::logic_error("invalid run transition " + run_stage_to_string(stage_) + " -> " +
                           run_stage_to_string(next));
  }
  stage_ = next;
  history_.push_back(next);
}

void MatchRun::emit(std::string_view event_type, const std::string& payload,
                    std::vector<std::string> refs) {
  audit_log_.append({id_gen_.next("evt"), run_id_, std::string(event_type), payload,
                     clock_.now_iso8601(), std::move(refs)});
}

RunOutcome MatchRun::fail(const core::MatchErrorKind kind, const std::string& message) {
  const RunStage failed_stage = stage_;
  transition(RunStage::kFailed);

  RunOutcome outcome;
  outcome.run_id = run_id_;
  outcome.final_stage = RunStage::kFailed;
  outcome.failure = RunFailure{failed_stage, kind, message};

  json payload;
  payload["stage"] = run_stage_to_string(failed_stage);
  payload["kind"] = core::match_error_kind_to_string(kind);
  payload["message"] = message;
  try {
    emit(storage::event_type::kRunFailed, payload.dump(), {run_id_});
  } catch (const std::exception& e) {
    outcome.audit_error = e.what();
  }
  return outcome;
}

}  // namespace pmatch::pipeline
