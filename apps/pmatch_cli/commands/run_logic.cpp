#include "run_logic.h"

#include "pmatch/core/errors.h"
#include "pmatch/pipeline/match_run.h"
#include "pmatch/pipeline/run_stage.h"

#include <nlohmann/json.hpp>

int execute_run(const RunRequest& request, const pmatch::config::EngineConfig& config,
                pmatch::storage::IMatchRepository& repository,
                pmatch::storage::IMatchRepository* history, pmatch::storage::IAuditLog& audit_log,
                pmatch::core::IIdGenerator& id_gen, pmatch::core::IClock& clock, std::ostream& out,
                std::ostream& err) {
  pmatch::pipeline::MatchRun run(config, repository, audit_log, id_gen, clock);
  const auto outcome = run.execute_files(request.profiles_path, request.records_path);

  err << "--- Audit Trail (trace_id=" << outcome.run_id << ") ---\n";
  for (const auto& event : audit_log.query(outcome.run_id)) {
    err << event.created_at << " [" << event.event_type << "] " << event.payload << "\n";
  }

  nlohmann::json summary;
  summary["run_id"] = outcome.run_id;
  summary["status"] = pmatch::pipeline::run_stage_to_string(outcome.final_stage);
  if (outcome.audit_error.has_value()) {
    summary["audit_error"] = outcome.audit_error.value();
    err << "Audit trail for " << outcome.run_id
        << " is incomplete: " << outcome.audit_error.value() << "\n";
  }

  if (!outcome.succeeded()) {
    const auto& failure = outcome.failure.value();
    summary["failed_stage"] = pmatch::pipeline::run_stage_to_string(failure.stage);
    summary["error_kind"] = pmatch::core::match_error_kind_to_string(failure.kind);
    summary["message"] = failure.message;
    err << "Run failed in " << pmatch::pipeline::run_stage_to_string(failure.stage) << " ("
        << pmatch::core::match_error_kind_to_string(failure.kind) << "): " << failure.message
        << "\n";
    out << summary.dump(2) << "\n";
    return kExitFailed;
  }

  const auto& artifact = outcome.artifact.value();
  if (history != nullptr) {
    const auto stored = history->save(outcome.run_id, artifact);
    if (!stored.has_value()) {
      err << "Run " << outcome.run_id << " completed but run history was not stored: "
          << stored.error() << "\n";
      return kExitFailed;
    }
  }

  summary["mode"] = artifact.solver.mode;
  summary["reason"] = artifact.solver.reason;
  summary["pair_count"] = artifact.pairs.size();
  summary["unmatched_profiles"] = artifact.unmatched_profiles.size();
  summary["unmatched_records"] = artifact.unmatched_records.size();
  summary["quality_index"] = artifact.diagnostics.quality_index;
  summary["status_detail"] = artifact.diagnostics.has_data ? "ok" : "no_data";
  out << summary.dump(2) << "\n";
  return outcome.audit_error.has_value() ? kExitFailed : kExitDone;
}
