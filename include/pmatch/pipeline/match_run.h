#pragma once

#include "pmatch/config/engine_config.h"
#include "pmatch/core/clock.h"
#include "pmatch/core/errors.h"
#include "pmatch/core/id_generator.h"
#include "pmatch/domain/match_artifact.h"
#include "pmatch/domain/profile.h"
#include "pmatch/ingest/collection_loader.h"
#include "pmatch/pipeline/run_stage.h"
#include "pmatch/storage/audit_log.h"
#include "pmatch/storage/match_repository.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pmatch::pipeline {

struct RunFailure {
  RunStage stage{RunStage::kInit};  // stage that raised the error
  core::MatchErrorKind kind{core::MatchErrorKind::kInvalidInput};
  std::string message;
};

struct RunOutcome {
  std::string run_id;
  RunStage final_stage{RunStage::kInit};
  std::optional<domain::MatchArtifact> artifact;  // set only when final_stage == kDone
  std::optional<RunFailure> failure;              // set only when final_stage == kFailed
  // Set when the audit log rejected an event the run could not retract: the events after
  // the artifact commit, or RunFailed itself. The trail for run_id is then incomplete.
  std::optional<std::string> audit_error;

  [[nodiscard]] bool succeeded() const { return final_stage == RunStage::kDone; }
};

// MatchRun drives one batch run through INIT -> SCORING -> SOLVING -> REPORTING ->
// PERSISTING -> DONE. Any error moves the run to FAILED; no later stage executes and the
// repository is only touched in PERSISTING, so a failed run leaves the previous artifact
// in place.
//
// The compatibility matrix is created in SCORING, handed to SOLVING and released there;
// nothing is cached across runs. The run id doubles as the audit trace id.
//
// Audit writes up to the commit are part of the run: a throwing audit log fails it like
// any other error. Once the repository has accepted the artifact the run is DONE, and a
// later audit failure is reported through RunOutcome::audit_error instead.
//
// A MatchRun is single-use: execute() throws std::logic_error when called twice.
class MatchRun {
 public:
  MatchRun(config::EngineConfig config, storage::IMatchRepository& repository,
           storage::IAuditLog& audit_log, core::IIdGenerator& id_gen, core::IClock& clock);

  // Runs over in-memory collections. notices are the loader's data-quality observations,
  // reported as FieldFallback events.
  RunOutcome execute(std::vector<domain::Profile> profiles, std::vector<domain::Record> records,
                     const std::vector<ingest::LoadNotice>& notices = {});

  // Loads both collections in INIT; a load error fails the run with kInvalidInput.
  RunOutcome execute_files(const std::string& profiles_path, const std::string& records_path);

  [[nodiscard]] RunStage stage() const { return stage_; }
  [[nodiscard]] const std::vector<RunStage>& stage_history() const { return history_; }

 private:
  void transition(RunStage next);
  void emit(std::string_view event_type, const std::string& payload,
            std::vector<std::string> refs = {});
  RunOutcome fail(core::MatchErrorKind kind, const std::string& message);
  struct RunInputs {
    std::vector<domain::Profile> profiles;
    std::vector<domain::Record> records;
    std::vector<ingest::LoadNotice> notices;
  };

  void begin();
  // load runs inside INIT; anything it throws fails the run there.
  RunOutcome run_stages(const std::function<RunInputs()>& load);

  config::EngineConfig config_;
  storage::IMatchRepository& repository_;
  storage::IAuditLog& audit_log_;
  core::IIdGenerator& id_gen_;
  core::IClock& clock_;

  RunStage stage_{RunStage::kInit};
  std::vector<RunStage> history_;
  std::string run_id_;
  bool started_{false};
};

}  // namespace pmatch::pipeline
