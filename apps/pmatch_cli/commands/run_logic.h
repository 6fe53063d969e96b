#pragma once

#include "pmatch/config/engine_config.h"
#include "pmatch/core/clock.h"
#include "pmatch/core/id_generator.h"
#include "pmatch/storage/audit_log.h"
#include "pmatch/storage/match_repository.h"

#include <ostream>
#include <string>

struct RunRequest {
  std::string profiles_path;
  std::string records_path;
};

// Exit codes shared by the subcommands.
constexpr int kExitDone = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;

// execute_run: run one match over the two input files, persist through repository, and
// print a JSON summary to out. The audit trail and any failure (with its stage) go to err.
// history, when non-null, additionally records a successful run (e.g. SQLite run history);
// a history write failure turns the exit code into kExitFailed, and so does a completed run
// whose audit trail could not be finished (the artifact is still written and reported).
// Takes only interface types; concrete storage is wired by the caller.
int execute_run(const RunRequest& request, const pmatch::config::EngineConfig& config,
                pmatch::storage::IMatchRepository& repository,
                pmatch::storage::IMatchRepository* history, pmatch::storage::IAuditLog& audit_log,
                pmatch::core::IIdGenerator& id_gen, pmatch::core::IClock& clock, std::ostream& out,
                std::ostream& err);
