#pragma once

#include <string>

namespace pmatch::pipeline {

// Stages of one matching run.
// kInit:       validate and canonicalize both collections
// kScoring:    select the solver mode and build the compatibility matrix
// kSolving:    compute the one-to-one assignment
// kReporting:  build pairs and diagnostics
// kPersisting: atomic write of the artifact
// kDone / kFailed: terminal
enum class RunStage { kInit, kScoring, kSolving, kReporting, kPersisting, kDone, kFailed };

// Upper-case stage names ("INIT", "SCORING", ...).
// run_stage_from_string throws std::invalid_argument for unknown values.
std::string run_stage_to_string(RunStage stage);
RunStage run_stage_from_string(const std::string& s);

// Each non-terminal stage moves to its successor or to kFailed; terminal stages have no
// outgoing transitions.
[[nodiscard]] bool is_valid_transition(RunStage from, RunStage to);

[[nodiscard]] inline bool is_terminal(RunStage stage) {
  return stage == RunStage::kDone || stage == RunStage::kFailed;
}

}  // namespace pmatch::pipeline
