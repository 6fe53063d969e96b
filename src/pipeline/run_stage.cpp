#include "pmatch/pipeline/run_stage.h"

#include <stdexcept>

namespace pmatch::pipeline {

std::string run_stage_to_string(const RunStage stage) {
  switch (stage) {
    case RunStage::kInit:
      return "INIT";
    case RunStage::kScoring:
      return "SCORING";
    case RunStage::kSolving:
      return "SOLVING";
    case RunStage::kReporting:
      return "REPORTING";
    case RunStage::kPersisting:
      return "PERSISTING";
    case RunStage::kDone:
      return "DONE";
    case RunStage::kFailed:
      return "FAILED";
  }
  return "FAILED";
}

RunStage run_stage_from_string(const std::string& s) {
  if (s == "INIT") {
    return RunStage::kInit;
  }
  if (s == "SCORING") {
    return RunStage::kScoring;
  }
  if (s == "SOLVING") {
    return RunStage::kSolving;
  }
  if (s == "REPORTING") {
    return RunStage::kReporting;
  }
  if (s == "PERSISTING") {
    return RunStage::kPersisting;
  }
  if (s == "DONE") {
    return RunStage::kDone;
  }
  if (s == "FAILED") {
    return RunStage::kFailed;
  }
  throw std::invalid_argument("unknown run stage: " + s);
}

bool is_valid_transition(const RunStage from, const RunStage to) {
  if (is_terminal(from)) {
    return false;
  }
  if (to == RunStage::kFailed) {
    return true;
  }
  switch (from) {
    case RunStage::kInit:
      return to == RunStage::kScoring;
    case RunStage::kScoring:
      return to == RunStage::kSolving;
    case RunStage::kSolving:
      return to == RunStage::kReporting;
    case RunStage::kReporting:
      return to == RunStage::kPersisting;
    case RunStage::kPersisting:
      return to == RunStage::kDone;
    case RunStage::kDone:
    case RunStage::kFailed:
      return false;
  }
  return false;
}

}  // namespace pmatch::pipeline
