#include "pmatch/pipeline/run_stage.h"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <vector>

using namespace pmatch;
using pipeline::RunStage;

TEST_CASE("run stage names", "[pipeline][stage]") {
  CHECK(pipeline::run_stage_to_string(RunStage::kPersisting) == "PERSISTING");
  CHECK(pipeline::run_stage_from_string("SOLVING") == RunStage::kSolving);
  CHECK_THROWS_AS(pipeline::run_stage_from_string("solving"), std::invalid_argument);
}

TEST_CASE("run stages advance in order", "[pipeline][stage]") {
  const std::vector<RunStage> order = {RunStage::kInit,      RunStage::kScoring,
                                       RunStage::kSolving,   RunStage::kReporting,
                                       RunStage::kPersisting, RunStage::kDone};
  for (std::size_t i = 0; i + 1 < order.size(); ++i) {
    CHECK(pipeline::is_valid_transition(order[i], order[i + 1]));
    CHECK(pipeline::is_valid_transition(order[i], RunStage::kFailed));
  }

  SECTION("no skipping or going back") {
    CHECK_FALSE(pipeline::is_valid_transition(RunStage::kInit, RunStage::kSolving));
    CHECK_FALSE(pipeline::is_valid_transition(RunStage::kReporting, RunStage::kScoring));
    CHECK_FALSE(pipeline::is_valid_transition(RunStage::kScoring, RunStage::kScoring));
    CHECK_FALSE(pipeline::is_valid_transition(RunStage::kSolving, RunStage::kDone));
  }

  SECTION("terminal stages are final") {
    CHECK(pipeline::is_terminal(RunStage::kDone));
    CHECK(pipeline::is_terminal(RunStage::kFailed));
    CHECK_FALSE(pipeline::is_terminal(RunStage::kPersisting));
    CHECK_FALSE(pipeline::is_valid_transition(RunStage::kDone, RunStage::kFailed));
    CHECK_FALSE(pipeline::is_valid_transition(RunStage::kFailed, RunStage::kInit));
  }
}
