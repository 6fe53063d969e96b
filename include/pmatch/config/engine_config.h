#pragma once

#include "pmatch/core/result.h"
#include "pmatch/matching/assignment_solver.h"
#include "pmatch/matching/matrix_builder.h"
#include "pmatch/matching/score_weights.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace pmatch::config {

// EngineConfig holds every tunable of a run. Every field has an explicit default, so an
// empty config file (or none at all) yields a valid configuration.
struct EngineConfig {
  matching::ScoreWeights weights{};
  matching::SolverMode solver_mode{matching::SolverMode::kAuto};
  std::size_t exact_max_cells{16'000'000};
  std::size_t dense_cell_limit{64'000'000};
  std::size_t candidates_per_row{32};
  std::size_t row_block_size{256};
  std::size_t repair_passes{4};
  // 0 selects std::thread::hardware_concurrency()
  std::size_t workers{0};
};

// Accepted document (all keys optional, unknown keys rejected):
//   {
//     "weights": {"age": 0.6, "socio": 0.4} | "demographic_proximity" | "balanced",
//     "solver": {"mode": "auto"|"exact"|"heuristic", "exact_max_cells": N,
//                "dense_cell_limit": N, "candidates_per_row": N, "repair_passes": N},
//     "scoring": {"workers": N, "row_block_size": N}
//   }
// Values missing from the document keep their value in base.
[[nodiscard]] core::Result<EngineConfig, std::string> engine_config_from_json(
    const nlohmann::json& j, const EngineConfig& base = EngineConfig{});

[[nodiscard]] nlohmann::json engine_config_to_json(const EngineConfig& config);

[[nodiscard]] core::Result<EngineConfig, std::string> load_engine_config_file(
    const std::string& path);

// Checks cross-field constraints: weights non-negative and summing to 1,
// exact_max_cells <= dense_cell_limit, candidates_per_row and row_block_size >= 1.
[[nodiscard]] core::Result<bool, std::string> validate_engine_config(const EngineConfig& config);

[[nodiscard]] matching::SolverConfig to_solver_config(const EngineConfig& config);
[[nodiscard]] matching::MatrixBuildOptions to_build_options(const EngineConfig& config);

}  // namespace pmatch::config
