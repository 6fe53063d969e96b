#include "pmatch/config/engine_config.h"

#include "pmatch/ingest/collection_loader.h"

#include <cmath>
#include <set>
#include <stdexcept>

namespace pmatch::config {

namespace {

using json = nlohmann::json;
using ConfigResult = core::Result<EngineConfig, std::string>;

void reject_unknown_keys(const json& j, const std::string& section,
                         const std::set<std::string>& allowed) {
  for (const auto& item : j.items()) {
    if (allowed.count(item.key()) == 0) {
      throw std::invalid_argument("unknown key '" + item.key() + "' in " + section);
    }
  }
}

std::size_t read_count(const json& section, const char* key, std::size_t current) {
  if (!section.contains(key)) {
    return current;
  }
  const auto& v = section.at(key);
  if (!v.is_number_integer() || v.get<long long>() < 0) {
    throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
  }
  return v.get<std::size_t>();
}

matching::ScoreWeights read_weights(const json& j) {
  if (j.is_string()) {
    const auto preset = j.get<std::string>();
    if (preset == "demographic_proximity") {
      return matching::demographic_proximity_preset();
    }
    if (preset == "balanced") {
      return matching::balanced_preset();
    }
    throw std::invalid_argument("unknown weights preset: " + preset);
  }
  if (!j.is_object()) {
    throw std::invalid_argument("weights must be an object or a preset name");
  }
  reject_unknown_keys(j, "weights", {"age", "socio"});
  return matching::ScoreWeights{j.at("age").get<double>(), j.at("socio").get<double>()};
}

}  // namespace

ConfigResult engine_config_from_json(const json& j, const EngineConfig& base) {
  if (!j.is_object()) {
    return ConfigResult::err("engine config must be a JSON object");
  }

  EngineConfig config = base;
  try {
    reject_unknown_keys(j, "engine config", {"weights", "solver", "scoring"});

    if (j.contains("weights")) {
      config.weights = read_weights(j.at("weights"));
    }

    if (j.contains("solver")) {
      const auto& solver = j.at("solver");
      reject_unknown_keys(solver, "solver",
                          {"mode", "exact_max_cells", "dense_cell_limit", "candidates_per_row",
                           "repair_passes"});
      if (solver.contains("mode")) {
        config.solver_mode = matching::solver_mode_from_string(solver.at("mode").get<std::string>());
      }
      config.exact_max_cells = read_count(solver, "exact_max_cells", config.exact_max_cells);
      config.dense_cell_limit = read_count(solver, "dense_cell_limit", config.dense_cell_limit);
      config.candidates_per_row =
          read_count(solver, "candidates_per_row", config.candidates_per_row);
      config.repair_passes = read_count(solver, "repair_passes", config.repair_passes);
    }

    if (j.contains("scoring")) {
      const auto& scoring = j.at("scoring");
      reject_unknown_keys(scoring, "scoring", {"workers", "row_block_size"});
      config.workers = read_count(scoring, "workers", config.workers);
      config.row_block_size = read_count(scoring, "row_block_size", config.row_block_size);
    }
  } catch (const json::exception& e) {
    return ConfigResult::err(std::string("invalid engine config: ") + e.what());
  } catch (const std::invalid_argument& e) {
    return ConfigResult::err(std::string("invalid engine config: ") + e.what());
  }

  auto valid = validate_engine_config(config);
  if (!valid.has_value()) {
    return ConfigResult::err(valid.error());
  }
  return ConfigResult::ok(config);
}

json engine_config_to_json(const EngineConfig& config) {
  json j;
  j["weights"] = {{"age", config.weights.age}, {"socio", config.weights.socio}};
  j["solver"] = {{"mode", matching::solver_mode_to_string(config.solver_mode)},
                 {"exact_max_cells", config.exact_max_cells},
                 {"dense_cell_limit", config.dense_cell_limit},
                 {"candidates_per_row", config.candidates_per_row},
                 {"repair_passes", config.repair_passes}};
  j["scoring"] = {{"workers", config.workers}, {"row_block_size", config.row_block_size}};
  return j;
}

ConfigResult load_engine_config_file(const std::string& path) {
  auto doc = ingest::read_json_file(path);
  if (!doc.has_value()) {
    return ConfigResult::err(doc.error());
  }
  return engine_config_from_json(doc.value());
}

core::Result<bool, std::string> validate_engine_config(const EngineConfig& config) {
  using R = core::Result<bool, std::string>;
  const auto& w = config.weights;
  if (!std::isfinite(w.age) || !std::isfinite(w.socio) || w.age < 0.0 || w.socio < 0.0) {
    return R::err("weights must be finite and non-negative");
  }
  if (std::abs(w.age + w.socio - 1.0) > 1e-9) {
    return R::err("weights must sum to 1");
  }
  if (config.exact_max_cells > config.dense_cell_limit) {
    return R::err("exact_max_cells must not exceed dense_cell_limit");
  }
  if (config.candidates_per_row == 0) {
    return R::err("candidates_per_row must be at least 1");
  }
  if (config.row_block_size == 0) {
    return R::err("row_block_size must be at least 1");
  }
  return R::ok(true);
}

matching::SolverConfig to_solver_config(const EngineConfig& config) {
  matching::SolverConfig solver;
  solver.requested = config.solver_mode;
  solver.exact_max_cells = config.exact_max_cells;
  solver.dense_cell_limit = config.dense_cell_limit;
  solver.candidates_per_row = config.candidates_per_row;
  solver.repair_passes = config.repair_passes;
  return solver;
}

matching::MatrixBuildOptions to_build_options(const EngineConfig& config) {
  matching::MatrixBuildOptions options;
  options.row_block_size = config.row_block_size;
  options.candidates_per_row = config.candidates_per_row;
  options.dense_cell_limit = config.dense_cell_limit;
  return options;
}

}  // namespace pmatch::config
