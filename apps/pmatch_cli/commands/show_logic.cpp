#include "show_logic.h"

#include "pmatch/domain/match_artifact.h"

#include <nlohmann/json.hpp>

int execute_show(const pmatch::storage::IMatchRepository& repository, std::ostream& out,
                 std::ostream& err) {
  const auto latest = repository.load_latest();
  if (!latest.has_value()) {
    err << "Failed to read run history: " << latest.error() << "\n";
    return 2;
  }
  if (!latest.value().has_value()) {
    err << "No stored runs\n";
    return 1;
  }

  const auto full = pmatch::domain::match_artifact_to_json(latest.value().value());
  nlohmann::json view;
  view["run_timestamp"] = full.at("run_timestamp");
  view["solver"] = full.at("solver");
  view["weights"] = full.at("weights");
  view["diagnostics"] = full.at("diagnostics");
  view["unmatched_profiles"] = full.at("unmatched_profiles").size();
  view["unmatched_records"] = full.at("unmatched_records").size();
  out << view.dump(2) << "\n";
  return 0;
}
