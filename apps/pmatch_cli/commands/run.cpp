#include "run.h"

#include "pmatch/config/engine_config.h"
#include "pmatch/core/clock.h"
#include "pmatch/core/id_generator.h"
#include "pmatch/matching/assignment_solver.h"
#include "pmatch/storage/audit_log.h"
#include "pmatch/storage/file_match_repository.h"
#include "pmatch/storage/sqlite/sqlite_audit_log.h"
#include "pmatch/storage/sqlite/sqlite_db.h"
#include "pmatch/storage/sqlite/sqlite_match_repository.h"

#include "run_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct RunCliConfig {
  std::optional<std::string> profiles_path;
  std::optional<std::string> records_path;
  std::optional<std::string> output_path;
  std::optional<std::string> config_path;
  std::optional<std::string> db_path;
  std::optional<std::string> fixed_clock;
  std::optional<pmatch::matching::SolverMode> mode;
  std::optional<std::size_t> workers;
};

std::vector<pmatch::apps::Option<RunCliConfig>> run_options() {
  return {
      {"--profiles", true, "Profile collection (JSON array)",
       [](RunCliConfig& c, const std::string& v) {
         c.profiles_path = v;
         return true;
       }},
      {"--records", true, "Record collection (JSON array)",
       [](RunCliConfig& c, const std::string& v) {
         c.records_path = v;
         return true;
       }},
      {"--output", true, "Artifact path, written atomically",
       [](RunCliConfig& c, const std::string& v) {
         c.output_path = v;
         return true;
       }},
      {"--config", true, "Engine config (JSON)",
       [](RunCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--mode", true, "Solver mode (auto|exact|heuristic)",
       [](RunCliConfig& c, const std::string& v) {
         try {
           c.mode = pmatch::matching::solver_mode_from_string(v);
           return true;
         } catch (const std::invalid_argument&) {
           std::cerr << "Invalid --mode: " << v << " (valid: auto, exact, heuristic)\n";
           return false;
         }
       }},
      {"--workers", true, "Scoring threads (0 = hardware concurrency)",
       [](RunCliConfig& c, const std::string& v) {
         try {
           std::size_t consumed = 0;
           const unsigned long n = std::stoul(v, &consumed);
           if (consumed != v.size()) {
             throw std::invalid_argument(v);
           }
           c.workers = static_cast<std::size_t>(n);
           return true;
         } catch (const std::exception&) {
           std::cerr << "Invalid --workers: " << v << "\n";
           return false;
         }
       }},
      {"--db", true, "SQLite database for the audit trail and run history",
       [](RunCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--fixed-clock", true, "Use this ISO 8601 timestamp for the run and its audit events",
       [](RunCliConfig& c, const std::string& v) {
         c.fixed_clock = v;
         return true;
       }},
  };
}

int run_with_storage(const RunRequest& request, const pmatch::config::EngineConfig& engine,
                     const RunCliConfig& cli, pmatch::core::IIdGenerator& id_gen,
                     pmatch::core::IClock& clock) {
  pmatch::storage::FileMatchRepository repository(cli.output_path.value());

  if (!cli.db_path.has_value()) {
    pmatch::storage::InMemoryAuditLog audit_log;
    return execute_run(request, engine, repository, nullptr, audit_log, id_gen, clock, std::cout,
                       std::cerr);
  }

  auto db_result = pmatch::storage::sqlite::SqliteDb::open(cli.db_path.value());
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return kExitUsage;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return kExitUsage;
  }

  pmatch::storage::sqlite::SqliteAuditLog audit_log(db);
  pmatch::storage::sqlite::SqliteMatchRepository history(db);
  return execute_run(request, engine, repository, &history, audit_log, id_gen, clock, std::cout,
                     std::cerr);
}

}  // namespace

int cmd_run(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = run_options();
  const auto parsed = pmatch::apps::parse_options(argc, argv, options, 2);
  const auto& cli = parsed.config;

  if (!parsed.ok || !cli.profiles_path || !cli.records_path || !cli.output_path) {
    std::cerr << "Usage: pmatch_cli run --profiles <file> --records <file> --output <file> "
                 "[options]\n";
    pmatch::apps::print_options(std::cerr, options);
    return kExitUsage;
  }

  pmatch::config::EngineConfig engine;
  if (cli.config_path.has_value()) {
    auto loaded = pmatch::config::load_engine_config_file(cli.config_path.value());
    if (!loaded.has_value()) {
      std::cerr << "Error: " << loaded.error() << "\n";
      return kExitUsage;
    }
    engine = loaded.value();
  }
  if (cli.mode.has_value()) {
    engine.solver_mode = cli.mode.value();
  }
  if (cli.workers.has_value()) {
    engine.workers = cli.workers.value();
  }

  const RunRequest request{cli.profiles_path.value(), cli.records_path.value()};

  // Run ids are not part of the artifact but must stay unique within one database.
  pmatch::core::SystemIdGenerator id_gen;
  if (cli.fixed_clock.has_value()) {
    pmatch::core::FixedClock clock(cli.fixed_clock.value());
    return run_with_storage(request, engine, cli, id_gen, clock);
  }
  pmatch::core::SystemClock clock;
  return run_with_storage(request, engine, cli, id_gen, clock);
}
