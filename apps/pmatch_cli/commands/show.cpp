#include "show.h"

#include "pmatch/storage/sqlite/sqlite_db.h"
#include "pmatch/storage/sqlite/sqlite_match_repository.h"

#include "shared/arg_parser.h"
#include "show_logic.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ShowCliConfig {
  std::optional<std::string> db_path;
};

}  // namespace

int cmd_show(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<pmatch::apps::Option<ShowCliConfig>> options = {
      {"--db", true, "Path to SQLite database file",
       [](ShowCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
  };
  const auto parsed = pmatch::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.config.db_path.has_value()) {
    std::cerr << "Usage: pmatch_cli show --db <sqlite>\n";
    return 1;
  }

  auto db_result = pmatch::storage::sqlite::SqliteDb::open(parsed.config.db_path.value());
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return 1;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return 1;
  }

  pmatch::storage::sqlite::SqliteMatchRepository repository(db);
  return execute_show(repository, std::cout, std::cerr);
}
