#include "pmatch/storage/sqlite/sqlite_match_repository.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

namespace pmatch::storage::sqlite {

SqliteMatchRepository::SqliteMatchRepository(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<bool, std::string> SqliteMatchRepository::save(
    const std::string& run_id, const domain::MatchArtifact& artifact) {
  using R = core::Result<bool, std::string>;

  auto begin = db_->exec("BEGIN TRANSACTION");
  if (!begin.has_value()) {
    return begin;
  }
  const auto rollback = [&](const std::string& what) {
    const std::string message = what + ": " + db_->last_error();
    (void)db_->exec("ROLLBACK");
    return R::err(message);
  };

  const char* run_sql = R"(
    INSERT INTO match_runs
      (run_id, run_timestamp, solver_mode, pair_count, quality_index, artifact_json)
    VALUES (?, ?, ?, ?, ?, ?)
  )";
  PreparedStatement run_stmt(db_->connection(), run_sql);
  if (!run_stmt.is_valid()) {
    return rollback("prepare match_runs insert");
  }
  const std::string document = domain::serialize_match_artifact(artifact);
  sqlite3_bind_text(run_stmt.get(), 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(run_stmt.get(), 2, artifact.run_timestamp.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(run_stmt.get(), 3, artifact.solver.mode.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(run_stmt.get(), 4, static_cast<sqlite3_int64>(artifact.pairs.size()));
  sqlite3_bind_double(run_stmt.get(), 5, artifact.diagnostics.quality_index);
  sqlite3_bind_text(run_stmt.get(), 6, document.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(run_stmt.get()) != SQLITE_DONE) {
    return rollback("insert run " + run_id);
  }

  const char* pair_sql = R"(
    INSERT INTO match_pairs (run_id, profile_id, record_id, score, quality_tier)
    VALUES (?, ?, ?, ?, ?)
  )";
  PreparedStatement pair_stmt(db_->connection(), pair_sql);
  if (!pair_stmt.is_valid()) {
    return rollback("prepare match_pairs insert");
  }
  for (const auto& pair : artifact.pairs) {
    pair_stmt.reset();
    const std::string tier = domain::quality_tier_to_string(pair.quality_tier);
    sqlite3_bind_text(pair_stmt.get(), 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(pair_stmt.get(), 2, pair.profile_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(pair_stmt.get(), 3, pair.record_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(pair_stmt.get(), 4, pair.score);
    sqlite3_bind_text(pair_stmt.get(), 5, tier.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(pair_stmt.get()) != SQLITE_DONE) {
      return rollback("insert pair (" + pair.profile_id + ", " + pair.record_id + ")");
    }
  }

  auto commit = db_->exec("COMMIT");
  if (!commit.has_value()) {
    (void)db_->exec("ROLLBACK");
    return commit;
  }
  return R::ok(true);
}

core::Result<std::optional<domain::MatchArtifact>, std::string>
SqliteMatchRepository::load_latest() const {
  using R = core::Result<std::optional<domain::MatchArtifact>, std::string>;

  PreparedStatement stmt(db_->connection(),
                         "SELECT artifact_json FROM match_runs ORDER BY seq DESC LIMIT 1");
  if (!stmt.is_valid()) {
    return R::err("query latest run: " + stmt.error());
  }
  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return R::ok(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return R::err("query latest run: " + db_->last_error());
  }
  try {
    const auto j = nlohmann::json::parse(column_text(stmt.get(), 0));
    return R::ok(domain::match_artifact_from_json(j));
  } catch (const std::exception& e) {
    return R::err(std::string("stored artifact is invalid: ") + e.what());
  }
}

std::size_t SqliteMatchRepository::count_runs() const {
  PreparedStatement stmt(db_->connection(), "SELECT COUNT(*) FROM match_runs");
  if (!stmt.is_valid() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return 0;
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

}  // namespace pmatch::storage::sqlite
