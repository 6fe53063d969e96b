#pragma once

#include "pmatch/storage/match_repository.h"
#include "pmatch/storage/sqlite/sqlite_db.h"

#include <memory>

namespace pmatch::storage::sqlite {

// Run history in SQLite: one match_runs row carrying the artifact document and one
// match_pairs row per pair, written in a single transaction. Any failed statement rolls
// the whole run back.
class SqliteMatchRepository final : public IMatchRepository {
 public:
  explicit SqliteMatchRepository(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> save(
      const std::string& run_id, const domain::MatchArtifact& artifact) override;
  [[nodiscard]] core::Result<std::optional<domain::MatchArtifact>, std::string> load_latest()
      const override;

  [[nodiscard]] std::size_t count_runs() const;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace pmatch::storage::sqlite
