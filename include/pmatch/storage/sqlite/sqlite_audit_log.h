#pragma once

#include "pmatch/storage/audit_log.h"
#include "pmatch/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace pmatch::storage::sqlite {

// SqliteAuditLog implements IAuditLog on the audit_events table.
// Append-only; events of a trace keep their append order through the idx column.
// append() throws std::runtime_error when the row cannot be written.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  [[nodiscard]] int next_index(const std::string& trace_id);

  std::shared_ptr<SqliteDb> db_;
  std::mutex mutex_;
  std::map<std::string, int> trace_indices_;
};

}  // namespace pmatch::storage::sqlite
