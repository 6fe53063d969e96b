#pragma once

#include "pmatch/storage/audit_event.h"

#include <set>
#include <string>
#include <vector>

namespace pmatch::storage {

// Append-only sink for match run audit trails. append() throws when the event cannot be
// stored; MatchRun treats that as fatal before the artifact is committed and records it
// in RunOutcome::audit_error afterwards. Implementations keep append order per run.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  // Events of one run in append order; an empty run id returns every run's events.
  virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
  // Run ids that have at least one event, sorted.
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;
};

// Keeps events in process memory; used by tests and runs without --db.
class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  std::vector<AuditEvent> events_;
  std::set<std::string> trace_ids_;
};

}  // namespace pmatch::storage
