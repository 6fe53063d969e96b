#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pmatch::storage {

// Event types a match run writes, in the order they can appear in one trace:
//   RunStarted          refs = {run id}; weights, requested mode, worker count
//   CollectionsLoaded   counts of profiles, records and load notices
//   FieldFallback       refs = {entity id}; the fields of one entity that were defaulted
//   SolverModeSelected  requested mode, the mode actually used, and why
//   StageCompleted      payload.stage is SCORING, SOLVING, REPORTING or PERSISTING
//   RunCompleted        refs = {run id}; pair count, quality index, mode
//   RunFailed           refs = {run id}; failing stage, error kind and message
namespace event_type {
inline constexpr std::string_view kRunStarted = "RunStarted";
inline constexpr std::string_view kCollectionsLoaded = "CollectionsLoaded";
inline constexpr std::string_view kFieldFallback = "FieldFallback";
inline constexpr std::string_view kSolverModeSelected = "SolverModeSelected";
inline constexpr std::string_view kStageCompleted = "StageCompleted";
inline constexpr std::string_view kRunCompleted = "RunCompleted";
inline constexpr std::string_view kRunFailed = "RunFailed";
}  // namespace event_type

// One entry of a match run's audit trail. trace_id is the run id, so every event of a
// run shares it; event_id is unique per event ("evt-" prefixed). payload is a JSON
// object serialized to text. created_at is the run clock's ISO-8601 UTC timestamp.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace pmatch::storage
