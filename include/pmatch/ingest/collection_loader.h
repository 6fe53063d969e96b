#pragma once

#include "pmatch/core/result.h"
#include "pmatch/domain/profile.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pmatch::ingest {

// A per-entity data-quality observation raised while loading. Notices never fail a
// load; they are surfaced as FieldFallback audit events by the run pipeline.
struct LoadNotice {
  std::string entity_kind;  // "profile" | "record"
  std::string entity_id;
  std::string field;
  std::string detail;
};

struct ProfileCollection {
  std::vector<domain::Profile> items;
  std::vector<LoadNotice> notices;
};

struct RecordCollection {
  std::vector<domain::Record> items;
  std::vector<LoadNotice> notices;
};

// Field schema (both collections):
//   id            required; non-empty string or integer; unique within the collection
//   age           optional; integer (or integral float). Anything else -> nullopt + notice.
//                 Integers outside [kMinPlausibleAge, kMaxPlausibleAge] are kept, with a notice.
//   demographics  optional object {education, occupation_category, income_bracket,
//                 marital_status}; when absent the same keys are read from the top level.
//                 Aliases: income_level -> income_bracket, occupation -> occupation_category.
//                 Non-string values are dropped with a notice; "unknown"/empty -> nullopt.
//   attributes / clinical_profile  optional, kept verbatim.
//   conditions    optional array of strings (records only); default empty.
//
// Errors (Result::err): top level not an array, element not an object, missing/empty id,
// duplicate id. Input order is preserved.
[[nodiscard]] core::Result<ProfileCollection, std::string> parse_profiles(const nlohmann::json& j);
[[nodiscard]] core::Result<RecordCollection, std::string> parse_records(const nlohmann::json& j);

// Reads and parses a JSON document. Err carries the path and the parser message.
[[nodiscard]] core::Result<nlohmann::json, std::string> read_json_file(const std::string& path);

[[nodiscard]] core::Result<ProfileCollection, std::string> load_profiles_file(
    const std::string& path);
[[nodiscard]] core::Result<RecordCollection, std::string> load_records_file(
    const std::string& path);

}  // namespace pmatch::ingest
