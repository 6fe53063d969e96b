#pragma once

#include "pmatch/domain/demographics.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pmatch::domain {

// A synthetic demographic profile. Immutable once loaded.
// age is nullopt when the source value was missing or not an integer.
struct Profile {
  std::string id;
  std::optional<int> age;
  Demographics demographics;
  std::optional<nlohmann::json> attributes;  // free-form tree, not used in scoring
};

// A clinical record extracted from the health-record generator. Immutable once loaded.
// demographics are populated only when the extraction carried them.
struct Record {
  std::string id;
  std::optional<int> age;
  std::vector<std::string> conditions;
  std::optional<nlohmann::json> clinical_profile;
  Demographics demographics;
};

}  // namespace pmatch::domain
