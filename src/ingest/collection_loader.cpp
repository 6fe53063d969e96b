#include "pmatch/ingest/collection_loader.h"

#include "pmatch/core/normalization.h"

#include <cmath>
#include <fstream>
#include <limits>
#include <optional>
#include <set>

namespace pmatch::ingest {

namespace {

using json = nlohmann::json;

std::optional<std::string> read_id(const json& entry) {
  if (!entry.contains("id")) {
    return std::nullopt;
  }
  const auto& id = entry.at("id");
  if (id.is_string()) {
    std::string value = core::trim(id.get<std::string>());
    if (value.empty()) {
      return std::nullopt;
    }
    return value;
  }
  if (id.is_number_integer()) {
    return std::to_string(id.get<long long>());
  }
  return std::nullopt;
}

// Reads "age" following the optional-field schema. Pushes a notice for every value that
// will make the scorer fall back to the neutral age sub-score.
std::optional<int> read_age(const json& entry, const std::string& kind, const std::string& id,
                            std::vector<LoadNotice>& notices) {
  if (!entry.contains("age") || entry.at("age").is_null()) {
    notices.push_back({kind, id, "age", "missing"});
    return std::nullopt;
  }

  const auto& age = entry.at("age");
  std::optional<int> value;
  if (age.is_number_integer()) {
    const auto raw = age.get<long long>();
    if (raw >= std::numeric_limits<int>::min() && raw <= std::numeric_limits<int>::max()) {
      value = static_cast<int>(raw);
    }
  } else if (age.is_number_float()) {
    const double raw = age.get<double>();
    if (std::isfinite(raw) && std::floor(raw) == raw && std::fabs(raw) < 1e9) {
      value = static_cast<int>(raw);
    }
  }

  if (!value.has_value()) {
    notices.push_back({kind, id, "age", "not an integer: " + age.dump()});
    return std::nullopt;
  }
  if (!domain::is_plausible_age(value)) {
    notices.push_back({kind, id, "age", "outside plausible range: " + std::to_string(*value)});
  }
  return value;
}

std::optional<std::string> read_category(const json& source, const char* key, const char* alias,
                                         const std::string& kind, const std::string& id,
                                         std::vector<LoadNotice>& notices) {
  const char* found = nullptr;
  if (source.contains(key)) {
    found = key;
  } else if (alias != nullptr && source.contains(alias)) {
    found = alias;
  }
  if (found == nullptr || source.at(found).is_null()) {
    return std::nullopt;
  }

  const auto& value = source.at(found);
  if (!value.is_string()) {
    notices.push_back({kind, id, key, "not a string: " + value.dump()});
    return std::nullopt;
  }
  return core::normalize_category(value.get<std::string>());
}

domain::Demographics read_demographics(const json& entry, const std::string& kind,
                                       const std::string& id, std::vector<LoadNotice>& notices) {
  const json* source = &entry;
  if (entry.contains("demographics")) {
    const auto& nested = entry.at("demographics");
    if (nested.is_object()) {
      source = &nested;
    } else if (!nested.is_null()) {
      notices.push_back({kind, id, "demographics", "not an object"});
      return {};
    }
  }

  domain::Demographics d;
  d.education = read_category(*source, "education", nullptr, kind, id, notices);
  d.occupation_category =
      read_category(*source, "occupation_category", "occupation", kind, id, notices);
  d.income_bracket = read_category(*source, "income_bracket", "income_level", kind, id, notices);
  d.marital_status = read_category(*source, "marital_status", nullptr, kind, id, notices);
  return d;
}

std::optional<json> read_tree(const json& entry, const char* key) {
  if (!entry.contains(key) || entry.at(key).is_null()) {
    return std::nullopt;
  }
  return entry.at(key);
}

// Shared envelope checks. On success returns the entity id.
core::Result<std::string, std::string> check_entry(const json& entry, std::size_t index,
                                                   const std::string& kind,
                                                   std::set<std::string>& seen_ids) {
  if (!entry.is_object()) {
    return core::Result<std::string, std::string>::err(kind + " #" + std::to_string(index) +
                                                       " is not an object");
  }
  auto id = read_id(entry);
  if (!id.has_value()) {
    return core::Result<std::string, std::string>::err(kind + " #" + std::to_string(index) +
                                                       " has no usable id");
  }
  if (!seen_ids.insert(*id).second) {
    return core::Result<std::string, std::string>::err("duplicate " + kind + " id: " + *id);
  }
  return core::Result<std::string, std::string>::ok(*id);
}

}  // namespace

core::Result<ProfileCollection, std::string> parse_profiles(const nlohmann::json& j) {
  using R = core::Result<ProfileCollection, std::string>;
  if (!j.is_array()) {
    return R::err("profile collection must be a JSON array");
  }

  ProfileCollection out;
  out.items.reserve(j.size());
  std::set<std::string> seen_ids;

  for (std::size_t i = 0; i < j.size(); ++i) {
    const auto& entry = j[i];
    auto id = check_entry(entry, i, "profile", seen_ids);
    if (!id.has_value()) {
      return R::err(id.error());
    }

    domain::Profile p;
    p.id = id.value();
    p.age = read_age(entry, "profile", p.id, out.notices);
    p.demographics = read_demographics(entry, "profile", p.id, out.notices);
    p.attributes = read_tree(entry, "attributes");
    out.items.push_back(std::move(p));
  }

  return R::ok(std::move(out));
}

core::Result<RecordCollection, std::string> parse_records(const nlohmann::json& j) {
  using R = core::Result<RecordCollection, std::string>;
  if (!j.is_array()) {
    return R::err("record collection must be a JSON array");
  }

  RecordCollection out;
  out.items.reserve(j.size());
  std::set<std::string> seen_ids;

  for (std::size_t i = 0; i < j.size(); ++i) {
    const auto& entry = j[i];
    auto id = check_entry(entry, i, "record", seen_ids);
    if (!id.has_value()) {
      return R::err(id.error());
    }

    domain::Record r;
    r.id = id.value();
    r.age = read_age(entry, "record", r.id, out.notices);
    r.demographics = read_demographics(entry, "record", r.id, out.notices);
    r.clinical_profile = read_tree(entry, "clinical_profile");

    if (entry.contains("conditions") && entry.at("conditions").is_array()) {
      for (const auto& code : entry.at("conditions")) {
        if (code.is_string()) {
          r.conditions.push_back(code.get<std::string>());
        } else {
          out.notices.push_back({"record", r.id, "conditions", "non-string code dropped"});
        }
      }
    }
    out.items.push_back(std::move(r));
  }

  return R::ok(std::move(out));
}

core::Result<nlohmann::json, std::string> read_json_file(const std::string& path) {
  using R = core::Result<nlohmann::json, std::string>;
  std::ifstream in(path);
  if (!in) {
    return R::err("cannot open " + path);
  }
  try {
    return R::ok(nlohmann::json::parse(in));
  } catch (const nlohmann::json::parse_error& e) {
    return R::err(path + ": " + e.what());
  }
}

core::Result<ProfileCollection, std::string> load_profiles_file(const std::string& path) {
  auto doc = read_json_file(path);
  if (!doc.has_value()) {
    return core::Result<ProfileCollection, std::string>::err(doc.error());
  }
  return parse_profiles(doc.value());
}

core::Result<RecordCollection, std::string> load_records_file(const std::string& path) {
  auto doc = read_json_file(path);
  if (!doc.has_value()) {
    return core::Result<RecordCollection, std::string>::err(doc.error());
  }
  return parse_records(doc.value());
}

}  // namespace pmatch::ingest
