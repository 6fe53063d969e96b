#include "pmatch/storage/file_match_repository.h"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace pmatch;
namespace fs = std::filesystem;

static domain::MatchArtifact artifact_with_pairs(int n) {
  domain::MatchArtifact a;
  a.run_timestamp = "2025-03-01T12:00:00Z";
  for (int i = 0; i < n; ++i) {
    domain::MatchedPair p;
    p.profile_id = "p-" + std::to_string(i);
    p.record_id = "r-" + std::to_string(i);
    p.score = 0.8;
    p.sub_scores = {0.9, 0.65};
    p.quality_tier = domain::QualityTier::kGood;
    p.age_gap = 1;
    a.pairs.push_back(p);
  }
  a.diagnostics.has_data = n > 0;
  a.diagnostics.pair_count = static_cast<std::size_t>(n);
  a.solver = {"auto", "exact", "auto", 0, 0, 0.8 * n};
  a.weight_age = 0.6;
  a.weight_socio = 0.4;
  return a;
}

static std::string read_file(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

static std::size_t count_entries(const fs::path& dir) {
  return static_cast<std::size_t>(
      std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
}

TEST_CASE("FileMatchRepository writes the serialized artifact", "[storage][file]") {
  const auto dir = fs::temp_directory_path() / "pmatch_file_repo_test";
  fs::remove_all(dir);
  fs::create_directories(dir);
  const auto path = dir / "matches.json";

  storage::FileMatchRepository repo(path);

  SECTION("nothing saved yet") {
    auto latest = repo.load_latest();
    REQUIRE(latest.has_value());
    CHECK_FALSE(latest.value().has_value());
  }

  SECTION("save then load") {
    const auto artifact = artifact_with_pairs(3);
    REQUIRE(repo.save("run-1", artifact).has_value());

    CHECK(read_file(path) == domain::serialize_match_artifact(artifact));
    CHECK(count_entries(dir) == 1);

    auto latest = repo.load_latest();
    REQUIRE(latest.has_value());
    REQUIRE(latest.value().has_value());
    CHECK(latest.value()->pairs.size() == 3);
  }

  SECTION("identical artifacts produce identical bytes") {
    REQUIRE(repo.save("run-1", artifact_with_pairs(2)).has_value());
    const auto first = read_file(path);
    REQUIRE(repo.save("run-2", artifact_with_pairs(2)).has_value());
    CHECK(read_file(path) == first);
  }

  SECTION("a later save replaces the whole document") {
    REQUIRE(repo.save("run-1", artifact_with_pairs(5)).has_value());
    REQUIRE(repo.save("run-2", artifact_with_pairs(1)).has_value());
    auto latest = repo.load_latest();
    REQUIRE(latest.has_value());
    REQUIRE(latest.value().has_value());
    CHECK(latest.value()->pairs.size() == 1);
    CHECK(count_entries(dir) == 1);
  }

  SECTION("a corrupt file is reported") {
    std::ofstream(path) << "{ truncated";
    CHECK_FALSE(repo.load_latest().has_value());
  }

  fs::remove_all(dir);
}

TEST_CASE("FileMatchRepository leaves the old file when the save fails", "[storage][file]") {
  const auto dir = fs::temp_directory_path() / "pmatch_file_repo_fail_test";
  fs::remove_all(dir);
  fs::create_directories(dir);

  SECTION("missing output directory") {
    storage::FileMatchRepository repo(dir / "missing" / "matches.json");
    auto result = repo.save("run-1", artifact_with_pairs(1));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().find("does not exist") != std::string::npos);
  }

  SECTION("destination cannot be replaced") {
    // A non-empty directory at the destination makes the final rename fail.
    const auto target = dir / "matches.json";
    fs::create_directories(target / "occupied");
    storage::FileMatchRepository repo(target);

    auto result = repo.save("run-1", artifact_with_pairs(1));
    CHECK_FALSE(result.has_value());
    CHECK(fs::is_directory(target));
    // No temporary file is left behind.
    CHECK(count_entries(dir) == 1);
  }

  SECTION("temporary file cannot be created") {
    const auto target = dir / "matches.json";
    storage::FileMatchRepository repo(target);
    REQUIRE(repo.save("run-1", artifact_with_pairs(2)).has_value());
    const auto before = read_file(target);

    fs::create_directories(dir / ".matches.json.run-2.tmp");
    auto result = repo.save("run-2", artifact_with_pairs(4));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().find("cannot create temporary file") != std::string::npos);
    CHECK(read_file(target) == before);
  }

  fs::remove_all(dir);
}
