#include "pmatch/core/clock.h"
#include "pmatch/core/errors.h"
#include "pmatch/core/id_generator.h"

#include <catch2/catch.hpp>

#include <set>
#include <string>

TEST_CASE("ID generators produce prefixed values", "[ids]") {
  SECTION("SystemIdGenerator produces distinct prefixed IDs") {
    pmatch::core::SystemIdGenerator gen;
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
      const auto id = gen.next("run");
      REQUIRE(id.rfind("run-", 0) == 0);
      seen.insert(id);
    }
    CHECK(seen.size() == 100);
  }

  SECTION("DeterministicIdGenerator counts from zero") {
    pmatch::core::DeterministicIdGenerator gen;
    CHECK(gen.next("run") == "run-0");
    CHECK(gen.next("evt") == "evt-1");
    CHECK(gen.next("evt") == "evt-2");
  }
}

TEST_CASE("clocks produce ISO 8601 timestamps", "[ids][clock]") {
  pmatch::core::FixedClock fixed("2025-01-01T00:00:00Z");
  CHECK(fixed.now_iso8601() == "2025-01-01T00:00:00Z");

  pmatch::core::SystemClock system;
  const auto now = system.now_iso8601();
  REQUIRE(now.size() == 20);
  CHECK(now[4] == '-');
  CHECK(now[10] == 'T');
  CHECK(now.back() == 'Z');
}

TEST_CASE("error kinds have stable names", "[ids][errors]") {
  using pmatch::core::MatchErrorKind;
  CHECK(pmatch::core::match_error_kind_to_string(MatchErrorKind::kInvalidInput) ==
        "invalid_input");
  CHECK(pmatch::core::match_error_kind_to_string(MatchErrorKind::kPersistenceFailure) ==
        "persistence_failure");

  const pmatch::core::MatchError error(MatchErrorKind::kResourceExhaustion, "too big");
  CHECK(error.kind() == MatchErrorKind::kResourceExhaustion);
  CHECK(std::string(error.what()) == "too big");
}
