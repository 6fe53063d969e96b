#include "pmatch/core/normalization.h"

#include <catch2/catch.hpp>

using namespace pmatch;

TEST_CASE("normalize_category canonicalizes spelling", "[core][normalization]") {
  CHECK(core::normalize_category("Upper Middle") == "upper_middle");
  CHECK(core::normalize_category("upper-middle") == "upper_middle");
  CHECK(core::normalize_category("  UPPER__MIDDLE  ") == "upper_middle");
  CHECK(core::normalize_category("High School") == "high_school");
  CHECK(core::normalize_category("doctorate") == "doctorate");
}

TEST_CASE("normalize_category drops uninformative values", "[core][normalization]") {
  CHECK_FALSE(core::normalize_category("").has_value());
  CHECK_FALSE(core::normalize_category("   ").has_value());
  CHECK_FALSE(core::normalize_category("Unknown").has_value());
  CHECK_FALSE(core::normalize_category("N/A").has_value());
  CHECK_FALSE(core::normalize_category("none").has_value());
}

TEST_CASE("trim and lower-case helpers", "[core][normalization]") {
  CHECK(core::trim("\t a b \n") == "a b");
  CHECK(core::trim("") == "");
  CHECK(core::normalize_ascii_lower("MiXeD-123") == "mixed-123");
}
