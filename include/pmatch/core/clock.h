#pragma once

#include <string>
#include <utility>

namespace pmatch::core {

// Timestamp source for run_timestamp and audit events.
// Production runs use the system clock; tests inject a fixed value so that two runs over
// identical inputs produce byte-identical artifacts.
class IClock {
 public:
  virtual ~IClock() = default;

  // ISO 8601 UTC timestamp, second resolution. Never empty.
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}

  std::string now_iso8601() override;

 private:
  std::string fixed_time_;
};

}  // namespace pmatch::core
