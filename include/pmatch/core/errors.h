#pragma once

#include <stdexcept>
#include <string>

namespace pmatch::core {

// Whole-run failure categories. Per-pair data problems are not errors: the scorer
// absorbs them with neutral fallbacks and annotates the pair instead.
enum class MatchErrorKind {
  kInvalidInput,              // unparsable collection, duplicate or empty ids
  kResourceExhaustion,        // matrix cannot be allocated/processed in the requested mode
  kComputationInconsistency,  // score outside [0,1] or a non-unique assignment
  kPersistenceFailure,        // artifact could not be written atomically
};

std::string match_error_kind_to_string(MatchErrorKind kind);

// MatchError aborts a run. MatchRun translates it into the FAILED state together with
// the stage that raised it; nothing downstream of that stage executes.
class MatchError : public std::runtime_error {
 public:
  MatchError(MatchErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] MatchErrorKind kind() const noexcept { return kind_; }

 private:
  MatchErrorKind kind_;
};

}  // namespace pmatch::core
