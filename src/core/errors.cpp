#include "pmatch/core/errors.h"

namespace pmatch::core {

std::string match_error_kind_to_string(MatchErrorKind kind) {
  switch (kind) {
    case MatchErrorKind::kInvalidInput:
      return "invalid_input";
    case MatchErrorKind::kResourceExhaustion:
      return "resource_exhaustion";
    case MatchErrorKind::kComputationInconsistency:
      return "computation_inconsistency";
    case MatchErrorKind::kPersistenceFailure:
      return "persistence_failure";
  }
  return "unknown";
}

}  // namespace pmatch::core
