#pragma once

#include "pmatch/core/result.h"
#include "pmatch/domain/match_artifact.h"

#include <optional>
#include <string>

namespace pmatch::storage {

// IMatchRepository persists a run's artifact as one all-or-nothing unit.
// After a failed save() the previous durable state is unchanged.
class IMatchRepository {
 public:
  virtual ~IMatchRepository() = default;

  [[nodiscard]] virtual core::Result<bool, std::string> save(
      const std::string& run_id, const domain::MatchArtifact& artifact) = 0;

  // Most recently saved artifact; nullopt when nothing has been saved yet.
  [[nodiscard]] virtual core::Result<std::optional<domain::MatchArtifact>, std::string>
  load_latest() const = 0;
};

}  // namespace pmatch::storage
