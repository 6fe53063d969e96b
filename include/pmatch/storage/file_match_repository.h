#pragma once

#include "pmatch/storage/match_repository.h"

#include <filesystem>

namespace pmatch::storage {

// Writes the artifact document to a single file. The content goes to a temporary file in
// the destination's directory first, is fsync'ed, and is renamed over the destination
// only then, so readers (and a reboot after a crash) see either the old file or the
// complete new one. The directory is synced after the rename where the filesystem allows.
// POSIX only.
class FileMatchRepository final : public IMatchRepository {
 public:
  explicit FileMatchRepository(std::filesystem::path path) : path_(std::move(path)) {}

  [[nodiscard]] core::Result<bool, std::string> save(
      const std::string& run_id, const domain::MatchArtifact& artifact) override;
  [[nodiscard]] core::Result<std::optional<domain::MatchArtifact>, std::string> load_latest()
      const override;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace pmatch::storage
