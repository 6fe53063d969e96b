#pragma once

#include "pmatch/domain/profile.h"
#include "pmatch/matching/compatibility_scorer.h"

#include <cstddef>
#include <vector>

namespace pmatch::matching {

// IScoreSource yields the composite score of any (row, col) cell on demand.
// Rows index profiles and cols index records, both in the run's canonical (id-sorted) order.
// Implementations must be pure and safe to call concurrently.
class IScoreSource {
 public:
  virtual ~IScoreSource() = default;

  [[nodiscard]] virtual std::size_t rows() const = 0;
  [[nodiscard]] virtual std::size_t cols() const = 0;
  [[nodiscard]] virtual double score(std::size_t row, std::size_t col) const = 0;

 protected:
  IScoreSource() = default;
  IScoreSource(const IScoreSource&) = default;
  IScoreSource& operator=(const IScoreSource&) = default;
  IScoreSource(IScoreSource&&) = default;
  IScoreSource& operator=(IScoreSource&&) = default;
};

// Scores profiles[row] against records[col] with a CompatibilityScorer.
// Holds references only; the collections and the scorer must outlive it.
class PairwiseScoreSource final : public IScoreSource {
 public:
  PairwiseScoreSource(const std::vector<domain::Profile>& profiles,
                      const std::vector<domain::Record>& records,
                      const CompatibilityScorer& scorer)
      : profiles_(profiles), records_(records), scorer_(scorer) {}

  [[nodiscard]] std::size_t rows() const override { return profiles_.size(); }
  [[nodiscard]] std::size_t cols() const override { return records_.size(); }
  [[nodiscard]] double score(std::size_t row, std::size_t col) const override {
    return scorer_.score(profiles_[row], records_[col]).composite;
  }

 private:
  const std::vector<domain::Profile>& profiles_;
  const std::vector<domain::Record>& records_;
  const CompatibilityScorer& scorer_;
};

}  // namespace pmatch::matching
