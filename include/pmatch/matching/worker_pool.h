#pragma once

#include <cstddef>
#include <functional>

namespace pmatch::matching {

// WorkerPool runs a block-partitioned loop over [0, count) on a bounded number of threads.
// Blocks are handed out through an atomic cursor, so completion order is arbitrary; the
// callback must only write state owned by its own block.
//
// The first exception thrown by any block stops the hand-out of further blocks and is
// rethrown from run_blocks() on the calling thread after all workers have joined.
class WorkerPool {
 public:
  // workers == 0 selects std::thread::hardware_concurrency() (at least 1).
  explicit WorkerPool(std::size_t workers = 0);

  [[nodiscard]] std::size_t workers() const { return workers_; }

  void run_blocks(std::size_t count, std::size_t block_size,
                  const std::function<void(std::size_t begin, std::size_t end)>& body) const;

 private:
  std::size_t workers_;
};

}  // namespace pmatch::matching
