#include "pmatch/matching/worker_pool.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace pmatch::matching {

WorkerPool::WorkerPool(const std::size_t workers) : workers_(workers) {
  if (workers_ == 0) {
    workers_ = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  }
}

void WorkerPool::run_blocks(
    const std::size_t count, const std::size_t block_size,
    const std::function<void(std::size_t begin, std::size_t end)>& body) const {
  if (count == 0) {
    return;
  }
  const std::size_t block = std::max<std::size_t>(1, block_size);
  const std::size_t block_count = (count + block - 1) / block;
  const std::size_t threads = std::min(workers_, block_count);

  std::atomic<std::size_t> next_block{0};
  std::atomic<bool> failed{false};
  std::exception_ptr first_error;
  std::mutex error_mutex;

  const auto worker = [&]() {
    while (!failed.load(std::memory_order_acquire)) {
      const std::size_t b = next_block.fetch_add(1, std::memory_order_relaxed);
      if (b >= block_count) {
        return;
      }
      const std::size_t begin = b * block;
      const std::size_t end = std::min(count, begin + block);
      try {
        body(begin, end);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
        failed.store(true, std::memory_order_release);
        return;
      }
    }
  };

  if (threads <= 1) {
    worker();
  } else {
    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) {
      pool.emplace_back(worker);
    }
    for (auto& th : pool) {
      th.join();
    }
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

}  // namespace pmatch::matching
