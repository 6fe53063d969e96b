#include "pmatch/core/id_generator.h"

#include <chrono>

namespace pmatch::core {

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count();
  const auto seq = counter_.fetch_add(1, std::memory_order_relaxed);
  return std::string(prefix) + "-" + std::to_string(micros) + "-" + std::to_string(seq);
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  const auto seq = counter_.fetch_add(1, std::memory_order_relaxed);
  return std::string(prefix) + "-" + std::to_string(seq);
}

}  // namespace pmatch::core
