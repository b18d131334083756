#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace sentinel {

// -----------------------------------------------------------------------------
// SequenceGenerator — thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out 1, 2, 3, ... across any number of threads.
//
// @details
// Used for order ids and fill ids. After a restart, advancePast() moves the
// counter beyond the highest id recovered from the audit log so new ids never
// collide with recorded ones.
//
// Thread-safety: next_id() and advancePast() are lock-free and safe to call
// concurrently.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  SequenceGenerator() = default;

  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // "<prefix>-<n>", e.g. "F-17".
  std::string next_tagged(const std::string& prefix) {
    return prefix + "-" + std::to_string(next_id());
  }

  // Ensures the next id handed out is strictly greater than `seen`.
  void advancePast(std::uint64_t seen) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= seen &&
           !next_id_.compare_exchange_weak(current, seen + 1,
                                           std::memory_order_relaxed)) {
    }
  }

  std::uint64_t peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace sentinel
