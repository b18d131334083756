#pragma once

#include "sentinel/concurrent/thread_safe_queue.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace sentinel {

// -----------------------------------------------------------------------------
// SymbolStrandPool — per-symbol serial execution on a fixed set of workers
// -----------------------------------------------------------------------------
//
// @brief  Runs tasks for the same symbol strictly in submission order, while
//         tasks for different symbols proceed in parallel.
//
// @details
// A symbol maps to strand hash(symbol) % strand_count. Each strand owns one
// worker thread and one bounded queue; a full queue makes post() return false
// instead of blocking the producer.
//
// On stop() the queues are closed and every task already queued still runs
// before the workers exit, so promises captured by queued tasks are always
// fulfilled.
//
// Thread model:
//   post() is safe from any thread. Tasks run on strand workers and must not
//   block on other strands' work.
//
// Ownership:
//   Owns its worker threads and queues. Owned by ExecutionRiskEngine.
// -----------------------------------------------------------------------------
class SymbolStrandPool {
 public:
  using Task = std::function<void()>;

  SymbolStrandPool(std::size_t strand_count, std::size_t queue_capacity);
  ~SymbolStrandPool();

  SymbolStrandPool(const SymbolStrandPool&) = delete;
  SymbolStrandPool& operator=(const SymbolStrandPool&) = delete;
  SymbolStrandPool(SymbolStrandPool&&) = delete;
  SymbolStrandPool& operator=(SymbolStrandPool&&) = delete;

  // Idempotent. Spawns one thread per strand.
  void start();

  // Idempotent. Drains queued tasks, then joins.
  void stop();

  // -------------------------------------------------------------------------
  // post(symbol, task)
  // -------------------------------------------------------------------------
  // @return false if the pool is not running or the symbol's strand queue is
  //         full. The task is not run in that case.
  // -------------------------------------------------------------------------
  bool post(const std::string& symbol, Task task);

  std::size_t strandFor(const std::string& symbol) const;
  std::size_t strandCount() const { return strands_.size(); }
  bool running() const { return running_.load(); }

 private:
  struct Strand {
    explicit Strand(std::size_t capacity) : queue(capacity) {}
    ThreadSafeQueue<Task> queue;
    std::thread worker;
  };

  void run(Strand& strand);

  std::vector<std::unique_ptr<Strand>> strands_;
  std::atomic<bool> running_{false};
};

}  // namespace sentinel
