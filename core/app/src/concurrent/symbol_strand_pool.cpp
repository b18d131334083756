#include "sentinel/concurrent/symbol_strand_pool.hpp"

#include <chrono>
#include <iostream>

namespace sentinel {

namespace {

// How long an idle worker waits before re-checking the running flag.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: allocate strands (threads start in start())
// -----------------------------------------------------------------------------
SymbolStrandPool::SymbolStrandPool(std::size_t strand_count,
                                   std::size_t queue_capacity) {
  if (strand_count == 0) {
    strand_count = 1;
  }
  strands_.reserve(strand_count);
  for (std::size_t i = 0; i < strand_count; ++i) {
    strands_.push_back(std::make_unique<Strand>(queue_capacity));
  }
}

SymbolStrandPool::~SymbolStrandPool() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void SymbolStrandPool::start() {
  if (running_.exchange(true)) {
    return;
  }
  for (auto& strand : strands_) {
    Strand* raw = strand.get();
    strand->worker = std::thread([this, raw] { run(*raw); });
  }
  std::cout << "[SymbolStrandPool] started " << strands_.size()
            << " strand(s).\n";
}

// -----------------------------------------------------------------------------
// stop(): close queues, let workers drain, join
// -----------------------------------------------------------------------------
void SymbolStrandPool::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  for (auto& strand : strands_) {
    strand->queue.close();
  }
  for (auto& strand : strands_) {
    if (strand->worker.joinable()) {
      strand->worker.join();
    }
  }
  std::cout << "[SymbolStrandPool] stopped.\n";
}

// -----------------------------------------------------------------------------
// post(): route to the symbol's strand
// -----------------------------------------------------------------------------
bool SymbolStrandPool::post(const std::string& symbol, Task task) {
  if (!running_.load()) {
    return false;
  }
  return strands_[strandFor(symbol)]->queue.try_push(std::move(task));
}

std::size_t SymbolStrandPool::strandFor(const std::string& symbol) const {
  return std::hash<std::string>{}(symbol) % strands_.size();
}

// -----------------------------------------------------------------------------
// run(): worker loop. Exits once the queue is closed and empty.
// -----------------------------------------------------------------------------
void SymbolStrandPool::run(Strand& strand) {
  for (;;) {
    auto task = strand.queue.pop_for(kIdleWaitTimeout);
    if (task) {
      (*task)();
      continue;
    }
    if (strand.queue.closed() && strand.queue.empty()) {
      return;
    }
  }
}

}  // namespace sentinel
