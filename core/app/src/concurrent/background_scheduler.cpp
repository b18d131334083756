#include "sentinel/concurrent/background_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace sentinel {

BackgroundScheduler::~BackgroundScheduler() { stop(); }

// -----------------------------------------------------------------------------
// addJob(): first run is one interval after start()
// -----------------------------------------------------------------------------
void BackgroundScheduler::addJob(std::string name,
                                 std::chrono::milliseconds interval, Job job) {
  std::lock_guard lock(mutex_);
  jobs_.push_back(Entry{std::move(name), interval, std::move(job), {}});
}

void BackgroundScheduler::start() {
  if (thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    auto now = Clock::now();
    for (auto& entry : jobs_) {
      entry.next_run = now + entry.interval;
    }
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void BackgroundScheduler::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    running_.store(false);
  }
  wake_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): sleep until the earliest due job, run every due job, repeat
// -----------------------------------------------------------------------------
void BackgroundScheduler::run() {
  std::unique_lock lock(mutex_);
  while (running_.load()) {
    auto now = Clock::now();
    auto next_wake = now + std::chrono::seconds(1);

    for (auto& entry : jobs_) {
      if (entry.next_run <= now) {
        entry.next_run = now + entry.interval;
        // Run without the lock so stop() can signal while a job is busy.
        Job job = entry.job;
        lock.unlock();
        try {
          job();
        } catch (const std::exception& e) {
          std::cerr << "[BackgroundScheduler] job '" << entry.name
                    << "' failed: " << e.what() << "\n";
        }
        lock.lock();
        if (!running_.load()) {
          return;
        }
      }
      next_wake = std::min(next_wake, entry.next_run);
    }

    wake_.wait_until(lock, next_wake, [this] { return !running_.load(); });
  }
}

}  // namespace sentinel
