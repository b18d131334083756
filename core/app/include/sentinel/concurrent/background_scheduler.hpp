#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sentinel {

// -----------------------------------------------------------------------------
// BackgroundScheduler — periodic off-hot-path jobs on one thread
// -----------------------------------------------------------------------------
//
// @brief  Runs registered jobs at fixed intervals: anomaly signal draining,
//         mark-to-market risk refresh, reconciliation, snapshots.
//
// @details
// Jobs run sequentially on a single worker thread, so a slow job delays the
// others but never the intent pipeline. A job that throws std::exception is
// logged and keeps its schedule.
//
// Thread model:
//   addJob() must be called before start(). stop() wakes the worker
//   immediately and joins it.
// -----------------------------------------------------------------------------
class BackgroundScheduler {
 public:
  using Job = std::function<void()>;

  BackgroundScheduler() = default;
  ~BackgroundScheduler();

  BackgroundScheduler(const BackgroundScheduler&) = delete;
  BackgroundScheduler& operator=(const BackgroundScheduler&) = delete;
  BackgroundScheduler(BackgroundScheduler&&) = delete;
  BackgroundScheduler& operator=(BackgroundScheduler&&) = delete;

  void addJob(std::string name, std::chrono::milliseconds interval, Job job);

  void start();
  void stop();

  bool running() const { return running_.load(); }

 private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    std::string name;
    std::chrono::milliseconds interval;
    Job job;
    Clock::time_point next_run;
  };

  void run();

  std::vector<Entry> jobs_;
  std::mutex mutex_;
  std::condition_variable wake_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace sentinel
