// =============================================================================
// concurrency_test.cpp
// =============================================================================
// Tests for the engine's threading primitives.
//
// Validates:
//   - SymbolStrandPool: per-symbol FIFO order, cross-symbol parallelism,
//     backpressure on a full strand, drain on stop()
//   - BackgroundScheduler: periodic runs, a throwing job keeps its schedule
//   - retryWithBackoff: success after failures, attempt cap, cancellation
//   - CancellationSource / CancellationToken visibility
//
// Design:
//   Cross-thread results are delivered with std::promise/std::future and
//   waited on with explicit timeouts so a regression fails instead of hanging.
// =============================================================================

#include "sentinel/concurrent/background_scheduler.hpp"
#include "sentinel/concurrent/cancellation.hpp"
#include "sentinel/concurrent/retry_policy.hpp"
#include "sentinel/concurrent/symbol_strand_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// -----------------------------------------------------------------------------
// 1. Tasks for one symbol run in the order they were posted.
// -----------------------------------------------------------------------------
TEST(SymbolStrandPoolTest, PreservesOrderPerSymbol) {
  sentinel::SymbolStrandPool pool(4, 1024);
  pool.start();

  constexpr int kTasks = 200;
  std::mutex mutex;
  std::vector<int> btc;
  std::vector<int> eth;
  std::promise<void> done;
  std::atomic<int> remaining{2 * kTasks};

  for (int i = 0; i < kTasks; ++i) {
    ASSERT_TRUE(pool.post("BTC-USD", [&, i] {
      {
        std::lock_guard lock(mutex);
        btc.push_back(i);
      }
      if (--remaining == 0) done.set_value();
    }));
    ASSERT_TRUE(pool.post("ETH-USD", [&, i] {
      {
        std::lock_guard lock(mutex);
        eth.push_back(i);
      }
      if (--remaining == 0) done.set_value();
    }));
  }

  ASSERT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
  pool.stop();

  ASSERT_EQ(btc.size(), static_cast<std::size_t>(kTasks));
  for (int i = 0; i < kTasks; ++i) {
    EXPECT_EQ(btc[i], i);
    EXPECT_EQ(eth[i], i);
  }
}

// -----------------------------------------------------------------------------
// 2. A blocked strand does not hold up a different strand.
// Scenario: two strands; the first task on strand A waits for a task on
//           strand B to run. If strands were serialized this would deadlock.
// -----------------------------------------------------------------------------
TEST(SymbolStrandPoolTest, DifferentStrandsRunInParallel) {
  sentinel::SymbolStrandPool pool(2, 16);
  pool.start();

  // Find two symbols on different strands.
  std::string a = "S0";
  std::string b;
  for (int i = 1; i < 100 && b.empty(); ++i) {
    std::string candidate = "S" + std::to_string(i);
    if (pool.strandFor(candidate) != pool.strandFor(a)) {
      b = candidate;
    }
  }
  ASSERT_FALSE(b.empty());

  std::promise<void> b_ran;
  auto b_future = b_ran.get_future().share();
  std::promise<bool> a_saw_b;

  ASSERT_TRUE(pool.post(a, [b_future, &a_saw_b] {
    a_saw_b.set_value(b_future.wait_for(2s) == std::future_status::ready);
  }));
  ASSERT_TRUE(pool.post(b, [&b_ran] { b_ran.set_value(); }));

  auto result = a_saw_b.get_future();
  ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
  EXPECT_TRUE(result.get());
  pool.stop();
}

// -----------------------------------------------------------------------------
// 3. A full strand queue rejects instead of blocking; stop() drains what was
//    accepted; post() after stop() is refused.
// -----------------------------------------------------------------------------
TEST(SymbolStrandPoolTest, BackpressureAndDrainOnStop) {
  sentinel::SymbolStrandPool pool(1, 2);
  pool.start();

  std::promise<void> release;
  auto gate = release.get_future().share();
  std::promise<void> started;
  std::atomic<int> ran{0};

  ASSERT_TRUE(pool.post("X", [gate, &started, &ran] {
    started.set_value();
    gate.wait();
    ++ran;
  }));
  ASSERT_EQ(started.get_future().wait_for(2s), std::future_status::ready);

  EXPECT_TRUE(pool.post("X", [&ran] { ++ran; }));
  EXPECT_TRUE(pool.post("X", [&ran] { ++ran; }));
  EXPECT_FALSE(pool.post("X", [&ran] { ++ran; }));

  release.set_value();
  pool.stop();

  EXPECT_EQ(ran.load(), 3);
  EXPECT_FALSE(pool.post("X", [] {}));
}

// -----------------------------------------------------------------------------
// 4. Jobs repeat on their interval; one that throws is logged and retried.
// -----------------------------------------------------------------------------
TEST(BackgroundSchedulerTest, RunsJobsPeriodically) {
  sentinel::BackgroundScheduler scheduler;
  std::atomic<int> ticks{0};
  std::atomic<int> failures{0};
  std::promise<void> enough;
  std::atomic<bool> signalled{false};

  scheduler.addJob("tick", 10ms, [&] {
    if (++ticks >= 3 && failures.load() >= 3 && !signalled.exchange(true)) {
      enough.set_value();
    }
  });
  scheduler.addJob("broken", 10ms, [&] {
    ++failures;
    throw std::runtime_error("fetch failed");
  });

  scheduler.start();
  EXPECT_TRUE(scheduler.running());
  EXPECT_EQ(enough.get_future().wait_for(5s), std::future_status::ready);
  scheduler.stop();
  EXPECT_FALSE(scheduler.running());

  const int after_stop = ticks.load();
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(ticks.load(), after_stop);
}

// -----------------------------------------------------------------------------
// 5. retryWithBackoff returns the first success and respects the cap.
// -----------------------------------------------------------------------------
TEST(RetryPolicyTest, RetriesUntilSuccessOrCap) {
  sentinel::RetryPolicy policy;
  policy.max_attempts = 3;
  policy.initial_delay = 1ms;
  policy.max_delay = 5ms;

  int calls = 0;
  auto value = sentinel::retryWithBackoff(
      policy, sentinel::CancellationToken{}, [&calls]() -> std::optional<int> {
        if (++calls < 3) return std::nullopt;
        return 7;
      });
  EXPECT_EQ(value.value_or(-1), 7);
  EXPECT_EQ(calls, 3);

  calls = 0;
  auto never = sentinel::retryWithBackoff(
      policy, sentinel::CancellationToken{}, [&calls]() -> std::optional<int> {
        ++calls;
        return std::nullopt;
      });
  EXPECT_FALSE(never.has_value());
  EXPECT_EQ(calls, 3);

  EXPECT_EQ(policy.delayFor(0), 1ms);
  EXPECT_EQ(policy.delayFor(1), 2ms);
  EXPECT_EQ(policy.delayFor(5), 5ms);
}

// -----------------------------------------------------------------------------
// 6. A cancelled token stops the backoff wait early.
// -----------------------------------------------------------------------------
TEST(RetryPolicyTest, CancellationStopsRetries) {
  sentinel::RetryPolicy policy;
  policy.max_attempts = 5;
  policy.initial_delay = 2000ms;
  policy.max_delay = 2000ms;

  sentinel::CancellationSource source;
  int calls = 0;
  std::thread canceller([&source] {
    std::this_thread::sleep_for(30ms);
    source.cancel();
  });

  auto started = std::chrono::steady_clock::now();
  auto result = sentinel::retryWithBackoff(
      policy, source.token(), [&calls]() -> std::optional<int> {
        ++calls;
        return std::nullopt;
      });
  auto elapsed = std::chrono::steady_clock::now() - started;
  canceller.join();

  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(calls, 1);
  EXPECT_LT(elapsed, 1000ms);
}

// -----------------------------------------------------------------------------
// 7. Every token sees the source's cancel; a default token never cancels.
// -----------------------------------------------------------------------------
TEST(CancellationTest, TokensShareSourceState) {
  sentinel::CancellationSource source;
  auto before = source.token();
  EXPECT_FALSE(before.cancelled());

  source.cancel();
  source.cancel();
  EXPECT_TRUE(before.cancelled());
  EXPECT_TRUE(source.token().cancelled());
  EXPECT_TRUE(source.cancelled());
  EXPECT_FALSE(sentinel::CancellationToken{}.cancelled());
}
