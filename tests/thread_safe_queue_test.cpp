// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for sentinel::ThreadSafeQueue<T> and sentinel::SequenceGenerator.
//
// Validates:
//   - FIFO semantics and non-blocking try_pop()
//   - Bounded capacity: try_push() reports backpressure, push() ignores it
//   - pop_for() waits for a producer and times out on an empty queue
//   - close(): pushes fail, consumers drain remaining items then stop
//   - Thread-safety under concurrent multi-producer / multi-consumer load
//   - SequenceGenerator: monotonic ids, advancePast() after recovery
//
// Threading model:
//   Threads are joined before assertions so a failing test leaves none behind.
// =============================================================================

#include "sentinel/concurrent/sequence_generator.hpp"
#include "sentinel/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  sentinel::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. A newly constructed queue is empty and unbounded.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
  EXPECT_EQ(queue.capacity(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Items come back in FIFO order.
// Why: per-symbol ordering of intents and fills rests on this.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  constexpr int kCount = 100;
  for (int i = 0; i < kCount; ++i) {
    ASSERT_TRUE(queue.push(i));
  }
  for (int i = 0; i < kCount; ++i) {
    auto value = queue.try_pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. try_pop() on an empty queue returns std::nullopt immediately.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopEmptyReturnsNullopt) {
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 4. A bounded queue rejects try_push() at capacity; push() still succeeds.
// -----------------------------------------------------------------------------
TEST(BoundedQueueTest, TryPushReportsBackpressure) {
  sentinel::ThreadSafeQueue<int> bounded(2);
  EXPECT_TRUE(bounded.try_push(1));
  EXPECT_TRUE(bounded.try_push(2));
  EXPECT_FALSE(bounded.try_push(3));
  EXPECT_EQ(bounded.size(), 2u);

  EXPECT_TRUE(bounded.push(3));
  EXPECT_EQ(bounded.size(), 3u);
}

// -----------------------------------------------------------------------------
// 5. pop_for() wakes up when another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForWaitsForPush) {
  std::atomic<int> received{-1};

  std::thread consumer([this, &received] {
    auto value = queue.pop_for(std::chrono::seconds(2));
    received.store(value ? *value : -2);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();
  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 6. pop_for() on an empty queue returns std::nullopt after the timeout.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForTimesOut) {
  auto started = std::chrono::steady_clock::now();
  auto value = queue.pop_for(std::chrono::milliseconds(30));
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_FALSE(value.has_value());
  EXPECT_GE(elapsed, std::chrono::milliseconds(25));
}

// -----------------------------------------------------------------------------
// 7. close(): new pushes fail, queued items still drain, then pop_for
//    returns immediately.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseDrainsThenStops) {
  queue.push(1);
  queue.push(2);
  queue.close();

  EXPECT_TRUE(queue.closed());
  EXPECT_FALSE(queue.push(3));
  EXPECT_FALSE(queue.try_push(3));

  EXPECT_EQ(queue.pop_for(std::chrono::seconds(1)).value_or(-1), 1);
  EXPECT_EQ(queue.pop_for(std::chrono::seconds(1)).value_or(-1), 2);

  auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(queue.pop_for(std::chrono::seconds(5)).has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - started,
            std::chrono::seconds(1));
}

// -----------------------------------------------------------------------------
// 8. Concurrent multi-producer, multi-consumer stress test: every pushed
//    value is popped exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> per_consumer(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &per_consumer] {
      while (consumed.load() < kTotalItems) {
        auto item = queue.pop_for(std::chrono::milliseconds(5));
        if (item) {
          per_consumer[c].push_back(*item);
          consumed.fetch_add(1);
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}

// -----------------------------------------------------------------------------
// 9. SequenceGenerator hands out 1, 2, 3... and tagged ids.
// -----------------------------------------------------------------------------
TEST(SequenceGeneratorTest, MonotonicAndTagged) {
  sentinel::SequenceGenerator ids;
  EXPECT_EQ(ids.next_id(), 1u);
  EXPECT_EQ(ids.next_id(), 2u);
  EXPECT_EQ(ids.next_tagged("F"), "F-3");
  EXPECT_EQ(ids.peek(), 4u);
}

// -----------------------------------------------------------------------------
// 10. advancePast() never moves the sequence backwards.
// Why: recovered ids from the audit chain must not be reissued.
// -----------------------------------------------------------------------------
TEST(SequenceGeneratorTest, AdvancePastSkipsRecoveredIds) {
  sentinel::SequenceGenerator ids;
  ids.advancePast(41);
  EXPECT_EQ(ids.next_id(), 42u);

  ids.advancePast(10);
  EXPECT_EQ(ids.next_id(), 43u);
}
