// =============================================================================
// anomaly_detector_test.cpp
// =============================================================================
// Unit tests for sentinel::AnomalyDetector.
//
// Validates:
//   - No scoring until min_samples of history exist
//   - Price spikes against the wider price threshold; normal moves pass
//   - Flagged values join the window; a lasting level shift is absorbed
//   - A price stuck for stale_repeat_count ticks is a STALE_FEED
//   - Latency above the hard limit is anomalous with no history
//   - Clock offset beyond tolerance in either direction
//   - Streak counting inside the auto-pause window, expiry and reset
//   - reset() drops the windows as well as the streak
//   - raise() joins the same streak and carries the fatal flag
// =============================================================================

#include "sentinel/anomaly/anomaly_detector.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

using sentinel::Signal;
using sentinel::SignalType;
using sentinel::domain::AnomalyType;

constexpr std::int64_t kT0 = 1'700'000'000'000;

}  // namespace

class AnomalyDetectorTest : public ::testing::Test {
 protected:
  sentinel::AnomalyDetector detector;

  // Ten prices alternating 100 / 101: mean 100.5, sd ≈ 0.53.
  void seedPrices(const std::string& symbol) {
    for (int i = 0; i < 10; ++i) {
      auto event = detector.observe(
          Signal{SignalType::Price, symbol, i % 2 == 0 ? 100.0 : 101.0, kT0});
      ASSERT_FALSE(event.has_value());
    }
  }
};

// -----------------------------------------------------------------------------
// 1. Below min_samples nothing is scored, however wild the value.
// -----------------------------------------------------------------------------
TEST_F(AnomalyDetectorTest, NeedsHistoryBeforeScoring) {
  for (int i = 0; i < 9; ++i) {
    detector.observe(Signal{SignalType::Price, "BTC-USD", 100.0 + i, kT0});
  }
  EXPECT_FALSE(
      detector.observe(Signal{SignalType::Price, "BTC-USD", 1e6, kT0})
          .has_value());
  EXPECT_EQ(detector.sampleCount(SignalType::Price, "BTC-USD"), 10u);
}

// -----------------------------------------------------------------------------
// 2. A price far outside the band is a PRICE_SPIKE; a small move is not.
// -----------------------------------------------------------------------------
TEST_F(AnomalyDetectorTest, FlagsPriceSpike) {
  seedPrices("BTC-USD");

  EXPECT_FALSE(
      detector.observe(Signal{SignalType::Price, "BTC-USD", 101.5, kT0})
          .has_value());

  auto event = detector.observe(Signal{SignalType::Price, "BTC-USD", 110.0, kT0});
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->type, AnomalyType::PriceSpike);
  EXPECT_EQ(event->key, "BTC-USD");
  EXPECT_GT(event->magnitude, detector.config().price_z_threshold);
  EXPECT_DOUBLE_EQ(event->threshold, detector.config().price_z_threshold);
  EXPECT_EQ(event->consecutive_count, 1);
  EXPECT_FALSE(event->triggered_pause);
  EXPECT_FALSE(event->fatal);
}

// -----------------------------------------------------------------------------
// 3. A flagged value still joins the window, so the band widens and a repeat
//    of the same level is no longer an outlier.
// -----------------------------------------------------------------------------
TEST_F(AnomalyDetectorTest, FlaggedValuesJoinTheWindow) {
  seedPrices("BTC-USD");
  const auto before = detector.sampleCount(SignalType::Price, "BTC-USD");

  auto first = detector.observe(Signal{SignalType::Price, "BTC-USD", 110.0, kT0});
  auto second =
      detector.observe(Signal{SignalType::Price, "BTC-USD", 110.0, kT0 + 1});

  ASSERT_TRUE(first.has_value());
  EXPECT_FALSE(second.has_value());
  EXPECT_EQ(detector.sampleCount(SignalType::Price, "BTC-USD"), before + 2);
  EXPECT_EQ(detector.sampleCount(SignalType::Price, "ETH-USD"), 0u);
}

// -----------------------------------------------------------------------------
// 4. A lasting level shift is flagged for a tick or two, then absorbed; it
//    never builds a streak long enough to pause trading.
// Scenario: 50 prices alternating 100 / 101, then 200 alternating
//           109.5 / 110.5, all inside one auto-pause window.
// -----------------------------------------------------------------------------
TEST_F(AnomalyDetectorTest, RegimeShiftIsAbsorbed) {
  for (int i = 0; i < 50; ++i) {
    ASSERT_FALSE(detector
                     .observe(Signal{SignalType::Price, "BTC-USD",
                                     i % 2 == 0 ? 100.0 : 101.0, kT0 + i})
                     .has_value());
  }

  int flagged = 0;
  bool paused = false;
  for (int i = 0; i < 200; ++i) {
    auto event = detector.observe(Signal{SignalType::Price, "BTC-USD",
                                         i % 2 == 0 ? 109.5 : 110.5,
                                         kT0 + 50 + i});
    if (event) {
      ++flagged;
      paused = paused || event->triggered_pause;
    }
  }

  EXPECT_GE(flagged, 1);
  EXPECT_LT(flagged, detector.config().auto_pause_count);
  EXPECT_FALSE(paused);
}

// -----------------------------------------------------------------------------
// 5. Latency over the hard limit needs no history.
// -----------------------------------------------------------------------------
TEST_F(AnomalyDetectorTest, LatencyOverLimitAlwaysFlags) {
  auto event = detector.observe(Signal{SignalType::Latency, "paper",
                                       detector.config().latency_limit_ms + 1,
                                       kT0});
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->type, AnomalyType::LatencySpike);

  EXPECT_FALSE(detector.observe(Signal{SignalType::Latency, "paper", 20.0, kT0})
                   .has_value());
}

// -----------------------------------------------------------------------------
// 6. Clock offset: |offset| is compared with the tolerance.
// -----------------------------------------------------------------------------
TEST_F(AnomalyDetectorTest, ClockDriftBothDirections) {
  EXPECT_FALSE(
      detector.observe(Signal{SignalType::ClockOffset, "paper", 999.0, kT0})
          .has_value());

  auto behind =
      detector.observe(Signal{SignalType::ClockOffset, "paper", -1500.0, kT0});
  ASSERT_TRUE(behind.has_value());
  EXPECT_EQ(behind->type, AnomalyType::ClockDrift);
  EXPECT_DOUBLE_EQ(behind->magnitude, 1500.0);
  EXPECT_DOUBLE_EQ(behind->threshold, 1000.0);
}

// -----------------------------------------------------------------------------
// 7. Three anomalies inside the window trigger the pause; once they age out
//    the streak starts over.
// Scenario: anomalies at t0, t0+10s, t0+20s → third one pauses.
//           Next one at t0+90s: t0 and t0+10s and t0+20s have expired.
// -----------------------------------------------------------------------------
TEST_F(AnomalyDetectorTest, StreakTriggersPauseWithinWindow) {
  auto clockSignal = [](std::int64_t ts) {
    return Signal{SignalType::ClockOffset, "paper", 5000.0, ts};
  };

  EXPECT_EQ(detector.observe(clockSignal(kT0))->consecutive_count, 1);
  EXPECT_EQ(detector.observe(clockSignal(kT0 + 10'000))->consecutive_count, 2);
  auto third = detector.observe(clockSignal(kT0 + 20'000));
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(third->consecutive_count, 3);
  EXPECT_TRUE(third->triggered_pause);

  EXPECT_EQ(detector.streak(kT0 + 20'000), 3);
  EXPECT_EQ(detector.streak(kT0 + 65'000), 2);

  auto later = detector.observe(clockSignal(kT0 + 90'000));
  ASSERT_TRUE(later.has_value());
  EXPECT_EQ(later->consecutive_count, 1);
  EXPECT_FALSE(later->triggered_pause);
}

// -----------------------------------------------------------------------------
// 8. Normal readings leave the streak alone; resetStreak() clears it.
// -----------------------------------------------------------------------------
TEST_F(AnomalyDetectorTest, ResetClearsStreak) {
  detector.observe(Signal{SignalType::ClockOffset, "paper", 5000.0, kT0});
  detector.observe(Signal{SignalType::ClockOffset, "paper", 0.0, kT0 + 1});
  EXPECT_EQ(detector.streak(kT0 + 2), 1);

  detector.resetStreak();
  EXPECT_EQ(detector.streak(kT0 + 2), 0);
}

// -----------------------------------------------------------------------------
// 9. Externally raised anomalies share the streak and keep `fatal`.
// -----------------------------------------------------------------------------
TEST_F(AnomalyDetectorTest, RaiseJoinsStreak) {
  detector.observe(Signal{SignalType::ClockOffset, "paper", 5000.0, kT0});

  auto event = detector.raise(AnomalyType::ReconciliationFailure, "paper", 2.0,
                              "2 discrepancies", kT0 + 5, true);

  EXPECT_EQ(event.type, AnomalyType::ReconciliationFailure);
  EXPECT_TRUE(event.fatal);
  EXPECT_EQ(event.consecutive_count, 2);
  EXPECT_EQ(event.detail, "2 discrepancies");
  EXPECT_STREQ(sentinel::toString(SignalType::Latency), "latency");
  EXPECT_STREQ(sentinel::domain::toString(event.type), "RECONCILIATION_FAIL");
}

// -----------------------------------------------------------------------------
// 10. A feed stuck on one price fires STALE_FEED on every repeat once the
//     last stale_repeat_count prices are identical; a new price clears it.
// -----------------------------------------------------------------------------
TEST_F(AnomalyDetectorTest, StuckPriceIsStaleFeed) {
  seedPrices("BTC-USD");
  for (int i = 0; i < 5; ++i) {
    ASSERT_FALSE(detector.observe(Signal{SignalType::Price, "BTC-USD", 100.5,
                                         kT0 + i})
                     .has_value());
  }
  const auto count = detector.sampleCount(SignalType::Price, "BTC-USD");

  auto stale =
      detector.observe(Signal{SignalType::Price, "BTC-USD", 100.5, kT0 + 10});
  ASSERT_TRUE(stale.has_value());
  EXPECT_EQ(stale->type, AnomalyType::StaleFeed);
  EXPECT_STREQ(sentinel::domain::toString(stale->type), "STALE_FEED");
  EXPECT_EQ(detector.sampleCount(SignalType::Price, "BTC-USD"), count);

  EXPECT_TRUE(detector.observe(Signal{SignalType::Price, "BTC-USD", 100.5,
                                      kT0 + 11})
                  .has_value());
  EXPECT_FALSE(detector.observe(Signal{SignalType::Price, "BTC-USD", 100.7,
                                       kT0 + 12})
                   .has_value());
}

// -----------------------------------------------------------------------------
// 11. reset() forgets the history, so scoring starts over from min_samples.
// Why: runs on kill-switch re-arm; a stale band would re-trip immediately.
// -----------------------------------------------------------------------------
TEST_F(AnomalyDetectorTest, ResetDropsWindows) {
  seedPrices("BTC-USD");
  detector.observe(Signal{SignalType::ClockOffset, "paper", 5000.0, kT0});

  detector.reset();

  EXPECT_EQ(detector.sampleCount(SignalType::Price, "BTC-USD"), 0u);
  EXPECT_EQ(detector.streak(kT0 + 1), 0);
  EXPECT_FALSE(detector.observe(Signal{SignalType::Price, "BTC-USD", 500.0, kT0})
                   .has_value());
}
