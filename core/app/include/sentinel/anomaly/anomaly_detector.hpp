#pragma once

#include "sentinel/domain/anomaly_event.hpp"
#include "sentinel/domain/types.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace sentinel {

enum class SignalType {
  Price,
  Pnl,
  Latency,
  ClockOffset,
};

const char* toString(SignalType type);

// One observation. key is the symbol for prices, the venue for latency and
// clock offset, and "portfolio" (or a strategy id) for P&L.
struct Signal {
  SignalType type{SignalType::Price};
  std::string key;
  double value{0.0};
  domain::TimestampMs timestamp_ms{0};
};

struct AnomalyConfig {
  double z_threshold{3.0};
  double price_z_threshold{5.0};
  std::size_t price_window{100};
  std::size_t pnl_window{50};
  std::size_t latency_window{100};
  std::size_t min_samples{10};
  std::size_t stale_repeat_count{5};  // 0 disables the stale-feed check
  double clock_drift_tolerance_ms{1000.0};
  double latency_limit_ms{1000.0};
  int auto_pause_count{3};
  domain::TimestampMs auto_pause_window_ms{60000};
};

// -----------------------------------------------------------------------------
// AnomalyDetector — rolling z-score checks on operational signals
// -----------------------------------------------------------------------------
//
// @brief  Flags prices, P&L moves and venue latencies that sit far outside
//         their recent history, and clock offsets beyond tolerance.
//
// @details
// Each (type, key) pair keeps its own bounded window. A value is scored
// against the window as it stood before the value arrived; scoring needs
// min_samples history and a non-zero standard deviation. Every finite value
// joins its window, flagged or not, so a lasting level shift is absorbed
// after a couple of ticks. Latency above latency_limit_ms is anomalous
// regardless of history.
//
// Stale feed: a price equal to each of the last stale_repeat_count prices
// is a STALE_FEED anomaly and is not appended, so a stuck feed keeps firing.
//
// Every anomaly (observed or raised) joins a streak of timestamps within
// auto_pause_window_ms. When the streak reaches auto_pause_count the event
// carries triggered_pause=true and the risk engine trips the kill switch.
// Normal readings do not shorten the streak; only time, resetStreak() and
// reset() do. reset() also drops every window and runs on kill-switch re-arm.
//
// Thread model: all methods lock an internal mutex.
// -----------------------------------------------------------------------------
class AnomalyDetector {
 public:
  explicit AnomalyDetector(AnomalyConfig config = {});

  AnomalyDetector(const AnomalyDetector&) = delete;
  AnomalyDetector& operator=(const AnomalyDetector&) = delete;

  std::optional<domain::AnomalyEvent> observe(const Signal& signal);

  // For anomalies found elsewhere (reconciliation, cancel deadline).
  domain::AnomalyEvent raise(domain::AnomalyType type, std::string key,
                             double value, std::string detail,
                             domain::TimestampMs timestamp_ms, bool fatal);

  int streak(domain::TimestampMs now_ms);
  void resetStreak();
  void reset();

  std::size_t sampleCount(SignalType type, const std::string& key) const;

  const AnomalyConfig& config() const { return config_; }

 private:
  struct Window {
    std::deque<double> values;
    std::size_t capacity{0};

    void add(double value);
    double mean() const;
    double stddev() const;
  };

  std::size_t capacityFor(SignalType type) const;
  bool isStale(const Window& window, double value) const;
  int extendStreak(domain::TimestampMs timestamp_ms);
  void pruneStreak(domain::TimestampMs now_ms);

  const AnomalyConfig config_;

  mutable std::mutex mutex_;
  std::map<std::pair<SignalType, std::string>, Window> windows_;
  std::deque<domain::TimestampMs> streak_;
};

}  // namespace sentinel
