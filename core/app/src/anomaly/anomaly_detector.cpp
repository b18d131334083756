#include "sentinel/anomaly/anomaly_detector.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <sstream>

namespace sentinel {

const char* toString(SignalType type) {
  switch (type) {
    case SignalType::Price:       return "price";
    case SignalType::Pnl:         return "pnl";
    case SignalType::Latency:     return "latency";
    case SignalType::ClockOffset: return "clock_offset";
  }
  return "unknown";
}

namespace {

domain::AnomalyType anomalyTypeFor(SignalType type) {
  switch (type) {
    case SignalType::Price:       return domain::AnomalyType::PriceSpike;
    case SignalType::Pnl:         return domain::AnomalyType::PnlSpike;
    case SignalType::Latency:     return domain::AnomalyType::LatencySpike;
    case SignalType::ClockOffset: return domain::AnomalyType::ClockDrift;
  }
  return domain::AnomalyType::PriceSpike;
}

}  // namespace

void AnomalyDetector::Window::add(double value) {
  values.push_back(value);
  while (values.size() > capacity) {
    values.pop_front();
  }
}

double AnomalyDetector::Window::mean() const {
  if (values.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (double v : values) sum += v;
  return sum / static_cast<double>(values.size());
}

// Sample standard deviation.
double AnomalyDetector::Window::stddev() const {
  if (values.size() < 2) {
    return 0.0;
  }
  const double m = mean();
  double acc = 0.0;
  for (double v : values) acc += (v - m) * (v - m);
  return std::sqrt(acc / static_cast<double>(values.size() - 1));
}

AnomalyDetector::AnomalyDetector(AnomalyConfig config)
    : config_(std::move(config)) {}

std::size_t AnomalyDetector::capacityFor(SignalType type) const {
  switch (type) {
    case SignalType::Price:   return config_.price_window;
    case SignalType::Pnl:     return config_.pnl_window;
    case SignalType::Latency: return config_.latency_window;
    case SignalType::ClockOffset: return 0;
  }
  return 0;
}

// -----------------------------------------------------------------------------
// observe: score one signal against its window, then add it
// -----------------------------------------------------------------------------
std::optional<domain::AnomalyEvent> AnomalyDetector::observe(
    const Signal& signal) {
  std::lock_guard lock(mutex_);

  if (!std::isfinite(signal.value)) {
    return std::nullopt;
  }

  domain::AnomalyEvent event;
  event.type = anomalyTypeFor(signal.type);
  event.key = signal.key;
  event.value = signal.value;
  event.timestamp_ms = signal.timestamp_ms;

  if (signal.type == SignalType::ClockOffset) {
    const double drift = std::abs(signal.value);
    if (drift <= config_.clock_drift_tolerance_ms) {
      return std::nullopt;
    }
    event.magnitude = drift;
    event.threshold = config_.clock_drift_tolerance_ms;
    event.detail = "clock offset " + std::to_string(signal.value) + "ms";
  } else {
    auto& window = windows_[{signal.type, signal.key}];
    window.capacity = capacityFor(signal.type);

    const double threshold = signal.type == SignalType::Price
                                 ? config_.price_z_threshold
                                 : config_.z_threshold;
    double z = 0.0;
    bool anomalous = false;
    if (window.values.size() >= config_.min_samples) {
      const double sd = window.stddev();
      if (sd > 1e-12) {
        z = (signal.value - window.mean()) / sd;
        anomalous = std::abs(z) > threshold;
      }
    }
    if (signal.type == SignalType::Latency &&
        signal.value > config_.latency_limit_ms) {
      anomalous = true;
    }

    if (!anomalous && signal.type == SignalType::Price &&
        isStale(window, signal.value)) {
      event.type = domain::AnomalyType::StaleFeed;
      event.magnitude = static_cast<double>(config_.stale_repeat_count + 1);
      event.threshold = static_cast<double>(config_.stale_repeat_count);
      std::ostringstream detail;
      detail << "price stuck at " << signal.value;
      event.detail = detail.str();
    } else {
      window.add(signal.value);
      if (!anomalous) {
        return std::nullopt;
      }
      event.magnitude = std::abs(z);
      event.threshold = threshold;
      std::ostringstream detail;
      detail << toString(signal.type) << " " << signal.value << " z=" << z;
      event.detail = detail.str();
    }
  }

  event.consecutive_count = extendStreak(signal.timestamp_ms);
  event.triggered_pause = event.consecutive_count >= config_.auto_pause_count;

  std::cerr << "[AnomalyDetector] " << domain::toString(event.type) << " on "
            << event.key << ": " << event.detail
            << " (streak=" << event.consecutive_count << ")\n";
  return event;
}

domain::AnomalyEvent AnomalyDetector::raise(domain::AnomalyType type,
                                            std::string key, double value,
                                            std::string detail,
                                            domain::TimestampMs timestamp_ms,
                                            bool fatal) {
  std::lock_guard lock(mutex_);
  domain::AnomalyEvent event;
  event.type = type;
  event.key = std::move(key);
  event.value = value;
  event.magnitude = value;
  event.detail = std::move(detail);
  event.fatal = fatal;
  event.timestamp_ms = timestamp_ms;
  event.consecutive_count = extendStreak(timestamp_ms);
  event.triggered_pause = event.consecutive_count >= config_.auto_pause_count;

  std::cerr << "[AnomalyDetector] " << domain::toString(type) << " raised on "
            << event.key << ": " << event.detail << "\n";
  return event;
}

int AnomalyDetector::streak(domain::TimestampMs now_ms) {
  std::lock_guard lock(mutex_);
  pruneStreak(now_ms);
  return static_cast<int>(streak_.size());
}

void AnomalyDetector::resetStreak() {
  std::lock_guard lock(mutex_);
  streak_.clear();
}

void AnomalyDetector::reset() {
  std::lock_guard lock(mutex_);
  streak_.clear();
  windows_.clear();
}

std::size_t AnomalyDetector::sampleCount(SignalType type,
                                         const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto it = windows_.find({type, key});
  return it == windows_.end() ? 0 : it->second.values.size();
}

// mutex_ held. Needs min_samples history so a cold start is not "stale".
bool AnomalyDetector::isStale(const Window& window, double value) const {
  const std::size_t n = config_.stale_repeat_count;
  if (n == 0 || window.values.size() < std::max(n, config_.min_samples)) {
    return false;
  }
  return std::all_of(window.values.end() - static_cast<std::ptrdiff_t>(n),
                     window.values.end(),
                     [value](double v) { return v == value; });
}

// mutex_ held.
int AnomalyDetector::extendStreak(domain::TimestampMs timestamp_ms) {
  pruneStreak(timestamp_ms);
  streak_.push_back(timestamp_ms);
  return static_cast<int>(streak_.size());
}

void AnomalyDetector::pruneStreak(domain::TimestampMs now_ms) {
  while (!streak_.empty() &&
         now_ms - streak_.front() > config_.auto_pause_window_ms) {
    streak_.pop_front();
  }
}

}  // namespace sentinel
