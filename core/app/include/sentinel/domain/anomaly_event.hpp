#pragma once

#include "sentinel/domain/types.hpp"

#include <optional>
#include <string>

namespace sentinel {
namespace domain {

enum class AnomalyType {
  PriceSpike,
  PnlSpike,
  LatencySpike,
  ClockDrift,
  StaleFeed,
  ReconciliationFailure,
  CancelTimeout,
};

inline const char* toString(AnomalyType type) {
  switch (type) {
    case AnomalyType::PriceSpike:            return "PRICE_SPIKE";
    case AnomalyType::PnlSpike:              return "PNL_SPIKE";
    case AnomalyType::LatencySpike:          return "LATENCY_SPIKE";
    case AnomalyType::ClockDrift:            return "CLOCK_DRIFT";
    case AnomalyType::StaleFeed:             return "STALE_FEED";
    case AnomalyType::ReconciliationFailure: return "RECONCILIATION_FAIL";
    case AnomalyType::CancelTimeout:         return "CANCEL_TIMEOUT";
  }
  return "UNKNOWN";
}

inline std::optional<AnomalyType> anomalyTypeFromString(const std::string& s) {
  if (s == "PRICE_SPIKE") return AnomalyType::PriceSpike;
  if (s == "PNL_SPIKE") return AnomalyType::PnlSpike;
  if (s == "LATENCY_SPIKE") return AnomalyType::LatencySpike;
  if (s == "CLOCK_DRIFT") return AnomalyType::ClockDrift;
  if (s == "STALE_FEED") return AnomalyType::StaleFeed;
  if (s == "RECONCILIATION_FAIL") return AnomalyType::ReconciliationFailure;
  if (s == "CANCEL_TIMEOUT") return AnomalyType::CancelTimeout;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// AnomalyEvent
// -----------------------------------------------------------------------------
//
// @brief  A signal that left its normal range.
//
// @details
// magnitude is the z-score for statistical checks, the absolute drift in
// milliseconds for clock checks, or the repeat count for a stale feed. consecutive_count is how many anomalies in a
// row (within the configured window) the detector has seen including this
// one; triggered_pause is true when that count reached the auto-pause level.
// fatal anomalies (cancel timeout, reconciliation failure) trip the kill
// switch on their own.
// -----------------------------------------------------------------------------
struct AnomalyEvent {
  AnomalyType type{AnomalyType::PriceSpike};
  std::string key;
  double value{0.0};
  double magnitude{0.0};
  double threshold{0.0};
  int consecutive_count{0};
  bool triggered_pause{false};
  bool fatal{false};
  std::string detail;
  TimestampMs timestamp_ms{0};
};

}  // namespace domain
}  // namespace sentinel
