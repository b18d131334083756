#pragma once

#include "sentinel/domain/types.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sentinel {
namespace domain {

enum class KillSwitchState {
  Armed,
  Tripped,
};

enum class TripTrigger {
  Manual,
  DrawdownBreach,
  Anomaly,
  ReconciliationFailure,
};

inline const char* toString(KillSwitchState state) {
  return state == KillSwitchState::Armed ? "ARMED" : "TRIPPED";
}

inline const char* toString(TripTrigger trigger) {
  switch (trigger) {
    case TripTrigger::Manual:                return "MANUAL";
    case TripTrigger::DrawdownBreach:        return "DRAWDOWN_BREACH";
    case TripTrigger::Anomaly:               return "ANOMALY";
    case TripTrigger::ReconciliationFailure: return "RECONCILIATION_FAILURE";
  }
  return "UNKNOWN";
}

inline std::optional<TripTrigger> tripTriggerFromString(const std::string& s) {
  if (s == "MANUAL") return TripTrigger::Manual;
  if (s == "DRAWDOWN_BREACH") return TripTrigger::DrawdownBreach;
  if (s == "ANOMALY") return TripTrigger::Anomaly;
  if (s == "RECONCILIATION_FAILURE") return TripTrigger::ReconciliationFailure;
  return std::nullopt;
}

// One kill-switch transition (trip or reset), kept for operators.
struct KillSwitchRecord {
  KillSwitchState state_after{KillSwitchState::Armed};
  std::optional<TripTrigger> trigger;
  std::string reason;
  std::vector<std::string> operators;
  TimestampMs timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// RiskState — everything RiskEngine knows between updates
// -----------------------------------------------------------------------------
//
// @brief  Kill switch, exposure and daily P&L. Snapshotted to disk so a
//         restart comes back with the switch in the state it was left.
//
// @details
// Exposure and P&L are in base currency. trading_day is the UTC day number
// (epoch days); daily_realized_pnl resets when it changes. history keeps the
// most recent kSwitchHistoryLimit transitions.
// -----------------------------------------------------------------------------
struct RiskState {
  static constexpr std::size_t kSwitchHistoryLimit = 100;

  KillSwitchState kill_switch{KillSwitchState::Armed};
  std::optional<TripTrigger> trip_trigger;
  std::string trip_reason;
  TimestampMs tripped_at_ms{0};
  std::uint64_t trip_count{0};

  double gross_exposure{0.0};
  std::map<std::string, double> symbol_exposure;
  double daily_realized_pnl{0.0};
  double unrealized_pnl{0.0};
  std::int64_t trading_day{0};
  int consecutive_anomalies{0};
  bool fx_stale{false};

  std::deque<KillSwitchRecord> history;

  bool tripped() const { return kill_switch == KillSwitchState::Tripped; }
  double dailyPnl() const { return daily_realized_pnl + unrealized_pnl; }
};

}  // namespace domain
}  // namespace sentinel
