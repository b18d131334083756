#pragma once

#include "sentinel/concurrent/cancellation.hpp"
#include "sentinel/domain/anomaly_event.hpp"
#include "sentinel/domain/reason_code.hpp"
#include "sentinel/domain/risk_limits.hpp"
#include "sentinel/domain/risk_state.hpp"
#include "sentinel/domain/trade_intent.hpp"
#include "sentinel/risk/dual_control.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sentinel {

struct RiskDecision {
  bool allowed{true};
  domain::ReasonCode reason{domain::ReasonCode::None};
  std::string detail;

  static RiskDecision allow() { return RiskDecision{}; }
  static RiskDecision deny(domain::ReasonCode reason, std::string detail) {
    return RiskDecision{false, reason, std::move(detail)};
  }
};

// -----------------------------------------------------------------------------
// RiskUpdate alternatives
// -----------------------------------------------------------------------------
// PnlUpdate    realized delta (net of fees) plus a fresh mark-to-market
//              roll-up, all in base currency. Sent after every fill and by
//              the periodic mark refresh (with zero deltas).
// AnomalyEvent from the detector, reconciliation or cancel deadline.
// ManualTrip   operator-initiated, already dual-control verified.
// -----------------------------------------------------------------------------
struct PnlUpdate {
  double realized_pnl_delta{0.0};
  double fee_delta{0.0};
  double unrealized_pnl{0.0};
  double gross_exposure{0.0};
  std::map<std::string, double> symbol_exposure;
  bool fx_stale{false};
};

struct ManualTrip {
  std::string reason;
  std::vector<std::string> operators;
};

using RiskUpdate = std::variant<PnlUpdate, domain::AnomalyEvent, ManualTrip>;

struct ResetResult {
  bool ok{false};
  bool authorized{false};  // dual control passed
  std::string detail;
  std::vector<std::string> operators;
};

// -----------------------------------------------------------------------------
// RiskEngine — pre-trade limits and the global kill switch
// -----------------------------------------------------------------------------
//
// @brief  Answers "may this order go out?" and owns the kill switch that
//         stops everything.
//
// @details
// Pre-trade (check):
//   1. kill switch tripped          → KILL_SWITCH_ACTIVE
//   2. outside trading window       → OUTSIDE_TRADING_HOURS
//   3. notional > per-trade cap     → TRADE_NOTIONAL_LIMIT
//   4. notional > strategy cap      → STRATEGY_NOTIONAL_LIMIT
//   5. |symbol exposure after| over cap and growing → SYMBOL_NOTIONAL_LIMIT
//   6. gross exposure after over cap and growing    → GROSS_NOTIONAL_LIMIT
//   7. daily P&L at or below -max_daily_loss        → DAILY_LOSS_LIMIT
// Orders that shrink an over-limit exposure are allowed.
//
// Post-trade (evaluate):
//   PnlUpdate that takes daily P&L to -max_daily_loss → trip DRAWDOWN_BREACH
//   fatal or auto-pause AnomalyEvent                  → trip ANOMALY
//   RECONCILIATION_FAIL anomaly                       → trip
//                                                      RECONCILIATION_FAILURE
//   ManualTrip                                        → trip MANUAL
//
// Tripping is idempotent, cancels the CancellationSource handed to in-flight
// orders, and then calls every registered listener (outside the lock) so the
// engine can cancel open orders and audit the transition. Only reset() with
// dual-operator approval re-arms the switch; a fresh CancellationSource is
// issued on re-arm.
//
// Daily figures roll over at 00:00 UTC per the injected clock.
//
// Thread model:
//   check() and state() take a shared lock; evaluate(), trip() and reset()
//   take it exclusively. isTripped() is a lock-free atomic read for hot-path
//   callers (the order manager polls it between fills).
// -----------------------------------------------------------------------------
class RiskEngine {
 public:
  using SwitchListener = std::function<void(const domain::KillSwitchRecord&)>;

  RiskEngine(domain::RiskLimits limits, const ITimeProvider& clock,
             const DualControl& dual_control);

  RiskEngine(const RiskEngine&) = delete;
  RiskEngine& operator=(const RiskEngine&) = delete;
  RiskEngine(RiskEngine&&) = delete;
  RiskEngine& operator=(RiskEngine&&) = delete;

  // notional_base: |quantity * price| converted to base currency.
  RiskDecision check(const domain::TradeIntent& intent,
                     double notional_base) const;

  static RiskDecision checkAgainst(const domain::TradeIntent& intent,
                                   double notional_base,
                                   const domain::RiskState& state,
                                   const domain::RiskLimits& limits,
                                   domain::TimestampMs now_ms);

  // Returns true if this update tripped the switch.
  bool evaluate(const RiskUpdate& update);

  bool trip(domain::TripTrigger trigger, const std::string& reason,
            std::vector<std::string> operators = {});

  ResetResult reset(const DualControlRequest& request);

  bool isTripped() const { return tripped_.load(); }

  CancellationToken cancellationToken() const;

  domain::RiskState state() const;

  // Replaces the state wholesale (recovery). Re-cancels the token if the
  // restored switch is tripped.
  void restore(const domain::RiskState& state);

  void addListener(SwitchListener listener);

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  void rollDay(domain::TimestampMs now_ms);
  std::optional<domain::KillSwitchRecord> tripLocked(
      domain::TripTrigger trigger, const std::string& reason,
      std::vector<std::string> operators, domain::TimestampMs now_ms);
  void pushHistory(const domain::KillSwitchRecord& record);
  void notify(const domain::KillSwitchRecord& record);

  const domain::RiskLimits limits_;
  const ITimeProvider& clock_;
  const DualControl& dual_control_;

  mutable std::shared_mutex mutex_;
  domain::RiskState state_;
  CancellationSource cancel_source_;
  std::atomic<bool> tripped_{false};

  std::mutex listeners_mutex_;
  std::vector<SwitchListener> listeners_;
};

}  // namespace sentinel
