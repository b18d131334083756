#include "sentinel/risk/risk_engine.hpp"
#include "sentinel/time/time_utils.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

namespace sentinel {

namespace {

std::string money(double value) {
  std::ostringstream out;
  out.setf(std::ios::fixed);
  out.precision(2);
  out << value;
  return out.str();
}

}  // namespace

RiskEngine::RiskEngine(domain::RiskLimits limits, const ITimeProvider& clock,
                       const DualControl& dual_control)
    : limits_(std::move(limits)), clock_(clock), dual_control_(dual_control) {
  state_.trading_day = utc_day(clock_.now_ms());
}

// -----------------------------------------------------------------------------
// checkAgainst: the pre-trade rule table (pure)
// -----------------------------------------------------------------------------
RiskDecision RiskEngine::checkAgainst(const domain::TradeIntent& intent,
                                      double notional_base,
                                      const domain::RiskState& state,
                                      const domain::RiskLimits& limits,
                                      domain::TimestampMs now_ms) {
  using domain::ReasonCode;

  if (state.tripped()) {
    return RiskDecision::deny(ReasonCode::KillSwitchActive,
                              "kill switch tripped: " + state.trip_reason);
  }
  if (!limits.withinTradingWindow(now_ms)) {
    return RiskDecision::deny(ReasonCode::OutsideTradingHours,
                              "outside configured trading window");
  }

  const double notional = std::abs(notional_base);
  if (notional > limits.max_trade_notional) {
    return RiskDecision::deny(
        ReasonCode::TradeNotionalLimit,
        "trade notional " + money(notional) + " exceeds " +
            money(limits.max_trade_notional));
  }

  auto strategy_cap = limits.strategy_trade_notional.find(intent.strategy_id);
  if (strategy_cap != limits.strategy_trade_notional.end() &&
      notional > strategy_cap->second) {
    return RiskDecision::deny(
        ReasonCode::StrategyNotionalLimit,
        "strategy " + intent.strategy_id + " cap " +
            money(strategy_cap->second) + " exceeded");
  }

  double current = 0.0;
  if (auto it = state.symbol_exposure.find(intent.symbol);
      it != state.symbol_exposure.end()) {
    current = it->second;
  }
  const double after = current + domain::sideSign(intent.side) * notional;
  if (std::abs(after) > limits.max_symbol_notional &&
      std::abs(after) > std::abs(current)) {
    return RiskDecision::deny(
        ReasonCode::SymbolNotionalLimit,
        intent.symbol + " exposure would reach " + money(std::abs(after)) +
            ", limit " + money(limits.max_symbol_notional));
  }

  const double gross_after =
      state.gross_exposure - std::abs(current) + std::abs(after);
  if (gross_after > limits.max_gross_notional &&
      gross_after > state.gross_exposure) {
    return RiskDecision::deny(
        ReasonCode::GrossNotionalLimit,
        "gross exposure would reach " + money(gross_after) + ", limit " +
            money(limits.max_gross_notional));
  }

  const double daily = state.trading_day == utc_day(now_ms)
                           ? state.dailyPnl()
                           : state.unrealized_pnl;
  if (daily <= -limits.max_daily_loss) {
    return RiskDecision::deny(
        ReasonCode::DailyLossLimit,
        "daily P&L " + money(daily) + " at or below -" +
            money(limits.max_daily_loss));
  }

  return RiskDecision::allow();
}

RiskDecision RiskEngine::check(const domain::TradeIntent& intent,
                               double notional_base) const {
  const auto now = clock_.now_ms();
  std::shared_lock lock(mutex_);
  return checkAgainst(intent, notional_base, state_, limits_, now);
}

// -----------------------------------------------------------------------------
// evaluate: fold one post-trade update, trip if it breaches
// -----------------------------------------------------------------------------
bool RiskEngine::evaluate(const RiskUpdate& update) {
  const auto now = clock_.now_ms();
  std::optional<domain::KillSwitchRecord> tripped;
  {
    std::unique_lock lock(mutex_);
    rollDay(now);

    if (const auto* pnl = std::get_if<PnlUpdate>(&update)) {
      state_.daily_realized_pnl += pnl->realized_pnl_delta - pnl->fee_delta;
      state_.unrealized_pnl = pnl->unrealized_pnl;
      state_.gross_exposure = pnl->gross_exposure;
      state_.symbol_exposure = pnl->symbol_exposure;
      state_.fx_stale = pnl->fx_stale;
      if (state_.dailyPnl() <= -limits_.max_daily_loss) {
        tripped = tripLocked(
            domain::TripTrigger::DrawdownBreach,
            "daily P&L " + money(state_.dailyPnl()) + " breached -" +
                money(limits_.max_daily_loss),
            {}, now);
      }
    } else if (const auto* anomaly =
                   std::get_if<domain::AnomalyEvent>(&update)) {
      state_.consecutive_anomalies = anomaly->consecutive_count;
      std::string reason = std::string(domain::toString(anomaly->type)) +
                           " on " + anomaly->key;
      if (!anomaly->detail.empty()) {
        reason += ": " + anomaly->detail;
      }
      if (anomaly->type == domain::AnomalyType::ReconciliationFailure) {
        tripped = tripLocked(domain::TripTrigger::ReconciliationFailure,
                             reason, {}, now);
      } else if (anomaly->fatal || anomaly->triggered_pause) {
        tripped = tripLocked(domain::TripTrigger::Anomaly, reason, {}, now);
      }
    } else if (const auto* manual = std::get_if<ManualTrip>(&update)) {
      tripped = tripLocked(domain::TripTrigger::Manual, manual->reason,
                           manual->operators, now);
    }
  }

  if (tripped) {
    notify(*tripped);
    return true;
  }
  return false;
}

bool RiskEngine::trip(domain::TripTrigger trigger, const std::string& reason,
                      std::vector<std::string> operators) {
  const auto now = clock_.now_ms();
  std::optional<domain::KillSwitchRecord> tripped;
  {
    std::unique_lock lock(mutex_);
    tripped = tripLocked(trigger, reason, std::move(operators), now);
  }
  if (tripped) {
    notify(*tripped);
    return true;
  }
  return false;
}

// -----------------------------------------------------------------------------
// reset: dual-control re-arm
// -----------------------------------------------------------------------------
ResetResult RiskEngine::reset(const DualControlRequest& request) {
  ResetResult result;
  DualControlResult approval = dual_control_.verify(request);
  result.operators = approval.operators;
  if (!approval.approved) {
    result.detail = approval.detail;
    std::cerr << "[RiskEngine] reset refused: " << approval.detail << "\n";
    return result;
  }
  result.authorized = true;

  domain::KillSwitchRecord record;
  {
    std::unique_lock lock(mutex_);
    if (!state_.tripped()) {
      result.detail = "kill switch is not tripped";
      return result;
    }
    state_.kill_switch = domain::KillSwitchState::Armed;
    state_.trip_trigger.reset();
    state_.trip_reason.clear();
    state_.tripped_at_ms = 0;
    state_.consecutive_anomalies = 0;
    cancel_source_ = CancellationSource();
    tripped_.store(false);

    record.state_after = domain::KillSwitchState::Armed;
    record.reason = request.reason.empty() ? "operator reset" : request.reason;
    record.operators = approval.operators;
    record.timestamp_ms = clock_.now_ms();
    pushHistory(record);
  }

  std::cout << "[RiskEngine] kill switch re-armed by "
            << approval.operators.size() << " operators.\n";
  notify(record);
  result.ok = true;
  return result;
}

CancellationToken RiskEngine::cancellationToken() const {
  std::shared_lock lock(mutex_);
  return cancel_source_.token();
}

domain::RiskState RiskEngine::state() const {
  std::shared_lock lock(mutex_);
  return state_;
}

void RiskEngine::restore(const domain::RiskState& state) {
  std::unique_lock lock(mutex_);
  state_ = state;
  cancel_source_ = CancellationSource();
  if (state_.tripped()) {
    cancel_source_.cancel();
  }
  tripped_.store(state_.tripped());
  rollDay(clock_.now_ms());
}

void RiskEngine::addListener(SwitchListener listener) {
  std::lock_guard lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

// -----------------------------------------------------------------------------
// private helpers (mutex_ held exclusively unless noted)
// -----------------------------------------------------------------------------
void RiskEngine::rollDay(domain::TimestampMs now_ms) {
  const auto today = utc_day(now_ms);
  if (state_.trading_day != today) {
    state_.trading_day = today;
    state_.daily_realized_pnl = 0.0;
  }
}

std::optional<domain::KillSwitchRecord> RiskEngine::tripLocked(
    domain::TripTrigger trigger, const std::string& reason,
    std::vector<std::string> operators, domain::TimestampMs now_ms) {
  if (state_.tripped()) {
    return std::nullopt;
  }
  state_.kill_switch = domain::KillSwitchState::Tripped;
  state_.trip_trigger = trigger;
  state_.trip_reason = reason;
  state_.tripped_at_ms = now_ms;
  ++state_.trip_count;
  tripped_.store(true);
  cancel_source_.cancel();

  domain::KillSwitchRecord record;
  record.state_after = domain::KillSwitchState::Tripped;
  record.trigger = trigger;
  record.reason = reason;
  record.operators = std::move(operators);
  record.timestamp_ms = now_ms;
  pushHistory(record);

  std::cerr << "[RiskEngine] KILL SWITCH TRIPPED (" << domain::toString(trigger)
            << "): " << reason << "\n";
  return record;
}

void RiskEngine::pushHistory(const domain::KillSwitchRecord& record) {
  state_.history.push_back(record);
  while (state_.history.size() > domain::RiskState::kSwitchHistoryLimit) {
    state_.history.pop_front();
  }
}

// Called without mutex_ held.
void RiskEngine::notify(const domain::KillSwitchRecord& record) {
  std::vector<SwitchListener> listeners;
  {
    std::lock_guard lock(listeners_mutex_);
    listeners = listeners_;
  }
  for (const auto& listener : listeners) {
    listener(record);
  }
}

}  // namespace sentinel
