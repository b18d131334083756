// =============================================================================
// risk_engine_test.cpp
// =============================================================================
// Unit tests for sentinel::RiskEngine and sentinel::DualControl.
//
// Validates:
//   - Pre-trade rules: trading window, trade, strategy, symbol, gross,
//     daily loss
//   - Orders that shrink an over-limit exposure are allowed
//   - Drawdown breach trips the kill switch exactly once and cancels the token
//   - Fatal anomalies and reconciliation failures trip with their trigger
//   - Reset needs two distinct, verified operators
//   - UTC day rollover clears realized P&L
//   - restore() brings a tripped switch back tripped
// =============================================================================

#include "sentinel/risk/dual_control.hpp"
#include "sentinel/risk/risk_engine.hpp"
#include "sentinel/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <map>
#include <string>
#include <vector>

namespace {

using sentinel::domain::ReasonCode;
using sentinel::domain::Side;
using sentinel::domain::TripTrigger;

// 2023-11-14 00:00:00 UTC
constexpr std::int64_t kDayStartMs = 1'699'920'000'000;
constexpr std::int64_t kNoonMs = kDayStartMs + 12 * 60 * 60 * 1000;

// sha256("alice-secret"), sha256("bob-secret"), sha256("carol-secret")
const char* kAliceHash =
    "0c848abb03307b06cf70cd4e29c157dc81af5e94ab3eb1d0c59a120269572376";
const char* kBobHash =
    "9f03ef1533a68d2f506f81ef463c1183a82a6bd40e45613f36e6fe1889cf1b99";
const char* kCarolHash =
    "9e1d0a638ff9fd18986d8057aef3c36871aa54b27a6fcc6411fb32f8325675e2";

sentinel::domain::RiskLimits makeLimits() {
  sentinel::domain::RiskLimits limits;
  limits.max_trade_notional = 10000.0;
  limits.max_symbol_notional = 50000.0;
  limits.max_gross_notional = 100000.0;
  limits.max_daily_loss = 200.0;
  limits.strategy_trade_notional["arb"] = 2000.0;
  return limits;
}

sentinel::domain::TradeIntent makeIntent(Side side,
                                         const std::string& strategy = "grid",
                                         const std::string& symbol = "BTC") {
  sentinel::domain::TradeIntent intent;
  intent.intent_id = "i-1";
  intent.strategy_id = strategy;
  intent.symbol = symbol;
  intent.side = side;
  intent.quantity = 1.0;
  intent.reference_price = 100.0;
  intent.venues = {"paper"};
  return intent;
}

sentinel::DualControlRequest confirmations(
    std::vector<std::pair<std::string, std::string>> ops) {
  sentinel::DualControlRequest request;
  request.reason = "test";
  for (auto& [id, secret] : ops) {
    request.confirmations.push_back(sentinel::OperatorConfirmation{id, secret});
  }
  return request;
}

}  // namespace

class RiskEngineTest : public ::testing::Test {
 protected:
  sentinel::SimulationTimeProvider clock{kNoonMs};
  sentinel::DualControl dual_control{
      {{"alice", kAliceHash}, {"bob", kBobHash}, {"carol", kCarolHash}}, 2};
  sentinel::RiskEngine risk{makeLimits(), clock, dual_control};

  void setExposure(std::map<std::string, double> exposure) {
    sentinel::PnlUpdate update;
    double gross = 0.0;
    for (const auto& [symbol, value] : exposure) {
      gross += std::abs(value);
    }
    update.gross_exposure = gross;
    update.symbol_exposure = std::move(exposure);
    risk.evaluate(update);
  }

  void tripByDrawdown() {
    sentinel::PnlUpdate loss;
    loss.realized_pnl_delta = -250.0;
    ASSERT_TRUE(risk.evaluate(loss));
  }
};

// -----------------------------------------------------------------------------
// 1. A small order on a fresh engine is allowed.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, AllowsOrderWithinLimits) {
  auto decision = risk.check(makeIntent(Side::Buy), 5000.0);
  EXPECT_TRUE(decision.allowed);
  EXPECT_EQ(decision.reason, ReasonCode::None);
}

// -----------------------------------------------------------------------------
// 2. Per-trade and per-strategy caps.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, TradeAndStrategyCaps) {
  auto over_trade = risk.check(makeIntent(Side::Buy), 10000.01);
  EXPECT_FALSE(over_trade.allowed);
  EXPECT_EQ(over_trade.reason, ReasonCode::TradeNotionalLimit);

  auto over_strategy = risk.check(makeIntent(Side::Buy, "arb"), 2500.0);
  EXPECT_FALSE(over_strategy.allowed);
  EXPECT_EQ(over_strategy.reason, ReasonCode::StrategyNotionalLimit);

  EXPECT_TRUE(risk.check(makeIntent(Side::Buy, "arb"), 1500.0).allowed);
}

// -----------------------------------------------------------------------------
// 3. Symbol cap: growing past it is denied, shrinking is allowed.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, SymbolExposureCap) {
  setExposure({{"BTC", 45000.0}});

  auto grow = risk.check(makeIntent(Side::Buy), 6000.0);
  EXPECT_FALSE(grow.allowed);
  EXPECT_EQ(grow.reason, ReasonCode::SymbolNotionalLimit);

  EXPECT_TRUE(risk.check(makeIntent(Side::Sell), 6000.0).allowed);
}

// -----------------------------------------------------------------------------
// 4. Gross cap across symbols.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, GrossExposureCap) {
  setExposure({{"BTC", 48000.0}, {"ETH", -47000.0}});

  auto decision = risk.check(makeIntent(Side::Buy, "grid", "SOL"), 6000.0);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason, ReasonCode::GrossNotionalLimit);

  EXPECT_TRUE(risk.check(makeIntent(Side::Buy, "grid", "ETH"), 6000.0).allowed);
}

// -----------------------------------------------------------------------------
// 5. Trading window and daily loss are checked against the given state.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, TradingWindowAndDailyLoss) {
  auto limits = makeLimits();
  limits.trading_window_start_min = 9 * 60;
  limits.trading_window_end_min = 17 * 60;

  sentinel::domain::RiskState state;
  state.trading_day = kDayStartMs / 86400000;

  auto at_night = sentinel::RiskEngine::checkAgainst(
      makeIntent(Side::Buy), 100.0, state, limits, kDayStartMs + 3600000);
  EXPECT_EQ(at_night.reason, ReasonCode::OutsideTradingHours);

  EXPECT_TRUE(sentinel::RiskEngine::checkAgainst(makeIntent(Side::Buy), 100.0,
                                                 state, limits, kNoonMs)
                  .allowed);

  state.daily_realized_pnl = -150.0;
  state.unrealized_pnl = -60.0;
  auto losing = sentinel::RiskEngine::checkAgainst(
      makeIntent(Side::Buy), 100.0, state, limits, kNoonMs);
  EXPECT_EQ(losing.reason, ReasonCode::DailyLossLimit);
}

// -----------------------------------------------------------------------------
// 6. A realized loss of 250 against a 200 limit trips DRAWDOWN_BREACH.
// Why: after the trip every new order must be refused and every in-flight
//      order must see its cancellation token fire.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, DrawdownBreachTripsOnce) {
  int notifications = 0;
  sentinel::domain::KillSwitchRecord last;
  risk.addListener([&](const sentinel::domain::KillSwitchRecord& record) {
    ++notifications;
    last = record;
  });
  auto token = risk.cancellationToken();

  tripByDrawdown();

  EXPECT_TRUE(risk.isTripped());
  EXPECT_TRUE(token.cancelled());
  EXPECT_EQ(notifications, 1);
  EXPECT_EQ(last.trigger.value_or(TripTrigger::Manual),
            TripTrigger::DrawdownBreach);

  auto state = risk.state();
  EXPECT_TRUE(state.tripped());
  EXPECT_DOUBLE_EQ(state.daily_realized_pnl, -250.0);
  EXPECT_EQ(state.trip_count, 1u);
  EXPECT_EQ(state.tripped_at_ms, kNoonMs);

  sentinel::PnlUpdate more;
  more.realized_pnl_delta = -10.0;
  EXPECT_FALSE(risk.evaluate(more));
  EXPECT_FALSE(risk.trip(TripTrigger::Manual, "again"));
  EXPECT_EQ(notifications, 1);

  auto decision = risk.check(makeIntent(Side::Sell), 1.0);
  EXPECT_FALSE(decision.allowed);
  EXPECT_EQ(decision.reason, ReasonCode::KillSwitchActive);
}

// -----------------------------------------------------------------------------
// 7. Fees count against the daily loss.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, FeesCountTowardDailyLoss) {
  sentinel::PnlUpdate update;
  update.realized_pnl_delta = -150.0;
  update.fee_delta = 60.0;
  EXPECT_TRUE(risk.evaluate(update));
}

// -----------------------------------------------------------------------------
// 8. Anomalies: fatal and auto-pause trip ANOMALY, reconciliation failures
//    trip RECONCILIATION_FAILURE, isolated spikes do not trip.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, AnomalyTriggers) {
  sentinel::domain::AnomalyEvent spike;
  spike.type = sentinel::domain::AnomalyType::PriceSpike;
  spike.key = "BTC";
  spike.consecutive_count = 1;
  EXPECT_FALSE(risk.evaluate(spike));

  spike.consecutive_count = 3;
  spike.triggered_pause = true;
  EXPECT_TRUE(risk.evaluate(spike));
  EXPECT_EQ(risk.state().trip_trigger.value_or(TripTrigger::Manual),
            TripTrigger::Anomaly);
  EXPECT_EQ(risk.state().consecutive_anomalies, 3);

  sentinel::SimulationTimeProvider other_clock{kNoonMs};
  sentinel::RiskEngine other{makeLimits(), other_clock, dual_control};
  sentinel::domain::AnomalyEvent recon;
  recon.type = sentinel::domain::AnomalyType::ReconciliationFailure;
  recon.key = "paper";
  recon.fatal = true;
  EXPECT_TRUE(other.evaluate(recon));
  EXPECT_EQ(other.state().trip_trigger.value_or(TripTrigger::Manual),
            TripTrigger::ReconciliationFailure);
}

// -----------------------------------------------------------------------------
// 9. Reset: one operator, a repeated operator or a wrong secret is refused;
//    two distinct valid operators re-arm with a fresh token.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, ResetRequiresTwoDistinctOperators) {
  tripByDrawdown();

  auto single = risk.reset(confirmations({{"alice", "alice-secret"}}));
  EXPECT_FALSE(single.ok);
  EXPECT_FALSE(single.authorized);

  auto repeated = risk.reset(confirmations(
      {{"alice", "alice-secret"}, {"alice", "alice-secret"}}));
  EXPECT_FALSE(repeated.ok);

  auto wrong = risk.reset(
      confirmations({{"alice", "alice-secret"}, {"bob", "not-bobs"}}));
  EXPECT_FALSE(wrong.ok);

  auto stranger = risk.reset(
      confirmations({{"alice", "alice-secret"}, {"mallory", "bob-secret"}}));
  EXPECT_FALSE(stranger.ok);
  EXPECT_TRUE(risk.isTripped());

  auto approved = risk.reset(
      confirmations({{"alice", "alice-secret"}, {"carol", "carol-secret"}}));
  EXPECT_TRUE(approved.ok);
  EXPECT_TRUE(approved.authorized);
  EXPECT_EQ(approved.operators,
            (std::vector<std::string>{"alice", "carol"}));
  EXPECT_FALSE(risk.isTripped());
  EXPECT_FALSE(risk.cancellationToken().cancelled());

  auto history = risk.state().history;
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history.back().state_after,
            sentinel::domain::KillSwitchState::Armed);

  auto again = risk.reset(
      confirmations({{"alice", "alice-secret"}, {"bob", "bob-secret"}}));
  EXPECT_TRUE(again.authorized);
  EXPECT_FALSE(again.ok);
}

// -----------------------------------------------------------------------------
// 10. Realized P&L resets at 00:00 UTC.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, DailyPnlRollsOverAtUtcMidnight) {
  sentinel::PnlUpdate loss;
  loss.realized_pnl_delta = -150.0;
  EXPECT_FALSE(risk.evaluate(loss));

  clock.advance_time(kDayStartMs + 24 * 60 * 60 * 1000 + 1);
  EXPECT_FALSE(risk.evaluate(loss));
  EXPECT_DOUBLE_EQ(risk.state().daily_realized_pnl, -150.0);
  EXPECT_FALSE(risk.isTripped());
}

// -----------------------------------------------------------------------------
// 11. A restored tripped state is enforced immediately.
// -----------------------------------------------------------------------------
TEST_F(RiskEngineTest, RestoreKeepsSwitchTripped) {
  sentinel::domain::RiskState saved;
  saved.kill_switch = sentinel::domain::KillSwitchState::Tripped;
  saved.trip_trigger = TripTrigger::Manual;
  saved.trip_reason = "operator kill";
  saved.trading_day = kDayStartMs / 86400000;

  risk.restore(saved);

  EXPECT_TRUE(risk.isTripped());
  EXPECT_TRUE(risk.cancellationToken().cancelled());
  EXPECT_EQ(risk.check(makeIntent(Side::Buy), 1.0).reason,
            ReasonCode::KillSwitchActive);
}
