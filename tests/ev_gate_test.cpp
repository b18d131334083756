// =============================================================================
// ev_gate_test.cpp
// =============================================================================
// Unit tests for sentinel::EvGate.
//
// Validates:
//   - A thin edge that cannot pay round-trip fees is rejected with size 0
//   - A wide edge is approved at the requested size
//   - Superlinear slippage makes a smaller size profitable: Resized
//   - Binary and grid sizing agree on the resized quantity
//   - Decisions are deterministic for the same inputs
//   - Fill probability: hint override, clamping, fill-history feedback
//   - Hints are clamped to [min_fill_probability, max_fill_probability]
// =============================================================================

#include "sentinel/ev/ev_gate.hpp"

#include <gtest/gtest.h>

#include <cmath>

namespace {

using sentinel::domain::EvOutcome;
using sentinel::domain::ReasonCode;

sentinel::FeeTaxModel makeFees(double taker_bps) {
  sentinel::FeeTaxConfig config;
  config.venues.push_back(
      sentinel::VenueFeeSchedule{"paper", taker_bps, taker_bps, 0.0, false});
  return sentinel::FeeTaxModel(config);
}

sentinel::domain::TradeIntent makeIntent(double quantity, double price,
                                         double spread_bps) {
  sentinel::domain::TradeIntent intent;
  intent.intent_id = "i-1";
  intent.strategy_id = "grid";
  intent.symbol = "XYZ";
  intent.side = sentinel::domain::Side::Buy;
  intent.quantity = quantity;
  intent.reference_price = price;
  intent.venues = {"paper"};
  intent.expected_spread_bps = spread_bps;
  intent.liquidity = sentinel::domain::Liquidity::Taker;
  return intent;
}

sentinel::domain::MarketContext makeMarket(double depth, double p_hint,
                                           double latency_ms) {
  sentinel::domain::MarketContext market;
  market.symbol = "XYZ";
  market.best_bid = 0.999;
  market.best_ask = 1.001;
  market.last_price = 1.0;
  market.book_depth = depth;
  market.latency_ms = latency_ms;
  market.fill_probability_hint = p_hint;
  return market;
}

// EV(q) = 0.01 q - 0.00002 q^2 for the resize scenario below: clears 1.0
// between q ~ 138.2 and q ~ 361.8, peak 1.25 at q = 250.
sentinel::EvGateConfig resizeConfig(sentinel::SizingSearch sizing) {
  sentinel::EvGateConfig config;
  config.size_impact_bps = 200.0;
  config.volatility_bps_per_pct = 0.0;
  config.default_p95_slippage_bps = 0.0;
  config.slippage_multiplier = 1.0;
  config.latency_bps_per_100ms = 0.0;
  config.max_fill_probability = 1.0;
  config.sizing = sizing;
  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Thin edge: 20 bps captured with p = 0.6 against 2 x 20 bps taker fees.
// Scenario: price 1, qty 5000, latency 100 ms. Expected edge 6.0, fees 20.0,
//           latency penalty 1.0. Per-unit costs exceed per-unit edge at any
//           size, so no resize helps.
// -----------------------------------------------------------------------------
TEST(EvGateTest, ThinEdgeIsRejectedWithZeroSize) {
  sentinel::EvGate gate{sentinel::EvGateConfig{}};
  sentinel::FeeTaxModel fees = makeFees(20.0);

  auto decision = gate.evaluate(makeIntent(5000.0, 1.0, 20.0), fees,
                                makeMarket(1e6, 0.6, 100.0));

  EXPECT_EQ(decision.outcome, EvOutcome::Rejected);
  EXPECT_FALSE(decision.approved());
  EXPECT_EQ(decision.reason, ReasonCode::EvBelowThreshold);
  EXPECT_DOUBLE_EQ(decision.approved_quantity, 0.0);
  EXPECT_DOUBLE_EQ(decision.requested_quantity, 5000.0);
  EXPECT_NEAR(decision.fees, 20.0, 1e-9);
  EXPECT_NEAR(decision.latency_penalty, 1.0, 1e-9);
  EXPECT_DOUBLE_EQ(decision.fill_probability, 0.6);
  EXPECT_LT(decision.expected_value, 0.0);
  EXPECT_NEAR(decision.netCost(), decision.fees + decision.taxes, 1e-12);
}

// -----------------------------------------------------------------------------
// 2. Wide edge clears the threshold at the requested size.
// -----------------------------------------------------------------------------
TEST(EvGateTest, WideEdgeIsApproved) {
  sentinel::EvGate gate{sentinel::EvGateConfig{}};
  sentinel::FeeTaxModel fees = makeFees(10.0);

  auto decision = gate.evaluate(makeIntent(1000.0, 1.0, 200.0), fees,
                                makeMarket(1e6, 0.9, 0.0));

  EXPECT_EQ(decision.outcome, EvOutcome::Approved);
  EXPECT_TRUE(decision.approved());
  EXPECT_DOUBLE_EQ(decision.approved_quantity, 1000.0);
  EXPECT_NEAR(decision.edge_per_unit, 0.02, 1e-12);
  EXPECT_NEAR(decision.fees, 2.0, 1e-9);
  EXPECT_GT(decision.expected_value, gate.config().min_ev);
}

// -----------------------------------------------------------------------------
// 3. Binary sizing finds the largest size whose EV still clears.
// Why: slippage grows with size/depth, so the full request loses money while
//      roughly a third of it does not.
// -----------------------------------------------------------------------------
TEST(EvGateTest, OversizedIntentIsResizedDown) {
  sentinel::EvGate gate{resizeConfig(sentinel::SizingSearch::Binary)};
  sentinel::FeeTaxModel fees = makeFees(0.0);

  auto decision = gate.evaluate(makeIntent(1000.0, 1.0, 100.0), fees,
                                makeMarket(1000.0, 1.0, 0.0));

  const double upper = (0.01 + std::sqrt(0.01 * 0.01 - 8e-5)) / 4e-5;
  EXPECT_EQ(decision.outcome, EvOutcome::Resized);
  EXPECT_TRUE(decision.approved());
  EXPECT_NEAR(decision.approved_quantity, upper, 0.5);
  EXPECT_LE(decision.approved_quantity, upper);
  EXPECT_GT(decision.expected_value, 1.0);
}

// -----------------------------------------------------------------------------
// 4. Grid sizing lands on the largest grid point below the binary answer.
// -----------------------------------------------------------------------------
TEST(EvGateTest, GridSizingPicksLargestClearingStep) {
  sentinel::EvGate gate{resizeConfig(sentinel::SizingSearch::Grid)};
  sentinel::FeeTaxModel fees = makeFees(0.0);

  auto decision = gate.evaluate(makeIntent(1000.0, 1.0, 100.0), fees,
                                makeMarket(1000.0, 1.0, 0.0));

  EXPECT_EQ(decision.outcome, EvOutcome::Resized);
  EXPECT_NEAR(decision.approved_quantity, 360.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 5. quantity_step rounds the resized size down to a tradable increment.
// -----------------------------------------------------------------------------
TEST(EvGateTest, ResizeRespectsQuantityStep) {
  sentinel::EvGateConfig config = resizeConfig(sentinel::SizingSearch::Binary);
  config.quantity_step = 50.0;
  sentinel::EvGate gate{config};
  sentinel::FeeTaxModel fees = makeFees(0.0);

  auto decision = gate.evaluate(makeIntent(1000.0, 1.0, 100.0), fees,
                                makeMarket(1000.0, 1.0, 0.0));

  EXPECT_EQ(decision.outcome, EvOutcome::Resized);
  EXPECT_DOUBLE_EQ(decision.approved_quantity, 350.0);
}

// -----------------------------------------------------------------------------
// 6. No book depth → rejected as insufficient liquidity.
// -----------------------------------------------------------------------------
TEST(EvGateTest, EmptyBookIsInsufficientLiquidity) {
  sentinel::EvGate gate{sentinel::EvGateConfig{}};
  sentinel::FeeTaxModel fees = makeFees(10.0);

  auto decision = gate.evaluate(makeIntent(1000.0, 1.0, 200.0), fees,
                                makeMarket(0.0, 0.9, 0.0));

  EXPECT_EQ(decision.outcome, EvOutcome::Rejected);
  EXPECT_EQ(decision.reason, ReasonCode::InsufficientLiquidity);
  EXPECT_DOUBLE_EQ(decision.approved_quantity, 0.0);
}

// -----------------------------------------------------------------------------
// 7. The same inputs give the same decision.
// -----------------------------------------------------------------------------
TEST(EvGateTest, EvaluateIsDeterministic) {
  sentinel::EvGate gate{resizeConfig(sentinel::SizingSearch::Binary)};
  sentinel::FeeTaxModel fees = makeFees(0.0);
  auto intent = makeIntent(1000.0, 1.0, 100.0);
  auto market = makeMarket(1000.0, 1.0, 0.0);

  auto first = gate.evaluate(intent, fees, market);
  auto second = gate.evaluate(intent, fees, market);

  EXPECT_EQ(first.outcome, second.outcome);
  EXPECT_DOUBLE_EQ(first.approved_quantity, second.approved_quantity);
  EXPECT_DOUBLE_EQ(first.expected_value, second.expected_value);
}

// -----------------------------------------------------------------------------
// 8. Fill probability model: clamped, lower with latency, and it follows
//    the observed fill rate once enough outcomes are recorded.
// -----------------------------------------------------------------------------
TEST(EvGateTest, FillProbabilityModel) {
  sentinel::EvGate gate{sentinel::EvGateConfig{}};
  auto intent = makeIntent(10.0, 1.0, 20.0);

  auto fast = makeMarket(1e6, 0.0, 0.0);
  fast.fill_probability_hint.reset();
  auto slow = fast;
  slow.latency_ms = 2000.0;

  double p_fast = gate.fillProbability(intent, fast);
  double p_slow = gate.fillProbability(intent, slow);
  EXPECT_GE(p_fast, gate.config().min_fill_probability);
  EXPECT_LE(p_fast, gate.config().max_fill_probability);
  EXPECT_GT(p_fast, p_slow);

  for (std::size_t i = 0; i < gate.config().min_history_samples; ++i) {
    gate.recordFillResult(false, 0.0);
  }
  EXPECT_LT(gate.fillProbability(intent, fast), p_fast);

  auto pinned = fast;
  pinned.fill_probability_hint = 0.5;
  EXPECT_DOUBLE_EQ(gate.fillProbability(intent, pinned), 0.5);
}

// -----------------------------------------------------------------------------
// 9. A hint is held to the configured probability bounds, like the model.
// Why: a certain fill (p = 1) would let EV ignore the cost of missing it.
// -----------------------------------------------------------------------------
TEST(EvGateTest, HintIsClampedToConfiguredBounds) {
  sentinel::EvGate gate{sentinel::EvGateConfig{}};
  auto intent = makeIntent(10.0, 1.0, 20.0);
  const auto& config = gate.config();

  EXPECT_DOUBLE_EQ(gate.fillProbability(intent, makeMarket(1e6, 0.99, 0.0)),
                   config.max_fill_probability);
  EXPECT_DOUBLE_EQ(gate.fillProbability(intent, makeMarket(1e6, 1.7, 0.0)),
                   config.max_fill_probability);
  EXPECT_DOUBLE_EQ(gate.fillProbability(intent, makeMarket(1e6, 0.01, 0.0)),
                   config.min_fill_probability);
  EXPECT_DOUBLE_EQ(gate.fillProbability(intent, makeMarket(1e6, -1.0, 0.0)),
                   config.min_fill_probability);

  auto decision = gate.evaluate(makeIntent(1000.0, 1.0, 200.0),
                                makeFees(10.0), makeMarket(1e6, 1.0, 0.0));
  EXPECT_DOUBLE_EQ(decision.fill_probability, config.max_fill_probability);
}
