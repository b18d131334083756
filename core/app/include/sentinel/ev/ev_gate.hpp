#pragma once

#include "sentinel/domain/ev_decision.hpp"
#include "sentinel/domain/market_context.hpp"
#include "sentinel/domain/trade_intent.hpp"
#include "sentinel/fees/fee_tax_model.hpp"

#include <cstddef>
#include <deque>
#include <mutex>

namespace sentinel {

enum class SizingSearch {
  Binary,  // peak search then bisection; assumes EV concave in size
  Grid,    // evaluate grid_steps evenly spaced sizes
};

// -----------------------------------------------------------------------------
// EvGateConfig
// -----------------------------------------------------------------------------
//
// Fill probability:
//   score = 0.4*fill_rate + 0.2*depth_balance + 0.2*spread_tightness
//           + 0.2*speed, each term in [0, 1]
//   p     = clamp(1 / (1 + exp(-steepness * (score - 0.5))), min_p, max_p)
//
// Slippage budget (bps):
//   (size_impact_bps * qty / book_depth
//    + volatility_bps_per_pct * volatility_pct
//    + p95 of observed slippage, or default_p95_slippage_bps)
//   * slippage_multiplier
//
// Latency penalty: notional * latency_bps_per_100ms * latency_ms / 100 / 1e4.
// -----------------------------------------------------------------------------
struct EvGateConfig {
  double min_ev{1.0};
  double min_quantity{0.0};
  double quantity_step{0.0};

  double min_fill_probability{0.1};
  double max_fill_probability{0.95};
  double logistic_steepness{4.0};

  double size_impact_bps{10.0};
  double volatility_bps_per_pct{10.0};
  double default_p95_slippage_bps{5.0};
  double slippage_multiplier{1.5};
  double latency_bps_per_100ms{2.0};

  SizingSearch sizing{SizingSearch::Binary};
  int grid_steps{100};
  int search_iterations{60};

  std::size_t history_limit{1000};
  std::size_t min_history_samples{20};
};

// All EV terms at one candidate size.
struct EvBreakdown {
  double quantity{0.0};
  double notional{0.0};
  double fill_probability{0.0};
  double edge_per_unit{0.0};
  double expected_edge{0.0};
  double fees{0.0};
  double taxes{0.0};
  double latency_penalty{0.0};
  double slippage_bps{0.0};
  double slippage_cost{0.0};
  double expected_value{0.0};
};

// -----------------------------------------------------------------------------
// EvGate
// -----------------------------------------------------------------------------
//
// @brief  Decides whether an intent is worth executing and at what size.
//
// @details
// Decision:
//   1. EV at the requested size clears the threshold → Approved.
//   2. Otherwise search for the largest smaller size that clears it →
//      Resized. Because the slippage term grows with size/depth, costs are
//      superlinear and EV is concave in size, so smaller trades can be
//      profitable when the full one is not.
//   3. No such size (or below min_quantity) → Rejected, approved size 0.
//
// "Clears the threshold" means EV > min_ev and EV >= 0.
//
// The gate is deterministic for a given (intent, market context, fee model,
// observed history). evaluate() is const; the only mutable state is the fill
// and slippage history fed back by recordFillResult().
//
// Thread-safety: evaluate() and recordFillResult() may run concurrently.
// -----------------------------------------------------------------------------
class EvGate {
 public:
  explicit EvGate(EvGateConfig config);

  EvGate(const EvGate&) = delete;
  EvGate& operator=(const EvGate&) = delete;

  domain::EVDecision evaluate(const domain::TradeIntent& intent,
                              const FeeTaxModel& fees,
                              const domain::MarketContext& market) const;

  EvBreakdown breakdown(const domain::TradeIntent& intent, double quantity,
                        double fill_probability, const FeeTaxModel& fees,
                        const domain::MarketContext& market) const;

  double fillProbability(const domain::TradeIntent& intent,
                         const domain::MarketContext& market) const;

  double slippageBudgetBps(double quantity,
                           const domain::MarketContext& market) const;

  // Feed back an execution outcome. slippage_bps is the realised adverse
  // move versus the reference price.
  void recordFillResult(bool filled, double slippage_bps);

  const EvGateConfig& config() const { return config_; }

 private:
  bool clears(double expected_value) const;
  double searchResize(const domain::TradeIntent& intent, double p,
                      const FeeTaxModel& fees,
                      const domain::MarketContext& market) const;
  double observedFillRate(double fallback) const;
  double p95SlippageBps() const;

  EvGateConfig config_;

  mutable std::mutex history_mutex_;
  std::deque<bool> fill_history_;
  std::deque<double> slippage_history_;
};

}  // namespace sentinel
