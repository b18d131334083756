#include "sentinel/ev/ev_gate.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace sentinel {

namespace {

constexpr double kBps = 10000.0;

double clamp(double value, double lo, double hi) {
  return std::max(lo, std::min(hi, value));
}

}  // namespace

EvGate::EvGate(EvGateConfig config) : config_(std::move(config)) {}

// -----------------------------------------------------------------------------
// fillProbability: hint if supplied, otherwise the logistic score model
// -----------------------------------------------------------------------------
double EvGate::fillProbability(const domain::TradeIntent& intent,
                               const domain::MarketContext& market) const {
  if (market.fill_probability_hint) {
    return clamp(*market.fill_probability_hint, config_.min_fill_probability,
                 config_.max_fill_probability);
  }

  double fill_rate = observedFillRate(clamp(market.maker_fill_rate, 0.0, 1.0));
  double depth_balance = 1.0 / (1.0 + std::abs(1.0 - market.depth_ratio));
  double spread_bps =
      market.quotedSpreadBps().value_or(intent.expected_spread_bps);
  double tightness = 1.0 / (1.0 + std::max(0.0, spread_bps) / 10.0);
  double speed = 1.0 / (1.0 + std::max(0.0, market.latency_ms) / 100.0);

  double score =
      0.4 * fill_rate + 0.2 * depth_balance + 0.2 * tightness + 0.2 * speed;
  double p = 1.0 / (1.0 + std::exp(-config_.logistic_steepness * (score - 0.5)));
  return clamp(p, config_.min_fill_probability, config_.max_fill_probability);
}

double EvGate::slippageBudgetBps(double quantity,
                                 const domain::MarketContext& market) const {
  double depth_share =
      market.book_depth > 0.0 ? std::abs(quantity) / market.book_depth : 0.0;
  double impact = config_.size_impact_bps * depth_share;
  double volatility =
      config_.volatility_bps_per_pct * std::max(0.0, market.volatility_pct);
  return (impact + volatility + p95SlippageBps()) * config_.slippage_multiplier;
}

// -----------------------------------------------------------------------------
// breakdown: every EV term at one candidate size
// -----------------------------------------------------------------------------
EvBreakdown EvGate::breakdown(const domain::TradeIntent& intent,
                              double quantity, double fill_probability,
                              const FeeTaxModel& fees,
                              const domain::MarketContext& market) const {
  EvBreakdown b;
  b.quantity = quantity;
  b.notional = quantity * intent.reference_price;
  b.fill_probability = fill_probability;
  b.edge_per_unit = intent.reference_price * intent.expected_spread_bps / kBps;
  b.expected_edge = fill_probability * b.edge_per_unit * quantity;

  CostEstimate cost =
      fees.roundTrip(intent.venues, b.notional, intent.liquidity);
  b.fees = cost.fee;
  b.taxes = cost.tax;

  b.latency_penalty = b.notional * config_.latency_bps_per_100ms *
                      (std::max(0.0, market.latency_ms) / 100.0) / kBps;

  b.slippage_bps = slippageBudgetBps(quantity, market);
  b.slippage_cost = b.notional * b.slippage_bps / kBps;

  b.expected_value = b.expected_edge - b.fees - b.taxes - b.latency_penalty -
                     b.slippage_cost;
  return b;
}

bool EvGate::clears(double expected_value) const {
  return std::isfinite(expected_value) && expected_value > config_.min_ev &&
         expected_value >= 0.0;
}

// -----------------------------------------------------------------------------
// evaluate: approve, resize or reject
// -----------------------------------------------------------------------------
domain::EVDecision EvGate::evaluate(const domain::TradeIntent& intent,
                                    const FeeTaxModel& fees,
                                    const domain::MarketContext& market) const {
  domain::EVDecision decision;
  decision.intent_id = intent.intent_id;
  decision.spread_bps = intent.expected_spread_bps;
  decision.requested_quantity = intent.quantity;

  if (intent.quantity <= 0.0 || intent.reference_price <= 0.0 ||
      intent.venues.empty()) {
    decision.reason = domain::ReasonCode::InvalidIntent;
    return decision;
  }
  if (market.book_depth <= 0.0) {
    decision.reason = domain::ReasonCode::InsufficientLiquidity;
    return decision;
  }

  const double p = fillProbability(intent, market);

  auto fillFrom = [&decision](const EvBreakdown& b) {
    decision.fill_probability = b.fill_probability;
    decision.edge_per_unit = b.edge_per_unit;
    decision.slippage_bps = b.slippage_bps;
    decision.slippage_cost = b.slippage_cost;
    decision.fees = b.fees;
    decision.taxes = b.taxes;
    decision.latency_penalty = b.latency_penalty;
    decision.expected_value = b.expected_value;
  };

  EvBreakdown requested = breakdown(intent, intent.quantity, p, fees, market);
  if (clears(requested.expected_value)) {
    fillFrom(requested);
    decision.outcome = domain::EvOutcome::Approved;
    decision.approved_quantity = intent.quantity;
    return decision;
  }

  double size = searchResize(intent, p, fees, market);
  if (config_.quantity_step > 0.0) {
    size = std::floor(size / config_.quantity_step) * config_.quantity_step;
  }

  if (size > 0.0 && size > config_.min_quantity) {
    EvBreakdown resized = breakdown(intent, size, p, fees, market);
    if (clears(resized.expected_value)) {
      fillFrom(resized);
      decision.outcome = domain::EvOutcome::Resized;
      decision.approved_quantity = size;
      return decision;
    }
  }

  fillFrom(requested);
  decision.outcome = domain::EvOutcome::Rejected;
  decision.reason = domain::ReasonCode::EvBelowThreshold;
  decision.approved_quantity = 0.0;
  return decision;
}

// -----------------------------------------------------------------------------
// searchResize: largest size below the request whose EV clears, or 0
// -----------------------------------------------------------------------------
double EvGate::searchResize(const domain::TradeIntent& intent, double p,
                            const FeeTaxModel& fees,
                            const domain::MarketContext& market) const {
  auto ev = [&](double q) {
    return breakdown(intent, q, p, fees, market).expected_value;
  };
  const double requested = intent.quantity;

  if (config_.sizing == SizingSearch::Grid) {
    const int steps = std::max(config_.grid_steps, 2);
    for (int k = steps - 1; k >= 1; --k) {
      double q = requested * static_cast<double>(k) / steps;
      if (clears(ev(q))) {
        return q;
      }
    }
    return 0.0;
  }

  // Ternary search for the EV peak on [0, requested].
  double lo = 0.0;
  double hi = requested;
  for (int i = 0; i < config_.search_iterations; ++i) {
    double m1 = lo + (hi - lo) / 3.0;
    double m2 = hi - (hi - lo) / 3.0;
    if (ev(m1) < ev(m2)) {
      lo = m1;
    } else {
      hi = m2;
    }
  }
  double peak = (lo + hi) / 2.0;
  if (!clears(ev(peak))) {
    return 0.0;
  }

  // Bisect between the peak (clears) and the request (does not).
  lo = peak;
  hi = requested;
  for (int i = 0; i < config_.search_iterations; ++i) {
    double mid = (lo + hi) / 2.0;
    if (clears(ev(mid))) {
      lo = mid;
    } else {
      hi = mid;
    }
  }
  return lo;
}

// -----------------------------------------------------------------------------
// recordFillResult: bounded history for fill rate and p95 slippage
// -----------------------------------------------------------------------------
void EvGate::recordFillResult(bool filled, double slippage_bps) {
  std::lock_guard lock(history_mutex_);
  fill_history_.push_back(filled);
  while (fill_history_.size() > config_.history_limit) {
    fill_history_.pop_front();
  }
  if (filled && std::isfinite(slippage_bps)) {
    slippage_history_.push_back(std::abs(slippage_bps));
    while (slippage_history_.size() > config_.history_limit) {
      slippage_history_.pop_front();
    }
  }
}

double EvGate::observedFillRate(double fallback) const {
  std::lock_guard lock(history_mutex_);
  if (fill_history_.size() < config_.min_history_samples) {
    return fallback;
  }
  auto filled = std::count(fill_history_.begin(), fill_history_.end(), true);
  return static_cast<double>(filled) /
         static_cast<double>(fill_history_.size());
}

double EvGate::p95SlippageBps() const {
  std::vector<double> sorted;
  {
    std::lock_guard lock(history_mutex_);
    if (slippage_history_.size() < config_.min_history_samples) {
      return config_.default_p95_slippage_bps;
    }
    sorted.assign(slippage_history_.begin(), slippage_history_.end());
  }
  std::sort(sorted.begin(), sorted.end());
  auto rank = static_cast<std::size_t>(
      std::ceil(0.95 * static_cast<double>(sorted.size())));
  return sorted[std::max<std::size_t>(rank, 1) - 1];
}

}  // namespace sentinel
