#pragma once

#include "sentinel/domain/market_context.hpp"
#include "sentinel/domain/types.hpp"

namespace sentinel {

struct SlippageConfig {
  double base_bps{1.0};
  double volatility_bps_per_pct{10.0};
  double impact_bps{10.0};  // per unit of quantity / book_depth
  double max_bps{100.0};
};

// -----------------------------------------------------------------------------
// SlippageModel
// -----------------------------------------------------------------------------
//
// @brief  Turns a quote into a realistic fill price.
//
// @details
// slippage_bps = base + volatility_pct * volatility_bps_per_pct
//                     + impact_bps * quantity / book_depth,  capped at max.
// Buys fill above the ask (or reference price without a book), sells below
// the bid. `quantity` is the cumulative size taken so far, so successive
// slices of one order walk the book.
// -----------------------------------------------------------------------------
class SlippageModel {
 public:
  explicit SlippageModel(SlippageConfig config = {}) : config_(config) {}

  double estimateBps(double quantity, const domain::MarketContext& market) const;

  double fillPrice(domain::Side side, double reference_price,
                   const domain::MarketContext& market,
                   double slippage_bps) const;

  const SlippageConfig& config() const { return config_; }

 private:
  SlippageConfig config_;
};

}  // namespace sentinel
