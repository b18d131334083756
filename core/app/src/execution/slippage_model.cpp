#include "sentinel/execution/slippage_model.hpp"

#include <algorithm>
#include <cmath>

namespace sentinel {

double SlippageModel::estimateBps(double quantity,
                                  const domain::MarketContext& market) const {
  double bps = config_.base_bps +
               std::max(0.0, market.volatility_pct) *
                   config_.volatility_bps_per_pct;
  if (market.book_depth > 0.0) {
    bps += config_.impact_bps * std::abs(quantity) / market.book_depth;
  } else {
    bps = config_.max_bps;
  }
  return std::min(bps, config_.max_bps);
}

double SlippageModel::fillPrice(domain::Side side, double reference_price,
                                const domain::MarketContext& market,
                                double slippage_bps) const {
  const double factor = slippage_bps / 10000.0;
  if (side == domain::Side::Buy) {
    const double anchor = market.best_ask > 0.0 ? market.best_ask
                                                : reference_price;
    return anchor * (1.0 + factor);
  }
  const double anchor = market.best_bid > 0.0 ? market.best_bid
                                              : reference_price;
  return anchor * (1.0 - factor);
}

}  // namespace sentinel
