#pragma once

#include "sentinel/domain/types.hpp"

#include <optional>
#include <string>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// MarketContext — what the engine knows about a symbol right now
// -----------------------------------------------------------------------------
//
// @brief  Snapshot consumed by the EV gate (fill probability, slippage
//         budget) and by the paper venue (fill prices, liquidity caps).
//
// @details
// book_depth is the estimated quantity available on the side we would
// consume. depth_ratio is bid depth / ask depth; 1.0 means balanced.
// volatility_pct is a rolling realised volatility in percent.
// fill_probability_hint, when present, overrides the fill-probability model
// (a strategy with its own estimate, or a test pinning the value). It is
// held to the same [min, max] fill-probability bounds as the model.
// -----------------------------------------------------------------------------
struct MarketContext {
  std::string symbol;
  double best_bid{0.0};
  double best_ask{0.0};
  double last_price{0.0};
  double book_depth{0.0};
  double depth_ratio{1.0};
  double volatility_pct{0.0};
  double latency_ms{0.0};
  double maker_fill_rate{0.5};
  std::optional<double> fill_probability_hint;
  TimestampMs as_of_ms{0};

  double mid() const {
    if (best_bid > 0.0 && best_ask > 0.0) {
      return (best_bid + best_ask) / 2.0;
    }
    return last_price;
  }

  // Price used for mark-to-market. Prefers the last trade.
  double markPrice() const { return last_price > 0.0 ? last_price : mid(); }

  // Quoted spread in basis points of mid; nullopt without a two-sided book.
  std::optional<double> quotedSpreadBps() const {
    if (best_bid <= 0.0 || best_ask <= 0.0 || best_ask < best_bid) {
      return std::nullopt;
    }
    return (best_ask - best_bid) / mid() * 10000.0;
  }
};

}  // namespace domain
}  // namespace sentinel
