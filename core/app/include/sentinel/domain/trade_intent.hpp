#pragma once

#include "sentinel/domain/types.hpp"

#include <string>
#include <vector>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// TradeIntent — a strategy's request to trade
// -----------------------------------------------------------------------------
//
// @brief  The only input to the execution pipeline. Produced upstream by a
//         strategy, never mutated once handed to the engine.
//
// @details
// venues[0] is where the order is routed. A second venue marks a cross-venue
// trade: its fees are counted once per venue instead of twice on one venue.
//
// expected_spread_bps is the edge the strategy expects to capture per unit,
// in basis points of reference_price. The EV gate multiplies it by the
// estimated fill probability.
//
// intent_id is the idempotency key. Submitting the same id twice returns the
// first result and performs no further side effects.
// -----------------------------------------------------------------------------
struct TradeIntent {
  std::string intent_id;
  std::string strategy_id;
  std::string symbol;
  Side side{Side::Buy};
  double quantity{0.0};
  double reference_price{0.0};
  std::vector<std::string> venues;
  double expected_spread_bps{0.0};
  Liquidity liquidity{Liquidity::Taker};
  TimestampMs timestamp_ms{0};

  const std::string& primaryVenue() const { return venues.front(); }
  double notional() const { return quantity * reference_price; }
};

}  // namespace domain
}  // namespace sentinel
