#pragma once

#include "sentinel/domain/types.hpp"

#include <string>

namespace sentinel {
namespace domain {

// Where a fill price came from. Recovered fills were rebuilt from the audit
// log after a restart.
enum class PriceSource {
  Simulated,
  Venue,
  Recovered,
};

inline const char* toString(PriceSource source) {
  switch (source) {
    case PriceSource::Simulated: return "SIMULATED";
    case PriceSource::Venue:     return "VENUE";
    case PriceSource::Recovered: return "RECOVERED";
  }
  return "UNKNOWN";
}

inline PriceSource priceSourceFromString(const std::string& text) {
  if (text == "VENUE") return PriceSource::Venue;
  if (text == "RECOVERED") return PriceSource::Recovered;
  return PriceSource::Simulated;
}

// -----------------------------------------------------------------------------
// Fill
// -----------------------------------------------------------------------------
//
// @brief  One execution against an order. Immutable once recorded.
//
// @details
// fill_id is engine-assigned; venue_trade_id is the venue's identifier and is
// the matching key for reconciliation. fee is in `currency`, which is also
// the quote currency of the price.
// -----------------------------------------------------------------------------
struct Fill {
  std::string fill_id;
  std::string venue_trade_id;
  OrderId order_id{};
  std::string intent_id;
  std::string symbol;
  std::string venue;
  Side side{Side::Buy};
  double price{0.0};
  double quantity{0.0};
  double fee{0.0};
  std::string currency;
  Liquidity liquidity{Liquidity::Taker};
  PriceSource price_source{PriceSource::Simulated};
  TimestampMs timestamp_ms{0};

  double signedQuantity() const { return quantity * sideSign(side); }
  double notional() const { return quantity * price; }
};

}  // namespace domain
}  // namespace sentinel
