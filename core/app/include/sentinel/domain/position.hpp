#pragma once

#include "sentinel/domain/types.hpp"

#include <cmath>
#include <cstdint>
#include <deque>
#include <string>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// Lot — one open slice of a position
// -----------------------------------------------------------------------------
// quantity is signed (+long, -short). All lots of a position share a sign.
// -----------------------------------------------------------------------------
struct Lot {
  double quantity{0.0};
  double entry_price{0.0};
  TimestampMs opened_ms{0};
};

// -----------------------------------------------------------------------------
// Position — FIFO lot book for one symbol
// -----------------------------------------------------------------------------
//
// @brief  Open lots in arrival order plus accumulated realized P&L and fees.
//
// @details
// Closing quantity always consumes the oldest lot first. Invariant: the sum
// of lot quantities equals net_quantity. PositionLedger maintains both so the
// invariant is checkable rather than true by construction.
//
// realized_pnl and fees_accrued are in `currency` (the symbol's quote
// currency), not the engine base currency. Conversion happens at read time.
//
// applied_sequence is the audit sequence of the last fill folded into this
// position. Recovery replays only fills above it.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  std::string currency;
  std::deque<Lot> lots;
  double net_quantity{0.0};
  double realized_pnl{0.0};
  double fees_accrued{0.0};
  std::uint64_t applied_sequence{0};

  double lotQuantity() const {
    double total = 0.0;
    for (const auto& lot : lots) {
      total += lot.quantity;
    }
    return total;
  }

  // Sum of |qty| * entry over open lots.
  double costBasis() const {
    double total = 0.0;
    for (const auto& lot : lots) {
      total += std::abs(lot.quantity) * lot.entry_price;
    }
    return total;
  }

  double averageEntryPrice() const {
    double qty = std::abs(lotQuantity());
    return qty > 0.0 ? costBasis() / qty : 0.0;
  }

  bool flat() const { return lots.empty(); }
};

}  // namespace domain
}  // namespace sentinel
