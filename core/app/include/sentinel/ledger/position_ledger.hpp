#pragma once

#include "sentinel/domain/fill.hpp"
#include "sentinel/domain/position.hpp"
#include "sentinel/ledger/fx_converter.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sentinel {

// -----------------------------------------------------------------------------
// LedgerUpdate — what one fill did to its position
// -----------------------------------------------------------------------------
// realized_pnl and fee are in the fill currency; the *_base fields are the
// same amounts in base currency (zero with fx_ok == false). applied is false
// when the fill was skipped as already folded in (replay).
// -----------------------------------------------------------------------------
struct LedgerUpdate {
  std::string symbol;
  std::string fill_id;
  bool applied{true};
  double realized_pnl{0.0};
  double fee{0.0};
  double realized_pnl_base{0.0};
  double fee_base{0.0};
  bool fx_ok{true};
  bool fx_stale{false};
  double net_quantity{0.0};
  std::size_t open_lots{0};
};

// -----------------------------------------------------------------------------
// PortfolioTotals — base-currency roll-up across every position
// -----------------------------------------------------------------------------
// symbol_exposure_base is signed (+long, -short). Symbols whose currency
// could not be converted are listed in `unpriced` and left out of the sums.
// -----------------------------------------------------------------------------
struct PortfolioTotals {
  double realized_pnl_base{0.0};
  double fees_base{0.0};
  double unrealized_pnl_base{0.0};
  double gross_exposure_base{0.0};
  std::map<std::string, double> symbol_exposure_base;
  bool fx_stale{false};
  std::vector<std::string> unpriced;
};

// -----------------------------------------------------------------------------
// PositionLedger — FIFO lot accounting per symbol
// -----------------------------------------------------------------------------
//
// @brief  Folds fills into per-symbol positions, realizing P&L lot by lot in
//         arrival order.
//
// @details
// For a fill against an opposite-signed position the oldest lot is consumed
// first; each consumed slice realizes
//     (fill_price - lot.entry_price) * consumed_qty * sign(lot)
// Whatever quantity remains after every opposite lot is gone opens a new lot
// at the fill price, which is how a position reverses through zero.
//
// apply() with a non-zero audit_sequence at or below the position's
// applied_sequence is a no-op, which makes audit replay idempotent.
//
// Thread model:
//   One mutex per symbol book plus a shared_mutex over the book map. Fills
//   for different symbols never contend; readers take shared locks.
//
// Ownership:
//   Owned by ExecutionRiskEngine. Holds a reference to the FxConverter.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  using MarkLookup = std::function<std::optional<double>(const std::string&)>;

  explicit PositionLedger(FxConverter& fx);

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;
  PositionLedger(PositionLedger&&) = delete;
  PositionLedger& operator=(PositionLedger&&) = delete;

  LedgerUpdate apply(const domain::Fill& fill,
                     std::uint64_t audit_sequence = 0);

  std::optional<domain::Position> position(const std::string& symbol) const;
  std::vector<domain::Position> snapshot() const;

  // Replaces all positions. Only valid before fills start flowing.
  void restore(const std::vector<domain::Position>& positions);

  // Unrealized P&L in quote currency at `mark`.
  static double unrealizedPnl(const domain::Position& position, double mark);

  PortfolioTotals totals(const MarkLookup& marks) const;

  // -------------------------------------------------------------------------
  // consume(position, signed_qty, price, ts)
  // -------------------------------------------------------------------------
  // @brief  Core FIFO arithmetic. Mutates lots and net_quantity.
  // @return Realized P&L of this fill, quote currency.
  // -------------------------------------------------------------------------
  static double consume(domain::Position& position, double signed_qty,
                        double price, domain::TimestampMs ts);

 private:
  struct Book {
    mutable std::mutex mutex;
    domain::Position position;
  };

  Book& bookFor(const std::string& symbol, const std::string& currency);

  FxConverter& fx_;
  mutable std::shared_mutex books_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Book>> books_;
};

}  // namespace sentinel
