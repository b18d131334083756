#include "sentinel/ledger/position_ledger.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace sentinel {

namespace {

// Quantities below this are treated as zero when closing lots.
constexpr double kQtyEpsilon = 1e-9;

double signOf(double value) { return value >= 0.0 ? 1.0 : -1.0; }

}  // namespace

PositionLedger::PositionLedger(FxConverter& fx) : fx_(fx) {}

// -----------------------------------------------------------------------------
// bookFor: find or create, upgrading to an exclusive lock only on creation
// -----------------------------------------------------------------------------
PositionLedger::Book& PositionLedger::bookFor(const std::string& symbol,
                                              const std::string& currency) {
  {
    std::shared_lock lock(books_mutex_);
    auto it = books_.find(symbol);
    if (it != books_.end()) {
      return *it->second;
    }
  }
  std::unique_lock lock(books_mutex_);
  auto& slot = books_[symbol];
  if (!slot) {
    slot = std::make_unique<Book>();
    slot->position.symbol = symbol;
    slot->position.currency = currency;
  }
  return *slot;
}

// -----------------------------------------------------------------------------
// consume: FIFO close against opposite lots, open the remainder
// -----------------------------------------------------------------------------
double PositionLedger::consume(domain::Position& position, double signed_qty,
                               double price, domain::TimestampMs ts) {
  double remaining = signed_qty;
  double realized = 0.0;

  while (std::abs(remaining) > kQtyEpsilon && !position.lots.empty() &&
         signOf(position.lots.front().quantity) != signOf(remaining)) {
    domain::Lot& lot = position.lots.front();
    const double lot_sign = signOf(lot.quantity);
    const double closed = std::min(std::abs(lot.quantity), std::abs(remaining));

    realized += (price - lot.entry_price) * closed * lot_sign;
    lot.quantity -= lot_sign * closed;
    remaining += lot_sign * closed;

    if (std::abs(lot.quantity) <= kQtyEpsilon) {
      position.lots.pop_front();
    }
  }

  if (std::abs(remaining) > kQtyEpsilon) {
    position.lots.push_back(domain::Lot{remaining, price, ts});
  }

  position.net_quantity += signed_qty;
  if (std::abs(position.net_quantity) <= kQtyEpsilon) {
    position.net_quantity = 0.0;
  }
  position.realized_pnl += realized;
  return realized;
}

// -----------------------------------------------------------------------------
// apply: fold one fill into its symbol book
// -----------------------------------------------------------------------------
LedgerUpdate PositionLedger::apply(const domain::Fill& fill,
                                   std::uint64_t audit_sequence) {
  LedgerUpdate update;
  update.symbol = fill.symbol;
  update.fill_id = fill.fill_id;

  Book& book = bookFor(fill.symbol, fill.currency);
  {
    std::lock_guard lock(book.mutex);
    domain::Position& pos = book.position;

    if (audit_sequence != 0 && audit_sequence <= pos.applied_sequence) {
      update.applied = false;
      update.net_quantity = pos.net_quantity;
      update.open_lots = pos.lots.size();
      return update;
    }

    update.realized_pnl =
        consume(pos, fill.signedQuantity(), fill.price, fill.timestamp_ms);
    update.fee = fill.fee;
    pos.fees_accrued += fill.fee;
    if (audit_sequence != 0) {
      pos.applied_sequence = audit_sequence;
    }
    update.net_quantity = pos.net_quantity;
    update.open_lots = pos.lots.size();
  }

  FxConversion fx = fx_.rate(fill.currency);
  update.fx_ok = fx.ok;
  update.fx_stale = fx.stale;
  if (fx.ok) {
    update.realized_pnl_base = update.realized_pnl * fx.rate;
    update.fee_base = update.fee * fx.rate;
  } else {
    std::cerr << "[PositionLedger] fill " << fill.fill_id
              << " booked without base-currency conversion ("
              << fill.currency << ")\n";
  }
  return update;
}

std::optional<domain::Position> PositionLedger::position(
    const std::string& symbol) const {
  std::shared_lock lock(books_mutex_);
  auto it = books_.find(symbol);
  if (it == books_.end()) {
    return std::nullopt;
  }
  std::lock_guard book_lock(it->second->mutex);
  return it->second->position;
}

std::vector<domain::Position> PositionLedger::snapshot() const {
  std::shared_lock lock(books_mutex_);
  std::vector<domain::Position> result;
  result.reserve(books_.size());
  for (const auto& [symbol, book] : books_) {
    std::lock_guard book_lock(book->mutex);
    result.push_back(book->position);
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Position& a, const domain::Position& b) {
              return a.symbol < b.symbol;
            });
  return result;
}

void PositionLedger::restore(const std::vector<domain::Position>& positions) {
  std::unique_lock lock(books_mutex_);
  books_.clear();
  for (const auto& pos : positions) {
    auto book = std::make_unique<Book>();
    book->position = pos;
    books_[pos.symbol] = std::move(book);
  }
}

double PositionLedger::unrealizedPnl(const domain::Position& position,
                                     double mark) {
  double pnl = 0.0;
  for (const auto& lot : position.lots) {
    pnl += (mark - lot.entry_price) * lot.quantity;
  }
  return pnl;
}

// -----------------------------------------------------------------------------
// totals: convert each position to base and sum
// -----------------------------------------------------------------------------
PortfolioTotals PositionLedger::totals(const MarkLookup& marks) const {
  PortfolioTotals result;
  for (const auto& pos : snapshot()) {
    FxConversion fx = fx_.rate(pos.currency);
    if (!fx.ok) {
      result.unpriced.push_back(pos.symbol);
      continue;
    }
    result.fx_stale = result.fx_stale || fx.stale;

    std::optional<double> mark = marks ? marks(pos.symbol) : std::nullopt;
    double price = mark.value_or(pos.averageEntryPrice());

    double exposure = pos.net_quantity * price * fx.rate;
    result.realized_pnl_base += pos.realized_pnl * fx.rate;
    result.fees_base += pos.fees_accrued * fx.rate;
    result.unrealized_pnl_base += unrealizedPnl(pos, price) * fx.rate;
    result.gross_exposure_base += std::abs(exposure);
    if (exposure != 0.0) {
      result.symbol_exposure_base[pos.symbol] = exposure;
    }
  }
  return result;
}

}  // namespace sentinel
