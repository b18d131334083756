#pragma once

#include "sentinel/audit/audit_log.hpp"
#include "sentinel/concurrent/cancellation.hpp"
#include "sentinel/concurrent/sequence_generator.hpp"
#include "sentinel/domain/audit_entry.hpp"
#include "sentinel/domain/ev_decision.hpp"
#include "sentinel/domain/fill.hpp"
#include "sentinel/domain/market_context.hpp"
#include "sentinel/domain/order.hpp"
#include "sentinel/domain/trade_intent.hpp"
#include "sentinel/execution/i_execution_venue.hpp"
#include "sentinel/fees/fee_tax_model.hpp"
#include "sentinel/ledger/position_ledger.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sentinel {

struct OrderManagerConfig {
  std::chrono::milliseconds venue_timeout{500};
  std::chrono::milliseconds cancel_timeout{2000};
  std::string default_currency{"USD"};
  std::map<std::string, std::string> symbol_currency;  // quote currency
};

// What submit() hands back to the caller.
struct OrderHandle {
  domain::OrderId order_id{};
  std::string intent_id;
  domain::OrderStatus status{domain::OrderStatus::New};
  domain::ReasonCode reason{domain::ReasonCode::None};
  std::string detail;
  double filled_quantity{0.0};
  double average_fill_price{0.0};
  std::vector<domain::Fill> fills;
  bool duplicate{false};
};

struct CancelSummary {
  std::size_t requested{0};
  std::size_t confirmed{0};
  std::vector<domain::OrderId> unconfirmed;

  bool complete() const { return unconfirmed.empty(); }
};

struct RecoverySummary {
  std::size_t orders{0};
  std::size_t fills{0};
  std::size_t canceled_open{0};
};

// -----------------------------------------------------------------------------
// OrderManager — paper/shadow OMS
// -----------------------------------------------------------------------------
//
// @brief  Turns an approved intent into an Order, sends it to a venue, and
//         books every execution as a Fill in the audit log and the ledger.
//
// @details
// Lifecycle (domain::canTransition is the only authority):
//
//   NEW → PARTIALLY_FILLED* → FILLED | CANCELED | REJECTED
//
// Each transition writes exactly one audit entry:
//   "order"  creation (NEW), CANCELED, REJECTED
//            data: {order, previous_status, detail}
//   "fill"   every execution; the order snapshot carries the resulting
//            PARTIALLY_FILLED or FILLED status
//            data: {fill, order, previous_status}
// The in-memory table is updated only after the audit write succeeds, so a
// PersistenceError leaves memory and disk in agreement.
//
// Fill path, per execution:
//   1. under mutex_: refuse if the order is terminal or the token is
//      cancelled, audit, update the table
//   2. ledger.apply(fill, audit sequence)
//   3. FillObserver
// The engine calls submit() on the symbol's strand, so fills of one symbol
// reach the ledger in the order they were produced.
//
// Idempotency:
//   An intent id seen before (including ones rebuilt by recover()) returns
//   the existing order with duplicate=true and produces no side effects.
//
// Cancellation:
//   cancelAllOpen() sends fire-and-forget cancels to the venues and waits
//   for confirmations up to a deadline. Confirmed orders become CANCELED;
//   the rest are reported in CancelSummary::unconfirmed.
//
// Thread model:
//   submit(), cancel() and cancelAllOpen() may run concurrently. Venue
//   calls and observers run without mutex_ held.
//
// Ownership:
//   Non-owning references to the fee model, ledger, audit log and clock;
//   non-owning pointers to venues. All must outlive the manager.
// -----------------------------------------------------------------------------
class OrderManager {
 public:
  using FillObserver =
      std::function<void(const domain::Fill&, const LedgerUpdate&)>;
  using OrderObserver =
      std::function<void(const domain::Order&, domain::OrderStatus previous)>;

  OrderManager(const FeeTaxModel& fees, PositionLedger& ledger,
               AuditLog& audit, const ITimeProvider& clock,
               OrderManagerConfig config);

  OrderManager(const OrderManager&) = delete;
  OrderManager& operator=(const OrderManager&) = delete;
  OrderManager(OrderManager&&) = delete;
  OrderManager& operator=(OrderManager&&) = delete;

  // Setup only; call before the first submit().
  void addVenue(IExecutionVenue& venue);
  void setFillObserver(FillObserver observer);
  void setOrderObserver(OrderObserver observer);

  OrderHandle submit(const domain::TradeIntent& intent,
                     const domain::EVDecision& decision,
                     const domain::MarketContext& market,
                     const CancellationToken& token);

  // Cancels one working order and waits up to cancel_timeout. Returns true
  // if the order is CANCELED afterwards.
  bool cancel(domain::OrderId order_id);

  CancelSummary cancelAllOpen(domain::ReasonCode reason,
                              std::chrono::milliseconds deadline);

  // Rebuilds orders, fills and the intent index from audit entries, then
  // cancels orders a crash left open (CANCELED_ON_RECOVERY).
  RecoverySummary recover(const std::vector<domain::AuditEntry>& entries);

  bool knowsIntent(const std::string& intent_id) const;
  std::optional<domain::Order> order(domain::OrderId order_id) const;
  std::optional<domain::Order> orderForIntent(const std::string& intent_id) const;
  std::vector<domain::Order> openOrders() const;
  std::vector<domain::Fill> fills() const;
  std::vector<domain::Fill> fillsSince(domain::TimestampMs since_ms) const;

 private:
  struct BookedFill {
    domain::Fill fill;
    std::uint64_t audit_sequence{0};
    domain::Order order;
  };

  std::optional<domain::Order> transition(domain::OrderId order_id,
                                          domain::OrderStatus next,
                                          domain::ReasonCode reason,
                                          const std::string& detail);
  std::optional<BookedFill> bookExecution(domain::OrderId order_id,
                                          const VenueExecution& execution,
                                          domain::PriceSource source,
                                          const CancellationToken& token);
  CancelSummary cancelOrders(const std::vector<domain::OrderId>& ids,
                             domain::ReasonCode reason,
                             std::chrono::milliseconds deadline);
  IExecutionVenue* venueFor(const std::string& venue) const;
  std::string currencyFor(const std::string& symbol) const;
  void notifyOrder(const domain::Order& order, domain::OrderStatus previous);
  static OrderHandle handleFor(const domain::Order& order);

  const FeeTaxModel& fees_;
  PositionLedger& ledger_;
  AuditLog& audit_;
  const ITimeProvider& clock_;
  const OrderManagerConfig config_;

  std::unordered_map<std::string, IExecutionVenue*> venues_;
  FillObserver fill_observer_;
  OrderObserver order_observer_;

  SequenceGenerator order_ids_;
  SequenceGenerator fill_ids_;

  mutable std::mutex mutex_;
  std::unordered_map<domain::OrderId, domain::Order> orders_;
  std::unordered_map<std::string, domain::OrderId> by_intent_;
  std::vector<domain::Fill> fills_;
};

}  // namespace sentinel
