#include "sentinel/execution/order_manager.hpp"
#include "sentinel/codec/json_codec.hpp"
#include "sentinel/concurrent/bounded_call.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <memory>
#include <set>
#include <utility>

namespace sentinel {

namespace {

constexpr double kQtyEpsilon = 1e-9;

// Slack over venue_timeout before the order manager stops waiting itself.
constexpr std::chrono::milliseconds kPlaceGrace{25};

// "F-17" → 17; 0 when the id is not one of ours.
std::uint64_t taggedNumber(const std::string& id) {
  auto dash = id.rfind('-');
  if (dash == std::string::npos || dash + 1 >= id.size()) {
    return 0;
  }
  std::uint64_t value = 0;
  for (std::size_t i = dash + 1; i < id.size(); ++i) {
    if (id[i] < '0' || id[i] > '9') {
      return 0;
    }
    value = value * 10 + static_cast<std::uint64_t>(id[i] - '0');
  }
  return value;
}

}  // namespace

OrderManager::OrderManager(const FeeTaxModel& fees, PositionLedger& ledger,
                           AuditLog& audit, const ITimeProvider& clock,
                           OrderManagerConfig config)
    : fees_(fees),
      ledger_(ledger),
      audit_(audit),
      clock_(clock),
      config_(std::move(config)) {}

void OrderManager::addVenue(IExecutionVenue& venue) {
  venues_[venue.name()] = &venue;
}

void OrderManager::setFillObserver(FillObserver observer) {
  fill_observer_ = std::move(observer);
}

void OrderManager::setOrderObserver(OrderObserver observer) {
  order_observer_ = std::move(observer);
}

// -----------------------------------------------------------------------------
// submit: NEW → venue → fills → terminal (or resting)
// -----------------------------------------------------------------------------
OrderHandle OrderManager::submit(const domain::TradeIntent& intent,
                                 const domain::EVDecision& decision,
                                 const domain::MarketContext& market,
                                 const CancellationToken& token) {
  using domain::OrderStatus;
  using domain::ReasonCode;

  domain::Order order;
  {
    std::lock_guard lock(mutex_);
    if (auto it = by_intent_.find(intent.intent_id); it != by_intent_.end()) {
      OrderHandle handle = handleFor(orders_.at(it->second));
      handle.duplicate = true;
      handle.detail = "intent already has order " + std::to_string(it->second);
      return handle;
    }

    order.id = order_ids_.next_id();
    order.intent_id = intent.intent_id;
    order.strategy_id = intent.strategy_id;
    order.symbol = intent.symbol;
    order.venue = intent.venues.empty() ? std::string() : intent.primaryVenue();
    order.side = intent.side;
    order.quantity = decision.approved_quantity;
    order.price = intent.reference_price;
    order.status = OrderStatus::New;
    order.created_ms = clock_.now_ms();
    order.updated_ms = order.created_ms;

    audit_.record("order", nlohmann::json{{"order", order},
                                          {"previous_status", nullptr},
                                          {"detail", "created"}});
    orders_.emplace(order.id, order);
    by_intent_.emplace(order.intent_id, order.id);
  }
  notifyOrder(order, OrderStatus::New);

  auto finish = [this](domain::OrderId id, std::vector<domain::Fill> fills) {
    OrderHandle handle;
    if (auto current = this->order(id)) {
      handle = handleFor(*current);
    }
    handle.fills = std::move(fills);
    return handle;
  };

  if (token.cancelled()) {
    transition(order.id, OrderStatus::Rejected, ReasonCode::KillSwitchActive,
               "kill switch tripped before placement");
    return finish(order.id, {});
  }

  IExecutionVenue* venue = venueFor(order.venue);
  if (venue == nullptr) {
    transition(order.id, OrderStatus::Rejected, ReasonCode::UnknownVenue,
               "no venue '" + order.venue + "'");
    return finish(order.id, {});
  }

  VenueResponse response;
  try {
    auto answered = callWithDeadline<VenueResponse>(
        [venue, request = VenueOrder{order, market, intent.liquidity},
         timeout = config_.venue_timeout, token] {
          return venue->place(request, timeout, token);
        },
        config_.venue_timeout + kPlaceGrace);
    if (answered) {
      response = std::move(*answered);
    } else {
      // The venue ignored its own timeout. Whatever it does later is
      // orphaned from this order; ask it to cancel and let reconciliation
      // report any execution that still lands.
      std::cerr << "[OrderManager] venue " << order.venue
                << " did not answer order " << order.id << " within "
                << config_.venue_timeout.count() << " ms\n";
      venue->cancel(order.id, nullptr);
      response.reason = ReasonCode::VenueTimeout;
      response.detail = order.venue + " did not answer within " +
                        std::to_string(config_.venue_timeout.count()) + "ms";
    }
  } catch (const std::exception& e) {
    std::cerr << "[OrderManager] venue " << order.venue
              << " threw on order " << order.id << ": " << e.what() << "\n";
    response = VenueResponse{};
    response.reason = ReasonCode::VenueRejected;
    response.detail = e.what();
  }

  if (!response.accepted) {
    ReasonCode reason = response.reason == ReasonCode::None
                            ? ReasonCode::VenueRejected
                            : response.reason;
    OrderStatus next = reason == ReasonCode::CanceledByKillSwitch
                           ? OrderStatus::Canceled
                           : OrderStatus::Rejected;
    std::cerr << "[OrderManager] order " << order.id << " "
              << domain::toString(next) << ": " << domain::toString(reason)
              << " " << response.detail << "\n";
    transition(order.id, next, reason, response.detail);
    return finish(order.id, {});
  }

  std::vector<domain::Fill> fills;
  for (const auto& execution : response.executions) {
    auto booked = bookExecution(order.id, execution, response.price_source,
                                token);
    if (!booked) {
      break;
    }
    LedgerUpdate update = ledger_.apply(booked->fill, booked->audit_sequence);
    fills.push_back(booked->fill);
    if (fill_observer_) {
      fill_observer_(booked->fill, update);
    }
  }

  auto current = this->order(order.id);
  if (current && !domain::isTerminal(current->status) &&
      current->remaining() > kQtyEpsilon) {
    if (token.cancelled()) {
      venue->cancel(order.id, nullptr);
      transition(order.id, OrderStatus::Canceled,
                 ReasonCode::CanceledByKillSwitch,
                 "kill switch tripped during execution");
    } else if (!response.resting) {
      transition(order.id, OrderStatus::Canceled,
                 ReasonCode::InsufficientLiquidity,
                 "venue returned without working the remainder");
    }
  }
  return finish(order.id, std::move(fills));
}

bool OrderManager::cancel(domain::OrderId order_id) {
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end() || domain::isTerminal(it->second.status)) {
      return false;
    }
  }
  cancelOrders({order_id}, domain::ReasonCode::CanceledByRequest,
               config_.cancel_timeout);
  auto current = order(order_id);
  return current && current->status == domain::OrderStatus::Canceled;
}

CancelSummary OrderManager::cancelAllOpen(domain::ReasonCode reason,
                                          std::chrono::milliseconds deadline) {
  std::vector<domain::OrderId> ids;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, order] : orders_) {
      if (!domain::isTerminal(order.status)) {
        ids.push_back(id);
      }
    }
  }
  std::sort(ids.begin(), ids.end());
  CancelSummary summary = cancelOrders(ids, reason, deadline);
  if (summary.requested > 0) {
    std::cout << "[OrderManager] cancel sweep: " << summary.confirmed << "/"
              << summary.requested << " confirmed.\n";
  }
  return summary;
}

// -----------------------------------------------------------------------------
// cancelOrders: fire-and-forget cancels, bounded wait for confirmations
// -----------------------------------------------------------------------------
CancelSummary OrderManager::cancelOrders(const std::vector<domain::OrderId>& ids,
                                         domain::ReasonCode reason,
                                         std::chrono::milliseconds deadline) {
  struct Confirmations {
    std::mutex mutex;
    std::condition_variable cv;
    std::set<domain::OrderId> confirmed;
  };
  // Shared with the callbacks, which may fire after we stop waiting.
  auto confirmations = std::make_shared<Confirmations>();
  const auto until = std::chrono::steady_clock::now() + deadline;

  CancelSummary summary;
  summary.requested = ids.size();

  for (domain::OrderId id : ids) {
    std::string venue_name;
    if (auto current = order(id)) {
      venue_name = current->venue;
    }
    IExecutionVenue* venue = venueFor(venue_name);
    if (venue == nullptr) {
      std::lock_guard lock(confirmations->mutex);
      confirmations->confirmed.insert(id);
      continue;
    }
    venue->cancel(id, [confirmations](const CancelConfirmation& c) {
      {
        std::lock_guard lock(confirmations->mutex);
        if (c.canceled) {
          confirmations->confirmed.insert(c.order_id);
        }
      }
      confirmations->cv.notify_all();
    });
  }

  std::set<domain::OrderId> confirmed;
  {
    std::unique_lock lock(confirmations->mutex);
    confirmations->cv.wait_until(lock, until, [&] {
      return confirmations->confirmed.size() >= ids.size();
    });
    confirmed = confirmations->confirmed;
  }

  for (domain::OrderId id : ids) {
    if (confirmed.count(id) == 0) {
      summary.unconfirmed.push_back(id);
      continue;
    }
    ++summary.confirmed;
    transition(id, domain::OrderStatus::Canceled, reason, "cancel confirmed");
  }

  if (!summary.complete()) {
    std::cerr << "[OrderManager] " << summary.unconfirmed.size()
              << " cancel(s) unconfirmed after " << deadline.count()
              << "ms\n";
  }
  return summary;
}

// -----------------------------------------------------------------------------
// recover: rebuild from the audit chain
// -----------------------------------------------------------------------------
RecoverySummary OrderManager::recover(
    const std::vector<domain::AuditEntry>& entries) {
  RecoverySummary summary;
  std::vector<domain::OrderId> open;
  {
    std::lock_guard lock(mutex_);
    domain::OrderId max_order = 0;
    std::uint64_t max_fill = 0;

    for (const auto& entry : entries) {
      if (entry.kind != "order" && entry.kind != "fill") {
        continue;
      }
      nlohmann::json data = AuditLog::payloadData(entry);
      if (!data.contains("order")) {
        continue;
      }
      auto order = data.at("order").get<domain::Order>();
      max_order = std::max(max_order, order.id);
      by_intent_[order.intent_id] = order.id;
      orders_[order.id] = order;

      if (entry.kind == "fill" && data.contains("fill")) {
        auto fill = data.at("fill").get<domain::Fill>();
        max_fill = std::max(max_fill, taggedNumber(fill.fill_id));
        fills_.push_back(std::move(fill));
      }
    }
    order_ids_.advancePast(max_order);
    fill_ids_.advancePast(max_fill);

    summary.orders = orders_.size();
    summary.fills = fills_.size();
    for (const auto& [id, order] : orders_) {
      if (!domain::isTerminal(order.status)) {
        open.push_back(id);
      }
    }
  }

  std::sort(open.begin(), open.end());
  for (domain::OrderId id : open) {
    if (transition(id, domain::OrderStatus::Canceled,
                   domain::ReasonCode::CanceledOnRecovery,
                   "open at restart")) {
      ++summary.canceled_open;
    }
  }

  std::cout << "[OrderManager] recovered " << summary.orders << " orders, "
            << summary.fills << " fills; canceled " << summary.canceled_open
            << " left open.\n";
  return summary;
}

bool OrderManager::knowsIntent(const std::string& intent_id) const {
  std::lock_guard lock(mutex_);
  return by_intent_.count(intent_id) != 0;
}

std::optional<domain::Order> OrderManager::order(domain::OrderId order_id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(order_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Order> OrderManager::orderForIntent(
    const std::string& intent_id) const {
  std::lock_guard lock(mutex_);
  auto it = by_intent_.find(intent_id);
  if (it == by_intent_.end()) {
    return std::nullopt;
  }
  return orders_.at(it->second);
}

std::vector<domain::Order> OrderManager::openOrders() const {
  std::vector<domain::Order> open;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, order] : orders_) {
      if (!domain::isTerminal(order.status)) {
        open.push_back(order);
      }
    }
  }
  std::sort(open.begin(), open.end(),
            [](const domain::Order& a, const domain::Order& b) {
              return a.id < b.id;
            });
  return open;
}

std::vector<domain::Fill> OrderManager::fills() const {
  std::lock_guard lock(mutex_);
  return fills_;
}

std::vector<domain::Fill> OrderManager::fillsSince(
    domain::TimestampMs since_ms) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Fill> out;
  for (const auto& fill : fills_) {
    if (fill.timestamp_ms >= since_ms) {
      out.push_back(fill);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// transition: audit then commit one status change
// -----------------------------------------------------------------------------
std::optional<domain::Order> OrderManager::transition(
    domain::OrderId order_id, domain::OrderStatus next,
    domain::ReasonCode reason, const std::string& detail) {
  domain::Order updated;
  domain::OrderStatus previous;
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
      return std::nullopt;
    }
    previous = it->second.status;
    if (!domain::canTransition(previous, next)) {
      return std::nullopt;
    }
    updated = it->second;
    updated.status = next;
    updated.reason = reason;
    updated.updated_ms = clock_.now_ms();

    audit_.record("order", nlohmann::json{{"order", updated},
                                          {"previous_status", previous},
                                          {"detail", detail}});
    it->second = updated;
  }
  notifyOrder(updated, previous);
  return updated;
}

std::optional<OrderManager::BookedFill> OrderManager::bookExecution(
    domain::OrderId order_id, const VenueExecution& execution,
    domain::PriceSource source, const CancellationToken& token) {
  BookedFill booked;
  domain::OrderStatus previous;
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end() || domain::isTerminal(it->second.status)) {
      return std::nullopt;
    }
    if (token.cancelled()) {
      std::cerr << "[OrderManager] kill switch tripped; dropping execution "
                << execution.venue_trade_id << " for order " << order_id
                << "\n";
      return std::nullopt;
    }

    const domain::Order& current = it->second;
    previous = current.status;
    const double qty = std::min(execution.quantity, current.remaining());
    if (qty <= kQtyEpsilon) {
      return std::nullopt;
    }

    domain::Order updated = current;
    const double filled = current.filled_quantity + qty;
    updated.average_fill_price =
        (current.average_fill_price * current.filled_quantity +
         execution.price * qty) / filled;
    updated.filled_quantity = filled;
    updated.status = updated.remaining() <= kQtyEpsilon
                         ? domain::OrderStatus::Filled
                         : domain::OrderStatus::PartiallyFilled;
    updated.updated_ms = clock_.now_ms();
    if (!domain::canTransition(previous, updated.status)) {
      return std::nullopt;
    }

    domain::Fill& fill = booked.fill;
    fill.fill_id = fill_ids_.next_tagged("F");
    fill.venue_trade_id = execution.venue_trade_id;
    fill.order_id = order_id;
    fill.intent_id = current.intent_id;
    fill.symbol = current.symbol;
    fill.venue = current.venue;
    fill.side = current.side;
    fill.price = execution.price;
    fill.quantity = qty;
    fill.fee = fees_.legCost(current.venue, execution.price * qty,
                             execution.liquidity).total();
    fill.currency = currencyFor(current.symbol);
    fill.liquidity = execution.liquidity;
    fill.price_source = source;
    fill.timestamp_ms = updated.updated_ms;

    AuditReceipt receipt = audit_.record(
        "fill", nlohmann::json{{"fill", fill},
                               {"order", updated},
                               {"previous_status", previous}});
    it->second = updated;
    fills_.push_back(fill);
    booked.audit_sequence = receipt.sequence;
    booked.order = updated;
  }
  notifyOrder(booked.order, previous);
  return booked;
}

IExecutionVenue* OrderManager::venueFor(const std::string& venue) const {
  auto it = venues_.find(venue);
  return it == venues_.end() ? nullptr : it->second;
}

std::string OrderManager::currencyFor(const std::string& symbol) const {
  auto it = config_.symbol_currency.find(symbol);
  return it == config_.symbol_currency.end() ? config_.default_currency
                                             : it->second;
}

void OrderManager::notifyOrder(const domain::Order& order,
                               domain::OrderStatus previous) {
  if (order_observer_) {
    order_observer_(order, previous);
  }
}

OrderHandle OrderManager::handleFor(const domain::Order& order) {
  OrderHandle handle;
  handle.order_id = order.id;
  handle.intent_id = order.intent_id;
  handle.status = order.status;
  handle.reason = order.reason;
  handle.filled_quantity = order.filled_quantity;
  handle.average_fill_price = order.average_fill_price;
  return handle;
}

}  // namespace sentinel
