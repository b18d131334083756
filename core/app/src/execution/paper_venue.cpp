#include "sentinel/execution/paper_venue.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace sentinel {

namespace {
constexpr double kQtyEpsilon = 1e-9;
}  // namespace

PaperVenue::PaperVenue(std::string name, const ITimeProvider& clock,
                       SlippageModel slippage, PaperVenueConfig config)
    : name_(std::move(name)),
      clock_(clock),
      slippage_(slippage),
      config_(config),
      latency_ms_(config.simulated_latency.count()),
      rng_(config.seed) {
  cancel_worker_ = std::thread([this] { cancelLoop(); });
}

PaperVenue::~PaperVenue() {
  cancel_queue_.close();
  if (cancel_worker_.joinable()) {
    cancel_worker_.join();
  }
}

// -----------------------------------------------------------------------------
// place: inject failures, then slice the order against the book
// -----------------------------------------------------------------------------
VenueResponse PaperVenue::place(const VenueOrder& request,
                                std::chrono::milliseconds timeout,
                                const CancellationToken& token) {
  using domain::ReasonCode;
  VenueResponse response;
  response.price_source = domain::PriceSource::Simulated;
  const domain::Order& order = request.order;

  if (down_.load()) {
    response.reason = ReasonCode::VenueDown;
    response.detail = name_ + " is down";
    return response;
  }

  const auto latency = std::chrono::milliseconds(latency_ms_.load());
  if (latency > timeout) {
    std::this_thread::sleep_for(timeout);
    response.reason = ReasonCode::VenueTimeout;
    response.detail = name_ + " did not answer within " +
                      std::to_string(timeout.count()) + "ms";
    return response;
  }
  if (latency.count() > 0) {
    std::this_thread::sleep_for(latency);
  }

  if (token.cancelled()) {
    response.reason = ReasonCode::CanceledByKillSwitch;
    response.detail = "cancelled before placement";
    return response;
  }

  const domain::MarketContext& market = request.market;
  if (market.book_depth <= 0.0 || order.quantity <= 0.0) {
    response.reason = ReasonCode::InsufficientLiquidity;
    response.detail = "no depth for " + order.symbol;
    return response;
  }

  std::lock_guard lock(mutex_);

  if (config_.reject_probability > 0.0) {
    std::bernoulli_distribution reject(config_.reject_probability);
    if (reject(rng_)) {
      response.reason = ReasonCode::VenueRejected;
      response.detail = name_ + " rejected order " + std::to_string(order.id);
      return response;
    }
  }

  response.accepted = true;
  const double slice_cap = market.book_depth * config_.participation_rate;
  double remaining = order.quantity;
  double taken = 0.0;

  for (int slice = 0; slice < config_.max_slices && remaining > kQtyEpsilon;
       ++slice) {
    if (token.cancelled()) {
      break;
    }
    const double qty = std::min(remaining, slice_cap);
    if (qty <= kQtyEpsilon) {
      break;
    }
    taken += qty;
    remaining -= qty;

    const double bps = slippage_.estimateBps(taken, market);
    VenueExecution execution;
    execution.venue_trade_id = name_ + "-T" + std::to_string(trade_ids_.next_id());
    execution.price = slippage_.fillPrice(order.side, order.price, market, bps);
    execution.quantity = qty;
    execution.liquidity = request.liquidity;
    response.executions.push_back(execution);

    history_.push_back(domain::ExternalTrade{
        execution.venue_trade_id, order.symbol, order.side, execution.price,
        execution.quantity, clock_.now_ms()});
  }

  if (remaining > kQtyEpsilon) {
    response.resting = true;
    resting_[order.id] = remaining;
  }
  return response;
}

void PaperVenue::cancel(domain::OrderId order_id, CancelCallback on_done) {
  if (!cancel_queue_.push(CancelRequest{order_id, std::move(on_done)})) {
    std::cerr << "[PaperVenue] " << name_
              << " cancel worker stopped; cancel for order " << order_id
              << " dropped\n";
  }
}

std::optional<std::vector<domain::ExternalTrade>> PaperVenue::fetchTrades(
    domain::TimestampMs since_ms, std::chrono::milliseconds /*timeout*/) {
  if (!history_available_.load()) {
    return std::nullopt;
  }
  std::lock_guard lock(mutex_);
  std::vector<domain::ExternalTrade> trades;
  for (const auto& trade : history_) {
    if (trade.timestamp_ms >= since_ms) {
      trades.push_back(trade);
    }
  }
  return trades;
}

std::size_t PaperVenue::restingCount() const {
  std::lock_guard lock(mutex_);
  return resting_.size();
}

// -----------------------------------------------------------------------------
// cancelLoop: deliver confirmations off the caller's thread
// -----------------------------------------------------------------------------
void PaperVenue::cancelLoop() {
  while (true) {
    auto request = cancel_queue_.pop_for(std::chrono::milliseconds(10));
    if (!request) {
      if (cancel_queue_.closed()) {
        return;
      }
      continue;
    }
    if (!cancel_responsive_.load()) {
      continue;
    }
    if (config_.cancel_latency.count() > 0) {
      std::this_thread::sleep_for(config_.cancel_latency);
    }

    CancelConfirmation confirmation;
    confirmation.order_id = request->order_id;
    confirmation.canceled = true;
    {
      std::lock_guard lock(mutex_);
      if (resting_.erase(request->order_id) == 0) {
        confirmation.detail = "not working";
      }
    }
    if (request->on_done) {
      request->on_done(confirmation);
    }
  }
}

}  // namespace sentinel
