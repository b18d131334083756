#pragma once

#include "sentinel/concurrent/cancellation.hpp"
#include "sentinel/domain/fill.hpp"
#include "sentinel/domain/market_context.hpp"
#include "sentinel/domain/order.hpp"
#include "sentinel/domain/reason_code.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace sentinel {

struct VenueOrder {
  domain::Order order;
  domain::MarketContext market;
  domain::Liquidity liquidity{domain::Liquidity::Taker};
};

// One execution reported by the venue. Fees are computed by the caller
// from the fee schedule, not trusted from the venue.
struct VenueExecution {
  std::string venue_trade_id;
  double price{0.0};
  double quantity{0.0};
  domain::Liquidity liquidity{domain::Liquidity::Taker};
};

struct VenueResponse {
  bool accepted{false};
  domain::ReasonCode reason{domain::ReasonCode::None};
  std::string detail;
  std::vector<VenueExecution> executions;
  bool resting{false};  // remainder left working at the venue
  domain::PriceSource price_source{domain::PriceSource::Simulated};
};

struct CancelConfirmation {
  domain::OrderId order_id{};
  bool canceled{false};
  std::string detail;
};

// -----------------------------------------------------------------------------
// IExecutionVenue — where orders go
// -----------------------------------------------------------------------------
//
// @brief  One contract for the paper venue and a live order router, so the
//         order manager (and the strategies upstream of it) cannot tell
//         paper from live.
//
// @details
// place() must return within `timeout`; a venue that cannot answer in time
// returns accepted=false with VENUE_TIMEOUT. The order manager does not rely
// on this: it stops waiting shortly after `timeout`, rejects the order with
// VENUE_TIMEOUT and sends cancel(). Order placement is never retried by the
// caller. The token is cancelled when the kill switch trips;
// implementations stop producing executions once they see it.
//
// cancel() is fire-and-forget. The confirmation callback may run on any
// thread, at most once, and possibly never (an unresponsive venue); callers
// bound their wait.
//
// Ownership:
//   The engine owns venues; OrderManager holds non-owning pointers. A place()
//   call the order manager gave up on may still be running, so a venue must
//   outlive it.
// -----------------------------------------------------------------------------
class IExecutionVenue {
 public:
  using CancelCallback = std::function<void(const CancelConfirmation&)>;

  virtual ~IExecutionVenue() = default;

  virtual const std::string& name() const = 0;

  virtual VenueResponse place(const VenueOrder& order,
                              std::chrono::milliseconds timeout,
                              const CancellationToken& token) = 0;

  virtual void cancel(domain::OrderId order_id, CancelCallback on_done) = 0;
};

}  // namespace sentinel
