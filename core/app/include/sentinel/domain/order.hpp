#pragma once

#include "sentinel/domain/order_status.hpp"
#include "sentinel/domain/reason_code.hpp"
#include "sentinel/domain/types.hpp"

#include <string>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  An order as tracked by OrderManager: what was asked for plus where
//         it currently stands.
//
// @details
// Created in status New when an approved intent passes risk. The authoritative
// copy lives inside OrderManager; everything else (events, audit payloads,
// API responses) receives value snapshots.
//
// average_fill_price is the quantity-weighted price across all fills so far.
// reason is set on Rejected and Canceled.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  std::string intent_id;
  std::string strategy_id;
  std::string symbol;
  std::string venue;
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};
  OrderStatus status{OrderStatus::New};
  double filled_quantity{0.0};
  double average_fill_price{0.0};
  ReasonCode reason{ReasonCode::None};
  TimestampMs created_ms{0};
  TimestampMs updated_ms{0};

  double remaining() const {
    double left = quantity - filled_quantity;
    return left > 0.0 ? left : 0.0;
  }
};

}  // namespace domain
}  // namespace sentinel
