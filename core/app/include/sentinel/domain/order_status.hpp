#pragma once

#include <optional>
#include <string>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — lifecycle of an order
// -----------------------------------------------------------------------------
//
//        New ──────────────► Filled
//         │  ╲                 ▲
//         │   ► PartiallyFilled┤ (self-loop on further partials)
//         │         │          │
//         ▼         ▼          │
//      Rejected   Canceled ◄───┘ (New may also cancel)
//
// Filled, Canceled and Rejected are terminal. canTransition() is the single
// authority on which moves are legal; OrderManager refuses anything else.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  New,
  PartiallyFilled,
  Filled,
  Canceled,
  Rejected,
};

inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled || status == OrderStatus::Canceled ||
         status == OrderStatus::Rejected;
}

inline bool canTransition(OrderStatus from, OrderStatus to) {
  using S = OrderStatus;
  switch (from) {
    case S::New:
      return to == S::PartiallyFilled || to == S::Filled ||
             to == S::Canceled || to == S::Rejected;
    case S::PartiallyFilled:
      return to == S::PartiallyFilled || to == S::Filled || to == S::Canceled;
    case S::Filled:
    case S::Canceled:
    case S::Rejected:
      return false;
  }
  return false;
}

inline const char* toString(OrderStatus status) {
  switch (status) {
    case OrderStatus::New:             return "NEW";
    case OrderStatus::PartiallyFilled: return "PARTIALLY_FILLED";
    case OrderStatus::Filled:          return "FILLED";
    case OrderStatus::Canceled:        return "CANCELED";
    case OrderStatus::Rejected:        return "REJECTED";
  }
  return "UNKNOWN";
}

inline std::optional<OrderStatus> orderStatusFromString(const std::string& s) {
  if (s == "NEW") return OrderStatus::New;
  if (s == "PARTIALLY_FILLED") return OrderStatus::PartiallyFilled;
  if (s == "FILLED") return OrderStatus::Filled;
  if (s == "CANCELED") return OrderStatus::Canceled;
  if (s == "REJECTED") return OrderStatus::Rejected;
  return std::nullopt;
}

}  // namespace domain
}  // namespace sentinel
