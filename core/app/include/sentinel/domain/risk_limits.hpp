#pragma once

#include "sentinel/domain/types.hpp"

#include <map>
#include <string>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — hard thresholds enforced before any order reaches a venue
// -----------------------------------------------------------------------------
//
// @brief  Loaded from the `risk` section of the engine config and copied into
//         RiskEngine at construction. All notionals are in base currency.
//
// @details
//   max_trade_notional       cap on a single order.
//   max_symbol_notional      cap on |exposure| per symbol after the order.
//   max_gross_notional       cap on sum of |exposure| across symbols.
//   max_daily_loss           positive number; the kill switch trips when
//                            realized + unrealized P&L for the UTC day
//                            reaches -max_daily_loss.
//   trading window           minutes after UTC midnight. start == end means
//                            trading all day; start > end wraps midnight.
//   strategy_trade_notional  optional per-strategy cap on a single order.
// -----------------------------------------------------------------------------
struct RiskLimits {
  double max_trade_notional{10000.0};
  double max_symbol_notional{50000.0};
  double max_gross_notional{100000.0};
  double max_daily_loss{1000.0};
  int trading_window_start_min{0};
  int trading_window_end_min{0};
  std::map<std::string, double> strategy_trade_notional;

  bool withinTradingWindow(TimestampMs now_ms) const {
    if (trading_window_start_min == trading_window_end_min) {
      return true;
    }
    constexpr TimestampMs kDayMs = 86400000;
    TimestampMs into_day = now_ms % kDayMs;
    if (into_day < 0) {
      into_day += kDayMs;
    }
    int minute = static_cast<int>(into_day / 60000);
    if (trading_window_start_min < trading_window_end_min) {
      return minute >= trading_window_start_min &&
             minute < trading_window_end_min;
    }
    return minute >= trading_window_start_min ||
           minute < trading_window_end_min;
  }
};

}  // namespace domain
}  // namespace sentinel
