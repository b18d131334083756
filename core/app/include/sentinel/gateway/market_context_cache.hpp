#pragma once

#include "sentinel/domain/market_context.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sentinel {

// Source of the latest market context per symbol (best bid/ask, last trade,
// depth, volatility) supplied by the upstream market-data pipeline.
class IMarketContextProvider {
 public:
  virtual ~IMarketContextProvider() = default;
  virtual std::optional<domain::MarketContext> context(
      const std::string& symbol) const = 0;
};

// -----------------------------------------------------------------------------
// MarketContextCache — last snapshot per symbol
// -----------------------------------------------------------------------------
//
// @details
// Written by the gateway thread (or directly in paper/test setups), read by
// every strand worker. A snapshot older than max_age_ms is treated as
// missing so the engine never prices an order off a dead feed; max_age_ms of
// 0 disables the check.
//
// Thread model: shared_mutex; update() exclusive, reads shared.
// -----------------------------------------------------------------------------
class MarketContextCache final : public IMarketContextProvider {
 public:
  MarketContextCache(const ITimeProvider& clock, std::int64_t max_age_ms);

  void update(const domain::MarketContext& market);

  std::optional<domain::MarketContext> context(
      const std::string& symbol) const override;

  std::optional<double> markPrice(const std::string& symbol) const;

  std::vector<std::string> symbols() const;

 private:
  const ITimeProvider& clock_;
  const std::int64_t max_age_ms_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::MarketContext> latest_;
};

}  // namespace sentinel
