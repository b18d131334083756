#include "sentinel/gateway/market_context_cache.hpp"

#include <algorithm>
#include <mutex>

namespace sentinel {

MarketContextCache::MarketContextCache(const ITimeProvider& clock,
                                       std::int64_t max_age_ms)
    : clock_(clock), max_age_ms_(max_age_ms) {}

void MarketContextCache::update(const domain::MarketContext& market) {
  std::unique_lock lock(mutex_);
  latest_[market.symbol] = market;
}

std::optional<domain::MarketContext> MarketContextCache::context(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = latest_.find(symbol);
  if (it == latest_.end()) {
    return std::nullopt;
  }
  if (max_age_ms_ > 0 && it->second.as_of_ms > 0 &&
      clock_.now_ms() - it->second.as_of_ms > max_age_ms_) {
    return std::nullopt;
  }
  return it->second;
}

// Marks ignore staleness: an old price is a better mark than none.
std::optional<double> MarketContextCache::markPrice(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = latest_.find(symbol);
  if (it == latest_.end() || it->second.markPrice() <= 0.0) {
    return std::nullopt;
  }
  return it->second.markPrice();
}

std::vector<std::string> MarketContextCache::symbols() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> out;
  out.reserve(latest_.size());
  for (const auto& [symbol, market] : latest_) {
    out.push_back(symbol);
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace sentinel
