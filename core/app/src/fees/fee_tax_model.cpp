#include "sentinel/fees/fee_tax_model.hpp"

#include <algorithm>
#include <utility>

namespace sentinel {

namespace {

constexpr double kBps = 10000.0;

}  // namespace

FeeTaxModel::FeeTaxModel(FeeTaxConfig config)
    : tax_(config.tax), default_fee_bps_(config.default_fee_bps) {
  for (auto& venue : config.venues) {
    std::string key = venue.venue;
    schedules_.emplace(std::move(key), std::move(venue));
  }
}

bool FeeTaxModel::knowsVenue(const std::string& venue) const {
  return schedules_.count(venue) != 0;
}

const VenueFeeSchedule* FeeTaxModel::schedule(const std::string& venue) const {
  auto it = schedules_.find(venue);
  return it == schedules_.end() ? nullptr : &it->second;
}

// -----------------------------------------------------------------------------
// effectiveFeeBps: base rate for the liquidity side, minus campaign discount
// -----------------------------------------------------------------------------
double FeeTaxModel::effectiveFeeBps(const std::string& venue,
                                    domain::Liquidity liquidity) const {
  const VenueFeeSchedule* s = schedule(venue);
  if (s == nullptr) {
    return default_fee_bps_;
  }
  double base = liquidity == domain::Liquidity::Maker ? s->maker_bps
                                                      : s->taker_bps;
  return std::max(0.0, base - s->campaign_discount_bps);
}

double FeeTaxModel::transactionTaxBps(const std::string& venue) const {
  const VenueFeeSchedule* s = schedule(venue);
  if (s == nullptr || !s->taxable) {
    return 0.0;
  }
  return tax_.bsmv_bps + tax_.stamp_bps;
}

CostEstimate FeeTaxModel::legCost(const std::string& venue, double notional,
                                  domain::Liquidity liquidity) const {
  double abs_notional = notional < 0.0 ? -notional : notional;
  CostEstimate cost;
  cost.fee = abs_notional * effectiveFeeBps(venue, liquidity) / kBps;
  cost.tax = abs_notional * transactionTaxBps(venue) / kBps;
  return cost;
}

// -----------------------------------------------------------------------------
// roundTrip: two legs on one venue, or one leg on each venue
// -----------------------------------------------------------------------------
CostEstimate FeeTaxModel::roundTrip(const std::vector<std::string>& venues,
                                    double notional,
                                    domain::Liquidity liquidity) const {
  CostEstimate total;
  if (venues.empty()) {
    return total;
  }
  if (venues.size() == 1) {
    total += legCost(venues.front(), notional, liquidity);
    total += legCost(venues.front(), notional, liquidity);
    return total;
  }
  for (const auto& venue : venues) {
    total += legCost(venue, notional, liquidity);
  }
  return total;
}

double FeeTaxModel::withholdingTax(double realized_profit) const {
  if (realized_profit <= 0.0) {
    return 0.0;
  }
  return realized_profit * tax_.stopaj_bps / kBps;
}

}  // namespace sentinel
