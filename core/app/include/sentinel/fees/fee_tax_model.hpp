#pragma once

#include "sentinel/domain/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace sentinel {

// -----------------------------------------------------------------------------
// VenueFeeSchedule
// -----------------------------------------------------------------------------
// Rates in basis points of notional. campaign_discount_bps is subtracted from
// both maker and taker rates, floored at zero. `taxable` applies the
// transaction taxes in TaxRules to this venue's executions.
// -----------------------------------------------------------------------------
struct VenueFeeSchedule {
  std::string venue;
  double maker_bps{10.0};
  double taker_bps{10.0};
  double campaign_discount_bps{0.0};
  bool taxable{false};
};

// -----------------------------------------------------------------------------
// TaxRules
// -----------------------------------------------------------------------------
//   bsmv_bps    transaction tax on the fee-bearing notional (taxable venues).
//   stamp_bps   stamp duty on notional (taxable venues).
//   stopaj_bps  withholding on positive realized profit only.
// -----------------------------------------------------------------------------
struct TaxRules {
  double bsmv_bps{0.0};
  double stamp_bps{0.0};
  double stopaj_bps{0.0};
};

struct FeeTaxConfig {
  std::vector<VenueFeeSchedule> venues;
  TaxRules tax;
  double default_fee_bps{10.0};
};

// Fee and tax for one or more legs, in the notional's currency.
struct CostEstimate {
  double fee{0.0};
  double tax{0.0};

  double total() const { return fee + tax; }

  CostEstimate& operator+=(const CostEstimate& other) {
    fee += other.fee;
    tax += other.tax;
    return *this;
  }
};

// -----------------------------------------------------------------------------
// FeeTaxModel
// -----------------------------------------------------------------------------
//
// @brief  Deterministic fee and tax arithmetic per venue and liquidity.
//
// @details
// A pure function of its inputs and the schedule it was built with: no
// clocks, no I/O, no mutable state, so the EV gate and the paper venue can
// share one instance across threads.
//
// Round trip:
//   single venue  → the entry leg and the exit leg both pay that venue.
//   cross venue   → each listed venue pays once (buy on one, sell on the
//                   other).
//
// Unknown venues fall back to default_fee_bps and are not taxable.
// -----------------------------------------------------------------------------
class FeeTaxModel {
 public:
  explicit FeeTaxModel(FeeTaxConfig config);

  bool knowsVenue(const std::string& venue) const;

  double effectiveFeeBps(const std::string& venue,
                         domain::Liquidity liquidity) const;

  double transactionTaxBps(const std::string& venue) const;

  // Cost of one execution leg of `notional` on `venue`.
  CostEstimate legCost(const std::string& venue, double notional,
                       domain::Liquidity liquidity) const;

  // Entry + exit cost of a position of `notional`, see class comment.
  CostEstimate roundTrip(const std::vector<std::string>& venues,
                         double notional, domain::Liquidity liquidity) const;

  // Withholding on realized profit; zero for losses.
  double withholdingTax(double realized_profit) const;

  const TaxRules& taxRules() const { return tax_; }

 private:
  const VenueFeeSchedule* schedule(const std::string& venue) const;

  std::unordered_map<std::string, VenueFeeSchedule> schedules_;
  TaxRules tax_;
  double default_fee_bps_;
};

}  // namespace sentinel
