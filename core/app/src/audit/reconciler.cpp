#include "sentinel/audit/reconciler.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace sentinel {

Reconciler::Reconciler(ReconciliationConfig config)
    : config_(std::move(config)) {}

// -----------------------------------------------------------------------------
// reconcile: key both sides by trade id, then diff
// -----------------------------------------------------------------------------
domain::ReconciliationReport Reconciler::reconcile(
    const std::vector<domain::Fill>& internal,
    const std::vector<domain::ExternalTrade>& external,
    domain::TimestampMs now_ms) const {
  using domain::Discrepancy;
  using domain::DiscrepancyKind;

  domain::ReconciliationReport report;
  report.timestamp_ms = now_ms;
  report.internal_count = internal.size();
  report.external_count = external.size();

  // std::map keeps discrepancy order stable across runs. A trade id may
  // appear more than once on either side; each record needs its own match.
  std::map<std::string, std::vector<const domain::Fill*>> ours;
  for (const auto& fill : internal) {
    const std::string& key =
        fill.venue_trade_id.empty() ? fill.fill_id : fill.venue_trade_id;
    ours[key].push_back(&fill);
  }
  std::map<std::string, std::vector<const domain::ExternalTrade*>> theirs;
  for (const auto& trade : external) {
    theirs[trade.trade_id].push_back(&trade);
  }

  for (const auto& [id, fills] : ours) {
    auto it = theirs.find(id);
    const std::size_t paired =
        it == theirs.end() ? 0 : std::min(fills.size(), it->second.size());

    for (std::size_t i = 0; i < paired; ++i) {
      const domain::Fill& fill = *fills[i];
      const domain::ExternalTrade& trade = *it->second[i];
      bool matched = true;

      if (fill.side != trade.side) {
        report.discrepancies.push_back(
            Discrepancy{id, DiscrepancyKind::SideMismatch,
                        domain::sideSign(fill.side),
                        domain::sideSign(trade.side)});
        matched = false;
      }
      if (std::abs(fill.price - trade.price) > config_.price_tolerance) {
        report.discrepancies.push_back(Discrepancy{
            id, DiscrepancyKind::PriceMismatch, fill.price, trade.price});
        matched = false;
      }
      if (std::abs(fill.quantity - trade.quantity) >
          config_.quantity_tolerance) {
        report.discrepancies.push_back(Discrepancy{
            id, DiscrepancyKind::QuantityMismatch, fill.quantity,
            trade.quantity});
        matched = false;
      }
      if (matched) {
        ++report.matched_count;
      }
    }

    // Booked more often than the venue reports it.
    for (std::size_t i = paired; i < fills.size(); ++i) {
      report.discrepancies.push_back(Discrepancy{
          id, DiscrepancyKind::MissingExternal, fills[i]->quantity, 0.0});
    }
  }

  for (const auto& [id, trades] : theirs) {
    auto it = ours.find(id);
    const std::size_t booked = it == ours.end() ? 0 : it->second.size();
    for (std::size_t i = booked; i < trades.size(); ++i) {
      report.discrepancies.push_back(Discrepancy{
          id, DiscrepancyKind::MissingInternal, 0.0, trades[i]->quantity});
    }
  }

  return report;
}

}  // namespace sentinel
