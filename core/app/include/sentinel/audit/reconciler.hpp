#pragma once

#include "sentinel/concurrent/retry_policy.hpp"
#include "sentinel/domain/fill.hpp"
#include "sentinel/domain/reconciliation.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace sentinel {

// -----------------------------------------------------------------------------
// ITradeHistorySource — the venue's authoritative record of our trades
// -----------------------------------------------------------------------------
//
// @brief  Returns every trade executed for us since `since_ms`, or
//         std::nullopt if the venue could not be reached within `timeout`.
//
// @details
// Implementations wrap a venue REST endpoint (live) or replay a file (tests,
// paper). The call is idempotent, so the engine retries it with backoff.
//
// Thread model: called from the background scheduler thread only.
// Ownership: the engine holds a non-owning pointer; the caller owns it.
// -----------------------------------------------------------------------------
class ITradeHistorySource {
 public:
  virtual ~ITradeHistorySource() = default;

  virtual std::optional<std::vector<domain::ExternalTrade>> fetchTrades(
      domain::TimestampMs since_ms, std::chrono::milliseconds timeout) = 0;
};

struct ReconciliationConfig {
  double price_tolerance{0.01};
  double quantity_tolerance{0.0001};
  std::chrono::milliseconds interval{std::chrono::minutes(5)};
  std::chrono::milliseconds fetch_timeout{std::chrono::seconds(5)};
  std::int64_t lookback_ms{24 * 60 * 60 * 1000};
  RetryPolicy fetch_retry{};
};

// -----------------------------------------------------------------------------
// Reconciler
// -----------------------------------------------------------------------------
//
// @brief  Compares internal fills with the venue's trade list.
//
// @details
// Matching key is the venue trade id (Fill::venue_trade_id, falling back to
// fill_id when a venue does not supply one). For each matched pair, side
// must agree and price/quantity must agree within tolerance. Unmatched
// trades on either side are discrepancies. Ids are matched one record to
// one record: two fills booked against a single venue trade leave one fill
// MissingExternal, and the reverse leaves a MissingInternal. The report
// passes only when there are no discrepancies.
//
// Pure: no I/O, no clock. The engine supplies `now_ms` and decides what a
// failure triggers.
// -----------------------------------------------------------------------------
class Reconciler {
 public:
  explicit Reconciler(ReconciliationConfig config);

  domain::ReconciliationReport reconcile(
      const std::vector<domain::Fill>& internal,
      const std::vector<domain::ExternalTrade>& external,
      domain::TimestampMs now_ms) const;

  const ReconciliationConfig& config() const { return config_; }

 private:
  ReconciliationConfig config_;
};

}  // namespace sentinel
