#pragma once

#include "sentinel/audit/reconciler.hpp"
#include "sentinel/concurrent/sequence_generator.hpp"
#include "sentinel/concurrent/thread_safe_queue.hpp"
#include "sentinel/execution/i_execution_venue.hpp"
#include "sentinel/execution/slippage_model.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sentinel {

struct PaperVenueConfig {
  int max_slices{4};
  double participation_rate{0.25};  // max share of book_depth per slice
  std::chrono::milliseconds simulated_latency{0};
  double reject_probability{0.0};
  std::uint32_t seed{42};
  std::chrono::milliseconds cancel_latency{5};
};

// -----------------------------------------------------------------------------
// PaperVenue — simulated exchange for paper and shadow trading
// -----------------------------------------------------------------------------
//
// @brief  Fills orders against the supplied market context with slippage,
//         slicing, injected latency and injected failures.
//
// @details
// Fill model:
//   - An order is split into at most max_slices executions, each capped at
//     participation_rate * book_depth. Whatever is left after the last slice
//     rests at the venue (resting=true) until canceled.
//   - Each slice is priced by SlippageModel using the cumulative size taken
//     so far, so later slices fill at worse prices.
//   - The cancellation token is checked before every slice.
//
// Failure injection:
//   setDown(true)               → VENUE_DOWN
//   simulated latency > timeout → VENUE_TIMEOUT (after waiting `timeout`)
//   reject_probability          → VENUE_REJECTED (seeded, reproducible)
//   setCancelResponsive(false)  → cancel requests are never confirmed
//
// Every execution is also kept in a trade history so the venue can act as
// the external ground truth for reconciliation in paper mode.
//
// Thread model:
//   place() may be called from several strand workers at once; shared state
//   is guarded by mutex_. Cancel confirmations are delivered from an internal
//   worker thread after cancel_latency.
//
// Ownership:
//   Owns its cancel worker. Holds a const reference to the clock.
// -----------------------------------------------------------------------------
class PaperVenue final : public IExecutionVenue, public ITradeHistorySource {
 public:
  PaperVenue(std::string name, const ITimeProvider& clock,
             SlippageModel slippage, PaperVenueConfig config);
  ~PaperVenue() override;

  PaperVenue(const PaperVenue&) = delete;
  PaperVenue& operator=(const PaperVenue&) = delete;
  PaperVenue(PaperVenue&&) = delete;
  PaperVenue& operator=(PaperVenue&&) = delete;

  const std::string& name() const override { return name_; }

  VenueResponse place(const VenueOrder& order,
                      std::chrono::milliseconds timeout,
                      const CancellationToken& token) override;

  void cancel(domain::OrderId order_id, CancelCallback on_done) override;

  std::optional<std::vector<domain::ExternalTrade>> fetchTrades(
      domain::TimestampMs since_ms,
      std::chrono::milliseconds timeout) override;

  void setDown(bool down) { down_.store(down); }
  void setLatency(std::chrono::milliseconds latency) {
    latency_ms_.store(latency.count());
  }
  void setCancelResponsive(bool responsive) {
    cancel_responsive_.store(responsive);
  }
  // Makes fetchTrades() answer nullopt, as a venue whose history endpoint
  // is unreachable would.
  void setHistoryAvailable(bool available) {
    history_available_.store(available);
  }

  std::size_t restingCount() const;

 private:
  struct CancelRequest {
    domain::OrderId order_id{};
    CancelCallback on_done;
  };

  void cancelLoop();

  const std::string name_;
  const ITimeProvider& clock_;
  const SlippageModel slippage_;
  const PaperVenueConfig config_;

  std::atomic<bool> down_{false};
  std::atomic<std::int64_t> latency_ms_;
  std::atomic<bool> cancel_responsive_{true};
  std::atomic<bool> history_available_{true};

  mutable std::mutex mutex_;
  std::mt19937 rng_;
  std::unordered_map<domain::OrderId, double> resting_;
  std::vector<domain::ExternalTrade> history_;
  SequenceGenerator trade_ids_;

  ThreadSafeQueue<CancelRequest> cancel_queue_;
  std::thread cancel_worker_;
};

}  // namespace sentinel
