#pragma once

#include "sentinel/anomaly/anomaly_detector.hpp"
#include "sentinel/audit/audit_log.hpp"
#include "sentinel/audit/reconciler.hpp"
#include "sentinel/concurrent/background_scheduler.hpp"
#include "sentinel/concurrent/cancellation.hpp"
#include "sentinel/concurrent/symbol_strand_pool.hpp"
#include "sentinel/concurrent/thread_safe_queue.hpp"
#include "sentinel/config/engine_config.hpp"
#include "sentinel/domain/ev_decision.hpp"
#include "sentinel/domain/reconciliation.hpp"
#include "sentinel/domain/trade_intent.hpp"
#include "sentinel/ev/ev_gate.hpp"
#include "sentinel/eventbus/event_bus.hpp"
#include "sentinel/execution/i_execution_venue.hpp"
#include "sentinel/execution/order_manager.hpp"
#include "sentinel/fees/fee_tax_model.hpp"
#include "sentinel/gateway/market_context_cache.hpp"
#include "sentinel/ledger/fx_converter.hpp"
#include "sentinel/ledger/position_ledger.hpp"
#include "sentinel/persistence/snapshot_store.hpp"
#include "sentinel/risk/dual_control.hpp"
#include "sentinel/risk/risk_engine.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sentinel {

// Outcome of one intent, end to end.
struct SubmissionResult {
  std::string intent_id;
  bool accepted{false};  // an order was created for this intent
  bool duplicate{false};
  domain::ReasonCode reason{domain::ReasonCode::None};
  std::string detail;
  std::optional<domain::EVDecision> decision;
  std::optional<OrderHandle> order;
};

// -----------------------------------------------------------------------------
// ExecutionRiskEngine — owns every component and runs the intent pipeline
// -----------------------------------------------------------------------------
//
// @brief  Strategies submit TradeIntents; the engine gates, sizes, checks,
//         executes and books them, and keeps the safety net running.
//
// @details
// Pipeline (process(), on the symbol's strand):
//   1. idempotency      intent id already decided → DUPLICATE_INTENT
//   2. validation       shape, strategy rules, venue → VALIDATION reasons
//   3. market context   latest snapshot for the symbol → NO_MARKET_DATA
//   4. EV gate          approve / resize / reject, audited as "ev_decision"
//   5. risk check       base-currency notional via FX → LIMIT_BREACH reasons
//   6. order manager    order, fills, ledger, all audited
// Every denial is logged, audited as "intent_denied" and published.
//
// Safety net (BackgroundScheduler):
//   signals     drain queued market/latency/clock signals into the anomaly
//               detector; anomalies go to RiskEngine::evaluate
//   marks       mark-to-market roll-up into RiskEngine::evaluate, plus a P&L
//               signal
//   reconcile   fetch venue history (bounded retry) and reconcile
//   checkpoint  snapshot risk state and positions
// Triggers reach the kill switch only through RiskEngine::evaluate.
//
// Kill switch:
//   A trip cancels the risk engine's token (in-flight orders stop booking
//   fills), then the listener audits the transition, publishes it and
//   cancels all open orders with a deadline. Unconfirmed cancels raise a
//   fatal CANCEL_TIMEOUT anomaly.
//
// Startup (start()):
//   open and verify the audit chain (broken → ChainIntegrityError, intake
//   stays closed), load the snapshot, replay fills recorded after it,
//   restore the kill switch from later transitions, rebuild orders and the
//   intent index, cancel orders left open, then start workers.
//
// Thread model:
//   submit() from any thread. process() runs on strand workers, one per
//   symbol hash. Background jobs run on the scheduler thread. Operator
//   actions (trip, reset, reconcile, verify) may come from the IPC thread.
//
// Ownership:
//   Owns all components. Venues, the FX provider, the trade history source
//   and the clock are supplied by the caller and must outlive the engine.
// -----------------------------------------------------------------------------
class ExecutionRiskEngine {
 public:
  ExecutionRiskEngine(EngineConfig config, const ITimeProvider& clock,
                      IFxRateProvider& fx_provider,
                      std::vector<IExecutionVenue*> venues,
                      ITradeHistorySource* history = nullptr);
  ~ExecutionRiskEngine();

  ExecutionRiskEngine(const ExecutionRiskEngine&) = delete;
  ExecutionRiskEngine& operator=(const ExecutionRiskEngine&) = delete;
  ExecutionRiskEngine(ExecutionRiskEngine&&) = delete;
  ExecutionRiskEngine& operator=(ExecutionRiskEngine&&) = delete;

  void start();
  void stop();

  bool running() const { return running_.load(); }
  bool acceptingIntents() const { return accepting_.load(); }
  std::string haltReason() const;

  // Queues the intent on its symbol's strand. A full strand answers
  // PIPELINE_BUSY immediately instead of blocking.
  std::future<SubmissionResult> submit(domain::TradeIntent intent);

  // Runs the pipeline on the calling thread.
  SubmissionResult process(const domain::TradeIntent& intent);

  // Market snapshot from the upstream pipeline; also feeds price, latency
  // and clock-offset signals to the anomaly detector.
  void onMarketContext(const domain::MarketContext& market);

  // Queues one signal for the anomaly job. Dropped (and logged) when the
  // queue is full.
  void observe(const Signal& signal);

  // Drains queued signals now instead of waiting for the scheduler.
  void processSignals();

  // Marks positions to market and feeds the result to the risk engine.
  void refreshMarks();

  domain::ReconciliationReport reconcileNow(
      const std::vector<domain::ExternalTrade>& external);
  std::optional<domain::ReconciliationReport> reconcileFromSource();

  DualControlResult manualTrip(const DualControlRequest& request);
  ResetResult resetKillSwitch(const DualControlRequest& request);

  void checkpoint();

  RiskEngine& risk() { return risk_; }
  const PositionLedger& ledger() const { return ledger_; }
  OrderManager& orders() { return orders_; }
  const AuditLog& audit() const { return audit_; }
  EventBus& eventBus() { return bus_; }
  MarketContextCache& markets() { return markets_; }
  AnomalyDetector& anomalies() { return anomaly_; }
  const EngineConfig& config() const { return config_; }
  PortfolioTotals totals() const;

 private:
  struct Validation {
    domain::ReasonCode reason{domain::ReasonCode::None};
    std::string detail;
  };

  bool claim(const std::string& intent_id);
  void release(const std::string& intent_id);
  SubmissionResult run(const domain::TradeIntent& intent);
  Validation validate(const domain::TradeIntent& intent) const;
  SubmissionResult deny(const domain::TradeIntent& intent,
                        const std::string& stage, domain::ReasonCode reason,
                        const std::string& detail);
  SubmissionResult duplicateOf(const domain::TradeIntent& intent);
  static SubmissionResult failure(const domain::TradeIntent& intent,
                                  domain::ReasonCode reason,
                                  const std::string& detail);
  std::string currencyFor(const std::string& symbol) const;
  PnlUpdate pnlUpdate(double realized_delta, double fee_delta) const;

  void onOrderUpdate(const domain::Order& order, domain::OrderStatus previous);
  void onFill(const domain::Fill& fill, const LedgerUpdate& update);
  void onKillSwitch(const domain::KillSwitchRecord& record);
  void handleAnomaly(const domain::AnomalyEvent& event);
  domain::ReconciliationReport reconcileWindow(
      const std::vector<domain::ExternalTrade>& external,
      domain::TimestampMs since_ms);

  void recover(std::uint64_t watermark);
  void haltIntake(const std::string& reason);

  const EngineConfig config_;
  const ITimeProvider& clock_;
  ITradeHistorySource* history_;

  FeeTaxModel fees_;
  EvGate ev_gate_;
  FxConverter fx_;
  PositionLedger ledger_;
  AuditLog audit_;
  SnapshotStore snapshots_;
  DualControl dual_control_;
  RiskEngine risk_;
  AnomalyDetector anomaly_;
  Reconciler reconciler_;
  MarketContextCache markets_;
  EventBus bus_;
  OrderManager orders_;

  ThreadSafeQueue<Signal> signals_;
  CancellationSource shutdown_;

  std::unique_ptr<SymbolStrandPool> strands_;
  std::unique_ptr<BackgroundScheduler> scheduler_;

  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  std::atomic<domain::TimestampMs> started_at_ms_{0};

  mutable std::mutex intents_mutex_;
  std::unordered_set<std::string> intents_;  // ever submitted or decided

  mutable std::mutex halt_mutex_;
  std::string halt_reason_;

  std::mutex marks_mutex_;
  std::optional<double> last_total_pnl_;
};

}  // namespace sentinel
