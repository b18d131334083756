#include "sentinel/engine/execution_risk_engine.hpp"
#include "sentinel/codec/json_codec.hpp"
#include "sentinel/concurrent/retry_policy.hpp"
#include "sentinel/domain/errors.hpp"
#include "sentinel/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <utility>

namespace sentinel {

namespace {

bool countsTowardFillRate(domain::ReasonCode reason) {
  using domain::ReasonCode;
  return reason != ReasonCode::KillSwitchActive &&
         reason != ReasonCode::CanceledByKillSwitch &&
         reason != ReasonCode::CanceledOnRecovery &&
         reason != ReasonCode::UnknownVenue;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ExecutionRiskEngine::ExecutionRiskEngine(EngineConfig config,
                                         const ITimeProvider& clock,
                                         IFxRateProvider& fx_provider,
                                         std::vector<IExecutionVenue*> venues,
                                         ITradeHistorySource* history)
    : config_(std::move(config)),
      clock_(clock),
      history_(history),
      fees_(config_.fees),
      ev_gate_(config_.ev_gate),
      fx_(fx_provider, clock, config_.base_currency, config_.fx),
      ledger_(fx_),
      audit_(config_.persistence.audit_path, clock),
      snapshots_(config_.persistence.snapshot_path),
      dual_control_(config_.operators, config_.required_operators),
      risk_(config_.risk, clock, dual_control_),
      anomaly_(config_.anomaly),
      reconciler_(config_.reconciliation),
      markets_(clock, config_.pipeline.market_max_age_ms),
      orders_(fees_, ledger_, audit_, clock, config_.orders),
      signals_(config_.pipeline.signal_queue_capacity) {
  for (IExecutionVenue* venue : venues) {
    if (venue != nullptr) {
      orders_.addVenue(*venue);
    }
  }
  orders_.setFillObserver(
      [this](const domain::Fill& fill, const LedgerUpdate& update) {
        onFill(fill, update);
      });
  orders_.setOrderObserver(
      [this](const domain::Order& order, domain::OrderStatus previous) {
        onOrderUpdate(order, previous);
      });
  risk_.addListener(
      [this](const domain::KillSwitchRecord& record) { onKillSwitch(record); });
}

ExecutionRiskEngine::~ExecutionRiskEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void ExecutionRiskEngine::start() {
  if (running_.load()) {
    return;
  }

  // ---  1) Audit chain must verify before anything else ---------------------
  try {
    audit_.open();
  } catch (const ChainIntegrityError& e) {
    haltIntake(e.what());
    throw;
  }
  const ChainVerification verification = audit_.verify();
  if (!verification.valid) {
    std::string detail = "audit chain broken";
    if (verification.first_invalid_index) {
      detail += " at index " + std::to_string(*verification.first_invalid_index);
    }
    if (!verification.detail.empty()) {
      detail += ": " + verification.detail;
    }
    haltIntake(detail);
    throw ChainIntegrityError(detail);
  }

  // ---  2) Snapshot, then everything appended after it ----------------------
  std::uint64_t watermark = 0;
  if (auto snapshot = snapshots_.load()) {
    risk_.restore(snapshot->risk);
    ledger_.restore(snapshot->positions);
    watermark = snapshot->audit_sequence;
    std::cout << "[ExecutionRiskEngine] snapshot loaded at sequence "
              << watermark << " with " << snapshot->positions.size()
              << " position(s).\n";
  }
  recover(watermark);

  // ---  3) Workers ----------------------------------------------------------
  started_at_ms_.store(clock_.now_ms());
  strands_ = std::make_unique<SymbolStrandPool>(config_.pipeline.strand_count,
                                                config_.pipeline.queue_capacity);
  strands_->start();

  scheduler_ = std::make_unique<BackgroundScheduler>();
  scheduler_->addJob("signals", config_.pipeline.signal_interval, [this] {
    try {
      processSignals();
    } catch (const PersistenceError& e) {
      haltIntake(e.what());
    }
  });
  scheduler_->addJob("marks", config_.pipeline.mark_interval,
                     [this] { refreshMarks(); });
  if (history_ != nullptr) {
    scheduler_->addJob("reconcile", config_.reconciliation.interval, [this] {
      try {
        reconcileFromSource();
      } catch (const PersistenceError& e) {
        haltIntake(e.what());
      }
    });
  }
  if (snapshots_.enabled()) {
    scheduler_->addJob("checkpoint", config_.persistence.checkpoint_interval,
                       [this] {
                         try {
                           checkpoint();
                         } catch (const PersistenceError& e) {
                           std::cerr << "[ExecutionRiskEngine] checkpoint "
                                        "failed: "
                                     << e.what() << "\n";
                         }
                       });
  }
  scheduler_->start();

  running_.store(true);
  {
    std::lock_guard lock(halt_mutex_);
    accepting_.store(halt_reason_.empty());
  }

  std::cout << "[ExecutionRiskEngine] started. kill switch "
            << domain::toString(risk_.state().kill_switch) << ", "
            << audit_.size() << " audit entries, intake "
            << (accepting_.load() ? "open" : "closed") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ExecutionRiskEngine::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  accepting_.store(false);
  shutdown_.cancel();

  // Background jobs first so nothing new is appended behind the strands.
  scheduler_->stop();
  strands_->stop();

  try {
    checkpoint();
  } catch (const PersistenceError& e) {
    std::cerr << "[ExecutionRiskEngine] final checkpoint failed: " << e.what()
              << "\n";
  }
  audit_.close();

  std::cout << "[ExecutionRiskEngine] stopped.\n";
}

std::string ExecutionRiskEngine::haltReason() const {
  std::lock_guard lock(halt_mutex_);
  return halt_reason_;
}

// -----------------------------------------------------------------------------
// submit(): claim the intent id, then hand off to the symbol's strand
// -----------------------------------------------------------------------------
std::future<SubmissionResult> ExecutionRiskEngine::submit(
    domain::TradeIntent intent) {
  auto promise = std::make_shared<std::promise<SubmissionResult>>();
  auto future = promise->get_future();

  if (!accepting_.load()) {
    std::string reason = haltReason();
    promise->set_value(failure(intent, domain::ReasonCode::EngineNotReady,
                               reason.empty() ? "engine not started" : reason));
    return future;
  }

  try {
    if (!claim(intent.intent_id)) {
      promise->set_value(duplicateOf(intent));
      return future;
    }

    const std::string symbol = intent.symbol;
    const std::string intent_id = intent.intent_id;
    const bool posted = strands_->post(
        symbol, [this, promise, intent = std::move(intent)]() {
          try {
            promise->set_value(run(intent));
          } catch (const PersistenceError& e) {
            haltIntake(e.what());
            promise->set_exception(std::current_exception());
          } catch (const std::exception& e) {
            std::cerr << "[ExecutionRiskEngine] intent " << intent.intent_id
                      << " failed: " << e.what() << "\n";
            promise->set_exception(std::current_exception());
          }
        });

    if (!posted) {
      release(intent_id);
      domain::TradeIntent rejected;
      rejected.intent_id = intent_id;
      rejected.symbol = symbol;
      promise->set_value(deny(rejected, "pipeline",
                              domain::ReasonCode::PipelineBusy,
                              "strand queue full"));
    }
  } catch (const PersistenceError& e) {
    haltIntake(e.what());
    promise->set_exception(std::current_exception());
  }
  return future;
}

SubmissionResult ExecutionRiskEngine::process(
    const domain::TradeIntent& intent) {
  if (!claim(intent.intent_id)) {
    return duplicateOf(intent);
  }
  return run(intent);
}

// -----------------------------------------------------------------------------
// run(): the pipeline proper. Caller holds the intent id claim.
// -----------------------------------------------------------------------------
SubmissionResult ExecutionRiskEngine::run(const domain::TradeIntent& intent) {
  // ---  1) Idempotency: a claim can still collide with a recovered order ----
  if (orders_.knowsIntent(intent.intent_id)) {
    return duplicateOf(intent);
  }

  // ---  2) Validation --------------------------------------------------------
  Validation validation = validate(intent);
  if (validation.reason != domain::ReasonCode::None) {
    return deny(intent, "validation", validation.reason, validation.detail);
  }

  // ---  3) Market context -----------------------------------------------------
  auto market = markets_.context(intent.symbol);
  if (!market) {
    return deny(intent, "market", domain::ReasonCode::NoMarketData,
                "no current market context for " + intent.symbol);
  }

  // ---  4) EV gate: produced exactly once, audited before anything else ------
  domain::EVDecision decision = ev_gate_.evaluate(intent, fees_, *market);
  audit_.record("ev_decision", nlohmann::json{{"decision", decision},
                                              {"symbol", intent.symbol},
                                              {"strategy_id",
                                               intent.strategy_id}});
  bus_.publish(EvDecisionEvent{intent.symbol, intent.strategy_id, decision});

  if (!decision.approved()) {
    SubmissionResult result =
        deny(intent, "ev", decision.reason,
             "EV " + std::to_string(decision.expected_value) +
                 " below threshold");
    result.decision = decision;
    return result;
  }

  // ---  5) Risk check on the sized trade, in base currency -------------------
  domain::TradeIntent sized = intent;
  sized.quantity = decision.approved_quantity;
  const std::string currency = currencyFor(intent.symbol);
  FxConversion notional = fx_.toBase(sized.notional(), currency);
  if (!notional.ok) {
    SubmissionResult result =
        deny(intent, "risk", domain::ReasonCode::NoMarketData,
             "no FX rate " + currency + "/" + config_.base_currency);
    result.decision = decision;
    return result;
  }
  if (notional.stale) {
    std::cerr << "[ExecutionRiskEngine] stale FX rate " << currency << "/"
              << config_.base_currency << " used for " << intent.intent_id
              << "\n";
  }

  RiskDecision risk = risk_.check(sized, notional.value);
  if (!risk.allowed) {
    SubmissionResult result = deny(intent, "risk", risk.reason, risk.detail);
    result.decision = decision;
    return result;
  }

  // ---  6) Execution ----------------------------------------------------------
  OrderHandle handle =
      orders_.submit(intent, decision, *market, risk_.cancellationToken());

  SubmissionResult result;
  result.intent_id = intent.intent_id;
  result.accepted = !handle.duplicate;
  result.duplicate = handle.duplicate;
  result.reason = handle.reason;
  result.detail = handle.detail;
  result.decision = decision;
  result.order = std::move(handle);
  return result;
}

// -----------------------------------------------------------------------------
// validate()
// -----------------------------------------------------------------------------
ExecutionRiskEngine::Validation ExecutionRiskEngine::validate(
    const domain::TradeIntent& intent) const {
  using domain::ReasonCode;

  if (intent.intent_id.empty() || intent.strategy_id.empty() ||
      intent.symbol.empty()) {
    return {ReasonCode::InvalidIntent, "intent id, strategy and symbol required"};
  }
  if (!std::isfinite(intent.quantity) || intent.quantity <= 0.0) {
    return {ReasonCode::InvalidIntent, "quantity must be positive"};
  }
  if (!std::isfinite(intent.reference_price) || intent.reference_price <= 0.0) {
    return {ReasonCode::InvalidIntent, "reference price must be positive"};
  }
  if (intent.venues.empty()) {
    return {ReasonCode::InvalidIntent, "at least one venue required"};
  }

  // An empty strategy table means no per-strategy rules are configured.
  if (!config_.strategies.empty()) {
    const StrategyConfig* strategy = config_.strategy(intent.strategy_id);
    if (strategy == nullptr) {
      return {ReasonCode::UnknownStrategy,
              "strategy '" + intent.strategy_id + "' is not configured"};
    }
    if (!strategy->enabled) {
      return {ReasonCode::StrategyDisabled,
              "strategy '" + intent.strategy_id + "' is disabled"};
    }
    if (!strategy->allows(intent.symbol)) {
      return {ReasonCode::SymbolNotAllowed,
              intent.symbol + " not allowed for " + intent.strategy_id};
    }
  }

  for (const auto& venue : intent.venues) {
    if (!fees_.knowsVenue(venue)) {
      return {ReasonCode::UnknownVenue, "venue '" + venue + "' not configured"};
    }
  }
  return {};
}

// -----------------------------------------------------------------------------
// Intent bookkeeping
// -----------------------------------------------------------------------------
bool ExecutionRiskEngine::claim(const std::string& intent_id) {
  std::lock_guard lock(intents_mutex_);
  return intents_.insert(intent_id).second;
}

void ExecutionRiskEngine::release(const std::string& intent_id) {
  std::lock_guard lock(intents_mutex_);
  intents_.erase(intent_id);
}

SubmissionResult ExecutionRiskEngine::deny(const domain::TradeIntent& intent,
                                           const std::string& stage,
                                           domain::ReasonCode reason,
                                           const std::string& detail) {
  const auto now = clock_.now_ms();
  std::cerr << "[ExecutionRiskEngine] intent " << intent.intent_id
            << " denied at " << stage << ": " << domain::toString(reason)
            << (detail.empty() ? "" : " (" + detail + ")") << "\n";

  audit_.record("intent_denied", nlohmann::json{{"intent_id", intent.intent_id},
                                                {"strategy_id",
                                                 intent.strategy_id},
                                                {"symbol", intent.symbol},
                                                {"stage", stage},
                                                {"reason", reason},
                                                {"detail", detail}});
  bus_.publish(IntentDeniedEvent{intent.intent_id, intent.symbol, reason,
                                 detail, now});
  return failure(intent, reason, detail);
}

SubmissionResult ExecutionRiskEngine::duplicateOf(
    const domain::TradeIntent& intent) {
  SubmissionResult result =
      deny(intent, "idempotency", domain::ReasonCode::DuplicateIntent,
           "intent id already submitted");
  result.duplicate = true;

  if (auto order = orders_.orderForIntent(intent.intent_id)) {
    OrderHandle handle;
    handle.order_id = order->id;
    handle.intent_id = order->intent_id;
    handle.status = order->status;
    handle.reason = order->reason;
    handle.filled_quantity = order->filled_quantity;
    handle.average_fill_price = order->average_fill_price;
    handle.duplicate = true;
    for (const auto& fill : orders_.fills()) {
      if (fill.order_id == order->id) {
        handle.fills.push_back(fill);
      }
    }
    result.order = std::move(handle);
  }
  return result;
}

SubmissionResult ExecutionRiskEngine::failure(const domain::TradeIntent& intent,
                                              domain::ReasonCode reason,
                                              const std::string& detail) {
  SubmissionResult result;
  result.intent_id = intent.intent_id;
  result.reason = reason;
  result.detail = detail;
  return result;
}

std::string ExecutionRiskEngine::currencyFor(const std::string& symbol) const {
  auto it = config_.orders.symbol_currency.find(symbol);
  if (it != config_.orders.symbol_currency.end()) {
    return it->second;
  }
  return config_.orders.default_currency;
}

// -----------------------------------------------------------------------------
// Market input and anomaly signals
// -----------------------------------------------------------------------------
void ExecutionRiskEngine::onMarketContext(const domain::MarketContext& market) {
  markets_.update(market);

  const auto now = clock_.now_ms();
  const double price = market.markPrice();
  if (price > 0.0) {
    observe(Signal{SignalType::Price, market.symbol, price, now});
  }
  if (market.latency_ms > 0.0) {
    observe(Signal{SignalType::Latency, market.symbol, market.latency_ms, now});
  }
  if (market.as_of_ms > 0) {
    observe(Signal{SignalType::ClockOffset, market.symbol,
                   static_cast<double>(now - market.as_of_ms), now});
  }
}

void ExecutionRiskEngine::observe(const Signal& signal) {
  if (!signals_.try_push(signal)) {
    std::cerr << "[ExecutionRiskEngine] signal queue full, dropped "
              << toString(signal.type) << " " << signal.key << "\n";
  }
}

void ExecutionRiskEngine::processSignals() {
  while (auto signal = signals_.try_pop()) {
    if (auto event = anomaly_.observe(*signal)) {
      handleAnomaly(*event);
    }
  }
}

void ExecutionRiskEngine::handleAnomaly(const domain::AnomalyEvent& event) {
  std::cerr << "[ExecutionRiskEngine] anomaly " << domain::toString(event.type)
            << " on " << event.key << " (streak " << event.consecutive_count
            << (event.fatal ? ", fatal" : "")
            << (event.triggered_pause ? ", auto-pause" : "") << ")\n";
  audit_.record("anomaly", nlohmann::json(event));
  bus_.publish(AnomalyDetectedEvent{event});
  risk_.evaluate(event);
}

// -----------------------------------------------------------------------------
// Marks: mark-to-market roll-up through the normal evaluate() path
// -----------------------------------------------------------------------------
PortfolioTotals ExecutionRiskEngine::totals() const {
  return ledger_.totals(
      [this](const std::string& symbol) { return markets_.markPrice(symbol); });
}

PnlUpdate ExecutionRiskEngine::pnlUpdate(double realized_delta,
                                         double fee_delta) const {
  PortfolioTotals t = totals();
  PnlUpdate update;
  update.realized_pnl_delta = realized_delta;
  update.fee_delta = fee_delta;
  update.unrealized_pnl = t.unrealized_pnl_base;
  update.gross_exposure = t.gross_exposure_base;
  update.symbol_exposure = std::move(t.symbol_exposure_base);
  update.fx_stale = t.fx_stale;
  return update;
}

void ExecutionRiskEngine::refreshMarks() {
  PortfolioTotals t = totals();
  risk_.evaluate(pnlUpdate(0.0, 0.0));

  const double total_pnl =
      t.realized_pnl_base + t.unrealized_pnl_base - t.fees_base;
  std::lock_guard lock(marks_mutex_);
  if (last_total_pnl_) {
    observe(Signal{SignalType::Pnl, "portfolio", total_pnl - *last_total_pnl_,
                   clock_.now_ms()});
  }
  last_total_pnl_ = total_pnl;
}

// -----------------------------------------------------------------------------
// Order manager observers (called on the strand, outside OrderManager locks)
// -----------------------------------------------------------------------------
void ExecutionRiskEngine::onFill(const domain::Fill& fill,
                                 const LedgerUpdate& update) {
  if (!update.fx_ok) {
    std::cerr << "[ExecutionRiskEngine] fill " << fill.fill_id
              << " booked without an FX rate for " << fill.currency << "\n";
  }
  bus_.publish(FillEvent{fill, update.realized_pnl, update.net_quantity});
  risk_.evaluate(pnlUpdate(update.realized_pnl_base, update.fee_base));
}

void ExecutionRiskEngine::onOrderUpdate(const domain::Order& order,
                                        domain::OrderStatus previous) {
  bus_.publish(OrderUpdateEvent{order, previous});

  if (!domain::isTerminal(order.status) || domain::isTerminal(previous) ||
      !countsTowardFillRate(order.reason)) {
    return;
  }
  const bool filled = order.filled_quantity > 0.0;
  double slippage_bps = 0.0;
  if (filled && order.price > 0.0) {
    slippage_bps =
        std::abs(order.average_fill_price - order.price) / order.price * 1e4;
  }
  ev_gate_.recordFillResult(filled, slippage_bps);
}

// -----------------------------------------------------------------------------
// onKillSwitch(): every transition is audited and published; a trip sweeps
// open orders within the configured deadline.
// -----------------------------------------------------------------------------
void ExecutionRiskEngine::onKillSwitch(const domain::KillSwitchRecord& record) {
  try {
    audit_.record("kill_switch", nlohmann::json(record));
    bus_.publish(KillSwitchEvent{record});

    if (record.state_after != domain::KillSwitchState::Tripped) {
      anomaly_.reset();
      return;
    }

    std::cerr << "[ExecutionRiskEngine] CRITICAL: kill switch TRIPPED ("
              << (record.trigger ? domain::toString(*record.trigger) : "?")
              << "): " << record.reason << "\n";

    CancelSummary summary =
        orders_.cancelAllOpen(domain::ReasonCode::CanceledByKillSwitch,
                              config_.pipeline.kill_cancel_deadline);
    audit_.record("cancel_sweep",
                  nlohmann::json{{"requested", summary.requested},
                                 {"confirmed", summary.confirmed},
                                 {"unconfirmed", summary.unconfirmed}});

    if (!summary.complete()) {
      domain::AnomalyEvent event = anomaly_.raise(
          domain::AnomalyType::CancelTimeout, "orders",
          static_cast<double>(summary.unconfirmed.size()),
          std::to_string(summary.unconfirmed.size()) +
              " cancel(s) unconfirmed after " +
              std::to_string(config_.pipeline.kill_cancel_deadline.count()) +
              "ms",
          clock_.now_ms(), true);
      handleAnomaly(event);
    }
  } catch (const PersistenceError& e) {
    haltIntake(e.what());
  }
}

// -----------------------------------------------------------------------------
// Reconciliation
// -----------------------------------------------------------------------------
domain::ReconciliationReport ExecutionRiskEngine::reconcileNow(
    const std::vector<domain::ExternalTrade>& external) {
  return reconcileWindow(external, started_at_ms_.load());
}

std::optional<domain::ReconciliationReport>
ExecutionRiskEngine::reconcileFromSource() {
  if (history_ == nullptr) {
    return std::nullopt;
  }
  const auto& cfg = config_.reconciliation;
  const domain::TimestampMs since =
      std::max(clock_.now_ms() - cfg.lookback_ms, started_at_ms_.load());

  auto fetched = retryWithBackoff(
      cfg.fetch_retry, shutdown_.token(),
      [&]() -> std::optional<std::vector<domain::ExternalTrade>> {
        try {
          return history_->fetchTrades(since, cfg.fetch_timeout);
        } catch (const std::exception& e) {
          std::cerr << "[ExecutionRiskEngine] trade history fetch failed: "
                    << e.what() << "\n";
          return std::nullopt;
        }
      });
  if (!fetched) {
    std::cerr << "[ExecutionRiskEngine] trade history unavailable after "
              << cfg.fetch_retry.max_attempts
              << " attempt(s); reconciliation skipped.\n";
    return std::nullopt;
  }
  return reconcileWindow(*fetched, since);
}

domain::ReconciliationReport ExecutionRiskEngine::reconcileWindow(
    const std::vector<domain::ExternalTrade>& external,
    domain::TimestampMs since_ms) {
  const auto now = clock_.now_ms();
  domain::ReconciliationReport report =
      reconciler_.reconcile(orders_.fillsSince(since_ms), external, now);
  audit_.record("reconciliation", nlohmann::json(report));
  bus_.publish(ReconciliationEvent{report});

  if (report.passed()) {
    std::cout << "[ExecutionRiskEngine] reconciliation PASSED: "
              << report.matched_count << " matched.\n";
    return report;
  }

  std::cerr << "[ExecutionRiskEngine] reconciliation FAILED: "
            << report.discrepancies.size() << " discrepancies\n";
  domain::AnomalyEvent event = anomaly_.raise(
      domain::AnomalyType::ReconciliationFailure, "reconciliation",
      static_cast<double>(report.discrepancies.size()),
      std::to_string(report.discrepancies.size()) + " discrepancies, " +
          std::to_string(report.matched_count) + " matched",
      now, true);
  handleAnomaly(event);
  return report;
}

// -----------------------------------------------------------------------------
// Operator actions
// -----------------------------------------------------------------------------
DualControlResult ExecutionRiskEngine::manualTrip(
    const DualControlRequest& request) {
  DualControlResult approval = dual_control_.verify(request);
  audit_.record("operator_action",
                nlohmann::json{{"action", "kill"},
                               {"approved", approval.approved},
                               {"operators", approval.operators},
                               {"detail", approval.detail}});
  if (!approval.approved) {
    std::cerr << "[ExecutionRiskEngine] manual kill refused: "
              << approval.detail << "\n";
    return approval;
  }
  risk_.evaluate(ManualTrip{
      request.reason.empty() ? "operator kill" : request.reason,
      approval.operators});
  return approval;
}

ResetResult ExecutionRiskEngine::resetKillSwitch(
    const DualControlRequest& request) {
  ResetResult result = risk_.reset(request);
  audit_.record("operator_action",
                nlohmann::json{{"action", "reset"},
                               {"approved", result.ok},
                               {"operators", result.operators},
                               {"detail", result.detail}});
  return result;
}

// -----------------------------------------------------------------------------
// checkpoint(): the watermark is read first. Fills booked while the snapshot
// is taken may be missing from its positions or its daily P&L; recover()
// does not trust either for them.
// -----------------------------------------------------------------------------
void ExecutionRiskEngine::checkpoint() {
  if (!snapshots_.enabled()) {
    return;
  }
  EngineSnapshot snapshot;
  snapshot.audit_sequence = audit_.lastSequence();
  snapshot.risk = risk_.state();
  snapshot.positions = ledger_.snapshot();
  snapshot.taken_at_ms = clock_.now_ms();
  snapshots_.save(snapshot);
}

// -----------------------------------------------------------------------------
// recover(): bring the snapshot up to the end of the chain
// -----------------------------------------------------------------------------
//
// Every fill in the chain is offered to the ledger; a position skips the ones
// its applied_sequence already covers. Today's realized P&L is recomputed
// from the chain on a scratch ledger rather than taken from the snapshot.
// -----------------------------------------------------------------------------
void ExecutionRiskEngine::recover(std::uint64_t watermark) {
  const auto entries = audit_.entries();
  const auto today = utc_day(clock_.now_ms());

  PositionLedger day_ledger{fx_};
  double realized_today = 0.0;
  double fees_today = 0.0;
  std::size_t replayed = 0;
  std::optional<domain::KillSwitchRecord> last_switch;
  std::uint64_t last_switch_sequence = 0;
  std::vector<std::string> seen;

  for (const auto& entry : entries) {
    if (entry.kind == "ev_decision") {
      nlohmann::json data = AuditLog::payloadData(entry);
      seen.push_back(data.at("decision").value("intent_id", ""));
    } else if (entry.kind == "intent_denied") {
      nlohmann::json data = AuditLog::payloadData(entry);
      if (data.value("stage", "") != "pipeline") {
        seen.push_back(data.value("intent_id", ""));
      }
    } else if (entry.kind == "fill") {
      auto fill = AuditLog::payloadData(entry).at("fill").get<domain::Fill>();
      if (ledger_.apply(fill, entry.sequence).applied) {
        ++replayed;
      }
      LedgerUpdate update = day_ledger.apply(fill, entry.sequence);
      if (utc_day(fill.timestamp_ms) == today) {
        realized_today += update.realized_pnl_base;
        fees_today += update.fee_base;
      }
    } else if (entry.kind == "kill_switch") {
      last_switch =
          AuditLog::payloadData(entry).get<domain::KillSwitchRecord>();
      last_switch_sequence = entry.sequence;
    }
  }

  domain::RiskState state = risk_.state();
  if (last_switch) {
    if (last_switch->state_after == domain::KillSwitchState::Tripped) {
      state.kill_switch = domain::KillSwitchState::Tripped;
      state.trip_trigger = last_switch->trigger;
      state.trip_reason = last_switch->reason;
      state.tripped_at_ms = last_switch->timestamp_ms;
    } else {
      state.kill_switch = domain::KillSwitchState::Armed;
      state.trip_trigger.reset();
      state.trip_reason.clear();
      state.tripped_at_ms = 0;
    }
    if (last_switch_sequence > watermark) {
      state.history.push_back(*last_switch);
      while (state.history.size() > domain::RiskState::kSwitchHistoryLimit) {
        state.history.pop_front();
      }
    }
  }
  state.trading_day = today;
  state.daily_realized_pnl = realized_today - fees_today;
  risk_.restore(state);

  {
    std::lock_guard lock(intents_mutex_);
    for (auto& id : seen) {
      if (!id.empty()) {
        intents_.insert(std::move(id));
      }
    }
  }

  orders_.recover(entries);
  risk_.evaluate(pnlUpdate(0.0, 0.0));

  std::cout << "[ExecutionRiskEngine] replayed " << replayed
            << " fill(s) beyond the snapshot at sequence " << watermark
            << "; realized today " << realized_today - fees_today << ".\n";
}

void ExecutionRiskEngine::haltIntake(const std::string& reason) {
  accepting_.store(false);
  {
    std::lock_guard lock(halt_mutex_);
    halt_reason_ = reason;
  }
  std::cerr << "[ExecutionRiskEngine] CRITICAL: intake halted: " << reason
            << "\n";
}

}  // namespace sentinel
