#pragma once

#include "sentinel/anomaly/anomaly_detector.hpp"
#include "sentinel/audit/reconciler.hpp"
#include "sentinel/domain/risk_limits.hpp"
#include "sentinel/ev/ev_gate.hpp"
#include "sentinel/execution/order_manager.hpp"
#include "sentinel/execution/paper_venue.hpp"
#include "sentinel/execution/slippage_model.hpp"
#include "sentinel/fees/fee_tax_model.hpp"
#include "sentinel/ledger/fx_converter.hpp"
#include "sentinel/risk/dual_control.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sentinel {

// Per-strategy rules. An empty allowed_symbols list allows every symbol.
struct StrategyConfig {
  std::string id;
  bool enabled{true};
  std::vector<std::string> allowed_symbols;
  double max_trade_notional{0.0};  // 0: only the global cap applies

  bool allows(const std::string& symbol) const;
};

struct FxRateConfig {
  std::string from;
  std::string to;
  double rate{0.0};
};

struct PersistenceConfig {
  std::string audit_path;     // empty: in-memory chain
  std::string snapshot_path;  // empty: no snapshots
  std::chrono::milliseconds checkpoint_interval{60000};
};

struct IpcConfig {
  bool enabled{false};
  std::string rep_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
  std::string market_endpoint;  // empty: no market-context gateway
};

struct PipelineConfig {
  std::size_t strand_count{4};
  std::size_t queue_capacity{1024};
  std::chrono::milliseconds kill_cancel_deadline{2000};
  std::chrono::milliseconds signal_interval{200};
  std::chrono::milliseconds mark_interval{1000};
  std::int64_t market_max_age_ms{0};
  std::size_t signal_queue_capacity{10000};
};

// -----------------------------------------------------------------------------
// EngineConfig — everything the engine is built from
// -----------------------------------------------------------------------------
//
// @details
// Loaded from one JSON document. Every section is optional and every field
// falls back to the struct default; durations are given in milliseconds
// under a "_ms" suffixed key. parseEngineConfig() validates the result and
// throws ConfigError naming the offending key on:
//   - negative or zero limits where a positive value is required
//   - inverted bounds (min_fill_probability > max_fill_probability, ...)
//   - duplicate strategy ids, venues or operator ids
//   - fewer operators than required_operators, or required_operators < 2
//   - a trading window outside [0, 1440) minutes
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string base_currency{"USD"};
  domain::RiskLimits risk;
  EvGateConfig ev_gate;
  FeeTaxConfig fees;
  SlippageConfig slippage;
  PaperVenueConfig paper_venue;
  AnomalyConfig anomaly;
  ReconciliationConfig reconciliation;
  FxConfig fx;
  std::vector<FxRateConfig> fx_rates;
  OrderManagerConfig orders;
  std::vector<StrategyConfig> strategies;
  std::vector<OperatorCredential> operators;
  std::size_t required_operators{2};
  PersistenceConfig persistence;
  IpcConfig ipc;
  PipelineConfig pipeline;

  const StrategyConfig* strategy(const std::string& id) const;
  std::vector<std::string> venueNames() const;
};

EngineConfig parseEngineConfig(const nlohmann::json& document);
EngineConfig loadEngineConfig(const std::string& path);

void validate(const EngineConfig& config);

}  // namespace sentinel
