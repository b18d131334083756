#include "sentinel/config/engine_config.hpp"
#include "sentinel/domain/errors.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

namespace sentinel {

namespace {

using nlohmann::json;

// Reads `key` into `out` when present. Type mismatches become ConfigError
// with the dotted path of the key.
template <typename T>
void read(const json& node, const std::string& section, const char* key,
          T& out) {
  if (!node.contains(key)) {
    return;
  }
  try {
    out = node.at(key).get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(section + "." + key + ": " + e.what());
  }
}

void readMs(const json& node, const std::string& section, const char* key,
            std::chrono::milliseconds& out) {
  std::int64_t ms = out.count();
  read(node, section, key, ms);
  if (ms < 0) {
    throw ConfigError(section + "." + key + " must be >= 0");
  }
  out = std::chrono::milliseconds(ms);
}

const json& section(const json& document, const char* name) {
  static const json kEmpty = json::object();
  if (!document.contains(name)) {
    return kEmpty;
  }
  const json& node = document.at(name);
  if (!node.is_object()) {
    throw ConfigError(std::string(name) + " must be an object");
  }
  return node;
}

void requirePositive(double value, const std::string& key) {
  if (!(value > 0.0)) {
    throw ConfigError(key + " must be > 0");
  }
}

void requireNonNegative(double value, const std::string& key) {
  if (!(value >= 0.0)) {
    throw ConfigError(key + " must be >= 0");
  }
}

void parseRisk(const json& node, domain::RiskLimits& risk) {
  read(node, "risk", "max_trade_notional", risk.max_trade_notional);
  read(node, "risk", "max_symbol_notional", risk.max_symbol_notional);
  read(node, "risk", "max_gross_notional", risk.max_gross_notional);
  read(node, "risk", "max_daily_loss", risk.max_daily_loss);
  if (node.contains("trading_window")) {
    const json& window = node.at("trading_window");
    read(window, "risk.trading_window", "start_min",
         risk.trading_window_start_min);
    read(window, "risk.trading_window", "end_min",
         risk.trading_window_end_min);
  }
}

void parseEvGate(const json& node, EvGateConfig& ev) {
  const std::string s = "ev_gate";
  read(node, s, "min_ev", ev.min_ev);
  read(node, s, "min_quantity", ev.min_quantity);
  read(node, s, "quantity_step", ev.quantity_step);
  read(node, s, "min_fill_probability", ev.min_fill_probability);
  read(node, s, "max_fill_probability", ev.max_fill_probability);
  read(node, s, "logistic_steepness", ev.logistic_steepness);
  read(node, s, "size_impact_bps", ev.size_impact_bps);
  read(node, s, "volatility_bps_per_pct", ev.volatility_bps_per_pct);
  read(node, s, "default_p95_slippage_bps", ev.default_p95_slippage_bps);
  read(node, s, "slippage_multiplier", ev.slippage_multiplier);
  read(node, s, "latency_bps_per_100ms", ev.latency_bps_per_100ms);
  read(node, s, "grid_steps", ev.grid_steps);
  read(node, s, "search_iterations", ev.search_iterations);
  read(node, s, "history_limit", ev.history_limit);
  read(node, s, "min_history_samples", ev.min_history_samples);
  if (node.contains("sizing")) {
    std::string sizing;
    read(node, s, "sizing", sizing);
    if (sizing == "binary") {
      ev.sizing = SizingSearch::Binary;
    } else if (sizing == "grid") {
      ev.sizing = SizingSearch::Grid;
    } else {
      throw ConfigError("ev_gate.sizing must be \"binary\" or \"grid\"");
    }
  }
}

void parseFees(const json& node, FeeTaxConfig& fees) {
  read(node, "fees", "default_fee_bps", fees.default_fee_bps);
  if (node.contains("tax")) {
    const json& tax = node.at("tax");
    read(tax, "fees.tax", "bsmv_bps", fees.tax.bsmv_bps);
    read(tax, "fees.tax", "stamp_bps", fees.tax.stamp_bps);
    read(tax, "fees.tax", "stopaj_bps", fees.tax.stopaj_bps);
  }
  if (node.contains("venues")) {
    if (!node.at("venues").is_array()) {
      throw ConfigError("fees.venues must be an array");
    }
    for (const auto& v : node.at("venues")) {
      VenueFeeSchedule schedule;
      read(v, "fees.venues[]", "venue", schedule.venue);
      read(v, "fees.venues[]", "maker_bps", schedule.maker_bps);
      read(v, "fees.venues[]", "taker_bps", schedule.taker_bps);
      read(v, "fees.venues[]", "campaign_discount_bps",
           schedule.campaign_discount_bps);
      read(v, "fees.venues[]", "taxable", schedule.taxable);
      fees.venues.push_back(schedule);
    }
  }
}

void parseRetry(const json& node, const std::string& s, RetryPolicy& retry) {
  read(node, s, "max_attempts", retry.max_attempts);
  readMs(node, s, "initial_delay_ms", retry.initial_delay);
  readMs(node, s, "max_delay_ms", retry.max_delay);
  read(node, s, "multiplier", retry.multiplier);
}

}  // namespace

bool StrategyConfig::allows(const std::string& symbol) const {
  return allowed_symbols.empty() ||
         std::find(allowed_symbols.begin(), allowed_symbols.end(), symbol) !=
             allowed_symbols.end();
}

const StrategyConfig* EngineConfig::strategy(const std::string& id) const {
  for (const auto& s : strategies) {
    if (s.id == id) {
      return &s;
    }
  }
  return nullptr;
}

std::vector<std::string> EngineConfig::venueNames() const {
  std::vector<std::string> names;
  for (const auto& v : fees.venues) {
    names.push_back(v.venue);
  }
  return names;
}

// -----------------------------------------------------------------------------
// parseEngineConfig: JSON → typed structs, then validate()
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const json& document) {
  if (!document.is_object()) {
    throw ConfigError("document must be a JSON object");
  }
  EngineConfig config;
  read(document, "", "base_currency", config.base_currency);
  read(document, "", "required_operators", config.required_operators);

  parseRisk(section(document, "risk"), config.risk);
  parseEvGate(section(document, "ev_gate"), config.ev_gate);
  parseFees(section(document, "fees"), config.fees);

  {
    const json& node = section(document, "slippage");
    read(node, "slippage", "base_bps", config.slippage.base_bps);
    read(node, "slippage", "volatility_bps_per_pct",
         config.slippage.volatility_bps_per_pct);
    read(node, "slippage", "impact_bps", config.slippage.impact_bps);
    read(node, "slippage", "max_bps", config.slippage.max_bps);
  }
  {
    const json& node = section(document, "paper_venue");
    auto& pv = config.paper_venue;
    read(node, "paper_venue", "max_slices", pv.max_slices);
    read(node, "paper_venue", "participation_rate", pv.participation_rate);
    readMs(node, "paper_venue", "simulated_latency_ms", pv.simulated_latency);
    read(node, "paper_venue", "reject_probability", pv.reject_probability);
    read(node, "paper_venue", "seed", pv.seed);
    readMs(node, "paper_venue", "cancel_latency_ms", pv.cancel_latency);
  }
  {
    const json& node = section(document, "anomaly");
    auto& a = config.anomaly;
    read(node, "anomaly", "z_threshold", a.z_threshold);
    read(node, "anomaly", "price_z_threshold", a.price_z_threshold);
    read(node, "anomaly", "price_window", a.price_window);
    read(node, "anomaly", "pnl_window", a.pnl_window);
    read(node, "anomaly", "latency_window", a.latency_window);
    read(node, "anomaly", "min_samples", a.min_samples);
    read(node, "anomaly", "stale_repeat_count", a.stale_repeat_count);
    read(node, "anomaly", "clock_drift_tolerance_ms",
         a.clock_drift_tolerance_ms);
    read(node, "anomaly", "latency_limit_ms", a.latency_limit_ms);
    read(node, "anomaly", "auto_pause_count", a.auto_pause_count);
    read(node, "anomaly", "auto_pause_window_ms", a.auto_pause_window_ms);
  }
  {
    const json& node = section(document, "reconciliation");
    auto& r = config.reconciliation;
    read(node, "reconciliation", "price_tolerance", r.price_tolerance);
    read(node, "reconciliation", "quantity_tolerance", r.quantity_tolerance);
    readMs(node, "reconciliation", "interval_ms", r.interval);
    readMs(node, "reconciliation", "fetch_timeout_ms", r.fetch_timeout);
    read(node, "reconciliation", "lookback_ms", r.lookback_ms);
    if (node.contains("retry")) {
      parseRetry(node.at("retry"), "reconciliation.retry", r.fetch_retry);
    }
  }
  {
    const json& node = section(document, "fx");
    readMs(node, "fx", "lookup_timeout_ms", config.fx.lookup_timeout);
    read(node, "fx", "max_stale_ms", config.fx.max_stale_ms);
    if (node.contains("rates")) {
      for (const auto& r : node.at("rates")) {
        FxRateConfig rate;
        read(r, "fx.rates[]", "from", rate.from);
        read(r, "fx.rates[]", "to", rate.to);
        read(r, "fx.rates[]", "rate", rate.rate);
        config.fx_rates.push_back(rate);
      }
    }
  }
  {
    const json& node = section(document, "orders");
    readMs(node, "orders", "venue_timeout_ms", config.orders.venue_timeout);
    readMs(node, "orders", "cancel_timeout_ms", config.orders.cancel_timeout);
    read(node, "orders", "symbol_currency", config.orders.symbol_currency);
    config.orders.default_currency = config.base_currency;
  }

  if (document.contains("strategies")) {
    for (const auto& node : document.at("strategies")) {
      StrategyConfig s;
      read(node, "strategies[]", "id", s.id);
      read(node, "strategies[]", "enabled", s.enabled);
      read(node, "strategies[]", "allowed_symbols", s.allowed_symbols);
      read(node, "strategies[]", "max_trade_notional", s.max_trade_notional);
      if (s.max_trade_notional > 0.0) {
        config.risk.strategy_trade_notional[s.id] = s.max_trade_notional;
      }
      config.strategies.push_back(std::move(s));
    }
  }

  if (document.contains("operators")) {
    for (const auto& node : document.at("operators")) {
      OperatorCredential op;
      read(node, "operators[]", "id", op.operator_id);
      read(node, "operators[]", "secret_sha256", op.secret_sha256);
      config.operators.push_back(std::move(op));
    }
  }

  {
    const json& node = section(document, "persistence");
    read(node, "persistence", "audit_path", config.persistence.audit_path);
    read(node, "persistence", "snapshot_path",
         config.persistence.snapshot_path);
    readMs(node, "persistence", "checkpoint_interval_ms",
           config.persistence.checkpoint_interval);
  }
  {
    const json& node = section(document, "ipc");
    read(node, "ipc", "enabled", config.ipc.enabled);
    read(node, "ipc", "rep_endpoint", config.ipc.rep_endpoint);
    read(node, "ipc", "pub_endpoint", config.ipc.pub_endpoint);
    read(node, "ipc", "market_endpoint", config.ipc.market_endpoint);
  }
  {
    const json& node = section(document, "pipeline");
    auto& p = config.pipeline;
    read(node, "pipeline", "strand_count", p.strand_count);
    read(node, "pipeline", "queue_capacity", p.queue_capacity);
    readMs(node, "pipeline", "kill_cancel_deadline_ms", p.kill_cancel_deadline);
    readMs(node, "pipeline", "signal_interval_ms", p.signal_interval);
    readMs(node, "pipeline", "mark_interval_ms", p.mark_interval);
    read(node, "pipeline", "market_max_age_ms", p.market_max_age_ms);
    read(node, "pipeline", "signal_queue_capacity", p.signal_queue_capacity);
  }

  validate(config);
  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  try {
    return parseEngineConfig(json::parse(buffer.str()));
  } catch (const json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }
}

// -----------------------------------------------------------------------------
// validate
// -----------------------------------------------------------------------------
void validate(const EngineConfig& config) {
  if (config.base_currency.empty()) {
    throw ConfigError("base_currency must not be empty");
  }

  const auto& risk = config.risk;
  requirePositive(risk.max_trade_notional, "risk.max_trade_notional");
  requirePositive(risk.max_symbol_notional, "risk.max_symbol_notional");
  requirePositive(risk.max_gross_notional, "risk.max_gross_notional");
  requirePositive(risk.max_daily_loss, "risk.max_daily_loss");
  for (int minute : {risk.trading_window_start_min,
                     risk.trading_window_end_min}) {
    if (minute < 0 || minute >= 1440) {
      throw ConfigError("risk.trading_window minutes must be in [0, 1440)");
    }
  }

  const auto& ev = config.ev_gate;
  requireNonNegative(ev.min_ev, "ev_gate.min_ev");
  requireNonNegative(ev.min_quantity, "ev_gate.min_quantity");
  requireNonNegative(ev.quantity_step, "ev_gate.quantity_step");
  if (ev.min_fill_probability < 0.0 || ev.max_fill_probability > 1.0 ||
      ev.min_fill_probability > ev.max_fill_probability) {
    throw ConfigError(
        "ev_gate fill probability bounds must satisfy 0 <= min <= max <= 1");
  }
  requirePositive(ev.slippage_multiplier, "ev_gate.slippage_multiplier");
  if (ev.grid_steps < 1 || ev.search_iterations < 1) {
    throw ConfigError("ev_gate.grid_steps and search_iterations must be >= 1");
  }

  std::set<std::string> venues;
  for (const auto& v : config.fees.venues) {
    if (v.venue.empty()) {
      throw ConfigError("fees.venues[].venue must not be empty");
    }
    if (!venues.insert(v.venue).second) {
      throw ConfigError("fees.venues: duplicate venue " + v.venue);
    }
    requireNonNegative(v.maker_bps, "fees.venues[" + v.venue + "].maker_bps");
    requireNonNegative(v.taker_bps, "fees.venues[" + v.venue + "].taker_bps");
  }
  if (venues.empty()) {
    throw ConfigError("fees.venues must list at least one venue");
  }

  const auto& pv = config.paper_venue;
  if (pv.max_slices < 1) {
    throw ConfigError("paper_venue.max_slices must be >= 1");
  }
  if (!(pv.participation_rate > 0.0 && pv.participation_rate <= 1.0)) {
    throw ConfigError("paper_venue.participation_rate must be in (0, 1]");
  }
  if (pv.reject_probability < 0.0 || pv.reject_probability > 1.0) {
    throw ConfigError("paper_venue.reject_probability must be in [0, 1]");
  }

  const auto& a = config.anomaly;
  requirePositive(a.z_threshold, "anomaly.z_threshold");
  requirePositive(a.price_z_threshold, "anomaly.price_z_threshold");
  if (a.min_samples < 2) {
    throw ConfigError("anomaly.min_samples must be >= 2");
  }
  if (a.auto_pause_count < 1) {
    throw ConfigError("anomaly.auto_pause_count must be >= 1");
  }

  requireNonNegative(config.reconciliation.price_tolerance,
                     "reconciliation.price_tolerance");
  requireNonNegative(config.reconciliation.quantity_tolerance,
                     "reconciliation.quantity_tolerance");
  if (config.reconciliation.fetch_retry.max_attempts < 1) {
    throw ConfigError("reconciliation.retry.max_attempts must be >= 1");
  }

  for (const auto& rate : config.fx_rates) {
    if (rate.from.empty() || rate.to.empty()) {
      throw ConfigError("fx.rates[] needs from and to");
    }
    requirePositive(rate.rate, "fx.rates[" + rate.from + "/" + rate.to + "]");
  }

  std::set<std::string> strategy_ids;
  for (const auto& s : config.strategies) {
    if (s.id.empty()) {
      throw ConfigError("strategies[].id must not be empty");
    }
    if (!strategy_ids.insert(s.id).second) {
      throw ConfigError("strategies: duplicate id " + s.id);
    }
    requireNonNegative(s.max_trade_notional,
                       "strategies[" + s.id + "].max_trade_notional");
  }

  if (config.required_operators < 2) {
    throw ConfigError("required_operators must be >= 2");
  }
  std::set<std::string> operator_ids;
  for (const auto& op : config.operators) {
    if (op.operator_id.empty() || op.secret_sha256.size() != 64) {
      throw ConfigError(
          "operators[] need an id and a 64-hex-digit secret_sha256");
    }
    if (!operator_ids.insert(op.operator_id).second) {
      throw ConfigError("operators: duplicate id " + op.operator_id);
    }
  }
  if (operator_ids.size() < config.required_operators) {
    throw ConfigError("operators: " + std::to_string(operator_ids.size()) +
                      " configured, " +
                      std::to_string(config.required_operators) +
                      " required");
  }

  if (config.pipeline.strand_count < 1) {
    throw ConfigError("pipeline.strand_count must be >= 1");
  }
  if (config.pipeline.queue_capacity < 1) {
    throw ConfigError("pipeline.queue_capacity must be >= 1");
  }
}

}  // namespace sentinel
