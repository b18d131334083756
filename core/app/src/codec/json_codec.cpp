#include "sentinel/codec/json_codec.hpp"

#include <stdexcept>
#include <string>

namespace sentinel {
namespace domain {

namespace {

using json = nlohmann::json;

[[noreturn]] void badEnum(const char* what, const json& j) {
  throw std::invalid_argument(std::string("unknown ") + what + ": " +
                              j.dump());
}

}  // namespace

// --- enums -------------------------------------------------------------------

void to_json(json& j, Side value) { j = toString(value); }

void from_json(const json& j, Side& value) {
  auto parsed = sideFromString(j.get<std::string>());
  if (!parsed) badEnum("side", j);
  value = *parsed;
}

void to_json(json& j, Liquidity value) { j = toString(value); }

void from_json(const json& j, Liquidity& value) {
  auto parsed = liquidityFromString(j.get<std::string>());
  if (!parsed) badEnum("liquidity", j);
  value = *parsed;
}

void to_json(json& j, OrderStatus value) { j = toString(value); }

void from_json(const json& j, OrderStatus& value) {
  auto parsed = orderStatusFromString(j.get<std::string>());
  if (!parsed) badEnum("order status", j);
  value = *parsed;
}

void to_json(json& j, ReasonCode value) { j = toString(value); }

void from_json(const json& j, ReasonCode& value) {
  auto parsed = reasonFromString(j.get<std::string>());
  if (!parsed) badEnum("reason code", j);
  value = *parsed;
}

// --- TradeIntent -------------------------------------------------------------

void to_json(json& j, const TradeIntent& v) {
  j = json{{"intent_id", v.intent_id},
           {"strategy_id", v.strategy_id},
           {"symbol", v.symbol},
           {"side", v.side},
           {"quantity", v.quantity},
           {"reference_price", v.reference_price},
           {"venues", v.venues},
           {"expected_spread_bps", v.expected_spread_bps},
           {"liquidity", v.liquidity},
           {"timestamp_ms", v.timestamp_ms}};
}

void from_json(const json& j, TradeIntent& v) {
  j.at("intent_id").get_to(v.intent_id);
  j.at("strategy_id").get_to(v.strategy_id);
  j.at("symbol").get_to(v.symbol);
  j.at("side").get_to(v.side);
  j.at("quantity").get_to(v.quantity);
  j.at("reference_price").get_to(v.reference_price);
  j.at("venues").get_to(v.venues);
  v.expected_spread_bps = j.value("expected_spread_bps", 0.0);
  v.liquidity = j.contains("liquidity") ? j.at("liquidity").get<Liquidity>()
                                        : Liquidity::Taker;
  v.timestamp_ms = j.value("timestamp_ms", TimestampMs{0});
}

// --- MarketContext -----------------------------------------------------------

void to_json(json& j, const MarketContext& v) {
  j = json{{"symbol", v.symbol},
           {"best_bid", v.best_bid},
           {"best_ask", v.best_ask},
           {"last_price", v.last_price},
           {"book_depth", v.book_depth},
           {"depth_ratio", v.depth_ratio},
           {"volatility_pct", v.volatility_pct},
           {"latency_ms", v.latency_ms},
           {"maker_fill_rate", v.maker_fill_rate},
           {"as_of_ms", v.as_of_ms}};
  if (v.fill_probability_hint) {
    j["fill_probability_hint"] = *v.fill_probability_hint;
  }
}

void from_json(const json& j, MarketContext& v) {
  j.at("symbol").get_to(v.symbol);
  v.best_bid = j.value("best_bid", 0.0);
  v.best_ask = j.value("best_ask", 0.0);
  v.last_price = j.value("last_price", 0.0);
  v.book_depth = j.value("book_depth", 0.0);
  v.depth_ratio = j.value("depth_ratio", 1.0);
  v.volatility_pct = j.value("volatility_pct", 0.0);
  v.latency_ms = j.value("latency_ms", 0.0);
  v.maker_fill_rate = j.value("maker_fill_rate", 0.5);
  v.as_of_ms = j.value("as_of_ms", TimestampMs{0});
  if (j.contains("fill_probability_hint")) {
    v.fill_probability_hint = j.at("fill_probability_hint").get<double>();
  }
}

// --- EVDecision --------------------------------------------------------------

void to_json(json& j, const EVDecision& v) {
  j = json{{"intent_id", v.intent_id},
           {"outcome", toString(v.outcome)},
           {"reason", v.reason},
           {"spread_bps", v.spread_bps},
           {"fill_probability", v.fill_probability},
           {"edge_per_unit", v.edge_per_unit},
           {"slippage_bps", v.slippage_bps},
           {"slippage_cost", v.slippage_cost},
           {"fees", v.fees},
           {"taxes", v.taxes},
           {"net_cost", v.netCost()},
           {"latency_penalty", v.latency_penalty},
           {"expected_value", v.expected_value},
           {"requested_quantity", v.requested_quantity},
           {"approved_quantity", v.approved_quantity}};
}

// --- Order -------------------------------------------------------------------

void to_json(json& j, const Order& v) {
  j = json{{"id", v.id},
           {"intent_id", v.intent_id},
           {"strategy_id", v.strategy_id},
           {"symbol", v.symbol},
           {"venue", v.venue},
           {"side", v.side},
           {"quantity", v.quantity},
           {"price", v.price},
           {"status", v.status},
           {"filled_quantity", v.filled_quantity},
           {"average_fill_price", v.average_fill_price},
           {"reason", v.reason},
           {"created_ms", v.created_ms},
           {"updated_ms", v.updated_ms}};
}

void from_json(const json& j, Order& v) {
  j.at("id").get_to(v.id);
  j.at("intent_id").get_to(v.intent_id);
  j.at("strategy_id").get_to(v.strategy_id);
  j.at("symbol").get_to(v.symbol);
  j.at("venue").get_to(v.venue);
  j.at("side").get_to(v.side);
  j.at("quantity").get_to(v.quantity);
  j.at("price").get_to(v.price);
  j.at("status").get_to(v.status);
  j.at("filled_quantity").get_to(v.filled_quantity);
  j.at("average_fill_price").get_to(v.average_fill_price);
  j.at("reason").get_to(v.reason);
  j.at("created_ms").get_to(v.created_ms);
  j.at("updated_ms").get_to(v.updated_ms);
}

// --- Fill --------------------------------------------------------------------

void to_json(json& j, const Fill& v) {
  j = json{{"fill_id", v.fill_id},
           {"venue_trade_id", v.venue_trade_id},
           {"order_id", v.order_id},
           {"intent_id", v.intent_id},
           {"symbol", v.symbol},
           {"venue", v.venue},
           {"side", v.side},
           {"price", v.price},
           {"quantity", v.quantity},
           {"fee", v.fee},
           {"currency", v.currency},
           {"liquidity", v.liquidity},
           {"price_source", toString(v.price_source)},
           {"timestamp_ms", v.timestamp_ms}};
}

void from_json(const json& j, Fill& v) {
  j.at("fill_id").get_to(v.fill_id);
  j.at("venue_trade_id").get_to(v.venue_trade_id);
  j.at("order_id").get_to(v.order_id);
  j.at("intent_id").get_to(v.intent_id);
  j.at("symbol").get_to(v.symbol);
  j.at("venue").get_to(v.venue);
  j.at("side").get_to(v.side);
  j.at("price").get_to(v.price);
  j.at("quantity").get_to(v.quantity);
  j.at("fee").get_to(v.fee);
  j.at("currency").get_to(v.currency);
  j.at("liquidity").get_to(v.liquidity);
  v.price_source = priceSourceFromString(j.value("price_source", ""));
  j.at("timestamp_ms").get_to(v.timestamp_ms);
}

// --- Position ----------------------------------------------------------------

void to_json(json& j, const Lot& v) {
  j = json{{"quantity", v.quantity},
           {"entry_price", v.entry_price},
           {"opened_ms", v.opened_ms}};
}

void from_json(const json& j, Lot& v) {
  j.at("quantity").get_to(v.quantity);
  j.at("entry_price").get_to(v.entry_price);
  v.opened_ms = j.value("opened_ms", TimestampMs{0});
}

void to_json(json& j, const Position& v) {
  json lots = json::array();
  for (const auto& lot : v.lots) {
    lots.push_back(lot);
  }
  j = json{{"symbol", v.symbol},
           {"currency", v.currency},
           {"lots", std::move(lots)},
           {"net_quantity", v.net_quantity},
           {"realized_pnl", v.realized_pnl},
           {"fees_accrued", v.fees_accrued},
           {"average_entry_price", v.averageEntryPrice()},
           {"applied_sequence", v.applied_sequence}};
}

void from_json(const json& j, Position& v) {
  j.at("symbol").get_to(v.symbol);
  j.at("currency").get_to(v.currency);
  v.lots.clear();
  for (const auto& lot : j.at("lots")) {
    v.lots.push_back(lot.get<Lot>());
  }
  j.at("net_quantity").get_to(v.net_quantity);
  j.at("realized_pnl").get_to(v.realized_pnl);
  j.at("fees_accrued").get_to(v.fees_accrued);
  v.applied_sequence = j.value("applied_sequence", std::uint64_t{0});
}

// --- Risk state --------------------------------------------------------------

void to_json(json& j, const KillSwitchRecord& v) {
  j = json{{"state", toString(v.state_after)},
           {"reason", v.reason},
           {"operators", v.operators},
           {"timestamp_ms", v.timestamp_ms}};
  j["trigger"] = v.trigger ? json(toString(*v.trigger)) : json(nullptr);
}

void from_json(const json& j, KillSwitchRecord& v) {
  v.state_after = j.at("state").get<std::string>() == "TRIPPED"
                      ? KillSwitchState::Tripped
                      : KillSwitchState::Armed;
  v.trigger.reset();
  if (j.contains("trigger") && j.at("trigger").is_string()) {
    v.trigger = tripTriggerFromString(j.at("trigger").get<std::string>());
  }
  j.at("reason").get_to(v.reason);
  v.operators = j.value("operators", std::vector<std::string>{});
  j.at("timestamp_ms").get_to(v.timestamp_ms);
}

void to_json(json& j, const RiskState& v) {
  json history = json::array();
  for (const auto& record : v.history) {
    history.push_back(record);
  }
  j = json{{"kill_switch", toString(v.kill_switch)},
           {"trip_reason", v.trip_reason},
           {"tripped_at_ms", v.tripped_at_ms},
           {"trip_count", v.trip_count},
           {"gross_exposure", v.gross_exposure},
           {"symbol_exposure", v.symbol_exposure},
           {"daily_realized_pnl", v.daily_realized_pnl},
           {"unrealized_pnl", v.unrealized_pnl},
           {"daily_pnl", v.dailyPnl()},
           {"trading_day", v.trading_day},
           {"consecutive_anomalies", v.consecutive_anomalies},
           {"fx_stale", v.fx_stale},
           {"history", std::move(history)}};
  j["trip_trigger"] =
      v.trip_trigger ? json(toString(*v.trip_trigger)) : json(nullptr);
}

void from_json(const json& j, RiskState& v) {
  v.kill_switch = j.at("kill_switch").get<std::string>() == "TRIPPED"
                      ? KillSwitchState::Tripped
                      : KillSwitchState::Armed;
  v.trip_trigger.reset();
  if (j.contains("trip_trigger") && j.at("trip_trigger").is_string()) {
    v.trip_trigger =
        tripTriggerFromString(j.at("trip_trigger").get<std::string>());
  }
  j.at("trip_reason").get_to(v.trip_reason);
  j.at("tripped_at_ms").get_to(v.tripped_at_ms);
  j.at("trip_count").get_to(v.trip_count);
  j.at("gross_exposure").get_to(v.gross_exposure);
  j.at("symbol_exposure").get_to(v.symbol_exposure);
  j.at("daily_realized_pnl").get_to(v.daily_realized_pnl);
  j.at("unrealized_pnl").get_to(v.unrealized_pnl);
  j.at("trading_day").get_to(v.trading_day);
  j.at("consecutive_anomalies").get_to(v.consecutive_anomalies);
  v.fx_stale = j.value("fx_stale", false);
  v.history.clear();
  for (const auto& record : j.at("history")) {
    v.history.push_back(record.get<KillSwitchRecord>());
  }
}

// --- Anomaly -----------------------------------------------------------------

void to_json(json& j, const AnomalyEvent& v) {
  j = json{{"type", toString(v.type)},
           {"key", v.key},
           {"value", v.value},
           {"magnitude", v.magnitude},
           {"threshold", v.threshold},
           {"consecutive_count", v.consecutive_count},
           {"triggered_pause", v.triggered_pause},
           {"fatal", v.fatal},
           {"detail", v.detail},
           {"timestamp_ms", v.timestamp_ms}};
}

// --- Reconciliation ----------------------------------------------------------

void to_json(json& j, const ExternalTrade& v) {
  j = json{{"trade_id", v.trade_id},
           {"symbol", v.symbol},
           {"side", v.side},
           {"price", v.price},
           {"quantity", v.quantity},
           {"timestamp_ms", v.timestamp_ms}};
}

void from_json(const json& j, ExternalTrade& v) {
  j.at("trade_id").get_to(v.trade_id);
  j.at("symbol").get_to(v.symbol);
  j.at("side").get_to(v.side);
  j.at("price").get_to(v.price);
  j.at("quantity").get_to(v.quantity);
  v.timestamp_ms = j.value("timestamp_ms", TimestampMs{0});
}

void to_json(json& j, const Discrepancy& v) {
  j = json{{"trade_id", v.trade_id},
           {"kind", toString(v.kind)},
           {"internal_value", v.internal_value},
           {"external_value", v.external_value}};
}

void to_json(json& j, const ReconciliationReport& v) {
  json discrepancies = json::array();
  for (const auto& d : v.discrepancies) {
    discrepancies.push_back(d);
  }
  j = json{{"timestamp_ms", v.timestamp_ms},
           {"internal_count", v.internal_count},
           {"external_count", v.external_count},
           {"matched_count", v.matched_count},
           {"passed", v.passed()},
           {"discrepancies", std::move(discrepancies)}};
}

}  // namespace domain
}  // namespace sentinel
