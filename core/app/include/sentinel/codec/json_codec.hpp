#pragma once

#include "sentinel/domain/anomaly_event.hpp"
#include "sentinel/domain/ev_decision.hpp"
#include "sentinel/domain/fill.hpp"
#include "sentinel/domain/market_context.hpp"
#include "sentinel/domain/order.hpp"
#include "sentinel/domain/position.hpp"
#include "sentinel/domain/reconciliation.hpp"
#include "sentinel/domain/risk_state.hpp"
#include "sentinel/domain/trade_intent.hpp"

#include <nlohmann/json.hpp>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// JSON encoding of domain types
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json adl_serializer hooks for every domain struct that is
//         audited, snapshotted or returned over the operations API.
//
// @details
// nlohmann::json objects keep keys sorted, so dump() of any value built from
// these functions is canonical: the same struct always yields the same bytes.
// The audit chain hashes that output.
//
// Enums are written with their toString() names. from_json throws
// nlohmann::json::exception on missing or mistyped fields and
// std::invalid_argument on unknown enum names; callers that read untrusted
// input catch std::exception.
// -----------------------------------------------------------------------------

void to_json(nlohmann::json& j, Side value);
void from_json(const nlohmann::json& j, Side& value);
void to_json(nlohmann::json& j, Liquidity value);
void from_json(const nlohmann::json& j, Liquidity& value);
void to_json(nlohmann::json& j, OrderStatus value);
void from_json(const nlohmann::json& j, OrderStatus& value);
void to_json(nlohmann::json& j, ReasonCode value);
void from_json(const nlohmann::json& j, ReasonCode& value);

void to_json(nlohmann::json& j, const TradeIntent& value);
void from_json(const nlohmann::json& j, TradeIntent& value);

void to_json(nlohmann::json& j, const MarketContext& value);
void from_json(const nlohmann::json& j, MarketContext& value);

void to_json(nlohmann::json& j, const EVDecision& value);

void to_json(nlohmann::json& j, const Order& value);
void from_json(const nlohmann::json& j, Order& value);

void to_json(nlohmann::json& j, const Fill& value);
void from_json(const nlohmann::json& j, Fill& value);

void to_json(nlohmann::json& j, const Lot& value);
void from_json(const nlohmann::json& j, Lot& value);
void to_json(nlohmann::json& j, const Position& value);
void from_json(const nlohmann::json& j, Position& value);

void to_json(nlohmann::json& j, const KillSwitchRecord& value);
void from_json(const nlohmann::json& j, KillSwitchRecord& value);
void to_json(nlohmann::json& j, const RiskState& value);
void from_json(const nlohmann::json& j, RiskState& value);

void to_json(nlohmann::json& j, const AnomalyEvent& value);

void to_json(nlohmann::json& j, const ExternalTrade& value);
void from_json(const nlohmann::json& j, ExternalTrade& value);
void to_json(nlohmann::json& j, const Discrepancy& value);
void to_json(nlohmann::json& j, const ReconciliationReport& value);

}  // namespace domain
}  // namespace sentinel
