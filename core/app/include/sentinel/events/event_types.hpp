#pragma once

#include "sentinel/domain/anomaly_event.hpp"
#include "sentinel/domain/ev_decision.hpp"
#include "sentinel/domain/fill.hpp"
#include "sentinel/domain/order.hpp"
#include "sentinel/domain/order_status.hpp"
#include "sentinel/domain/reconciliation.hpp"
#include "sentinel/domain/risk_state.hpp"
#include "sentinel/domain/types.hpp"

#include <cstdint>
#include <string>

namespace sentinel {

// -----------------------------------------------------------------------------
// Engine events
// -----------------------------------------------------------------------------
// Plain value types published on the EventBus after the fact: the audit log
// is the record, these are notifications (telemetry, operators, tests).
// Each is self-contained so it can be copied across threads.
// -----------------------------------------------------------------------------

// An intent went through the EV gate.
struct EvDecisionEvent {
  std::string symbol;
  std::string strategy_id;
  domain::EVDecision decision;
};

// An intent was denied before reaching the order manager (validation, risk
// limit, pipeline back-pressure).
struct IntentDeniedEvent {
  std::string intent_id;
  std::string symbol;
  domain::ReasonCode reason{domain::ReasonCode::None};
  std::string detail;
  domain::TimestampMs timestamp_ms{0};
};

// An order changed state. previous_status equals order.status on creation.
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::New};
};

struct FillEvent {
  domain::Fill fill;
  double realized_pnl{0.0};
  double net_quantity{0.0};
};

struct KillSwitchEvent {
  domain::KillSwitchRecord record;
};

struct AnomalyDetectedEvent {
  domain::AnomalyEvent anomaly;
};

struct ReconciliationEvent {
  domain::ReconciliationReport report;
};

}  // namespace sentinel
