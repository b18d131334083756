#pragma once

#include "sentinel/domain/reason_code.hpp"

#include <string>

namespace sentinel {
namespace domain {

enum class EvOutcome {
  Approved,
  Rejected,
  Resized,
};

inline const char* toString(EvOutcome outcome) {
  switch (outcome) {
    case EvOutcome::Approved: return "APPROVED";
    case EvOutcome::Rejected: return "REJECTED";
    case EvOutcome::Resized:  return "RESIZED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// EVDecision — outcome of the expected-value gate for one intent
// -----------------------------------------------------------------------------
//
// @brief  Everything the gate computed, at the size it settled on.
//
// @details
// For Approved/Resized, the cost and EV fields describe approved_quantity and
// expected_value >= the configured minimum. For Rejected, they describe the
// requested quantity and approved_quantity is 0.
//
//   expected_value = fill_probability * edge_per_unit * quantity
//                    - fees - taxes - latency_penalty - slippage_cost
//
// Produced exactly once per intent and written to the audit log.
// -----------------------------------------------------------------------------
struct EVDecision {
  std::string intent_id;
  EvOutcome outcome{EvOutcome::Rejected};
  ReasonCode reason{ReasonCode::None};

  double spread_bps{0.0};
  double fill_probability{0.0};
  double edge_per_unit{0.0};
  double slippage_bps{0.0};
  double slippage_cost{0.0};
  double fees{0.0};
  double taxes{0.0};
  double latency_penalty{0.0};
  double expected_value{0.0};

  double requested_quantity{0.0};
  double approved_quantity{0.0};

  // fees + taxes
  double netCost() const { return fees + taxes; }
  bool approved() const { return outcome != EvOutcome::Rejected; }
};

}  // namespace domain
}  // namespace sentinel
