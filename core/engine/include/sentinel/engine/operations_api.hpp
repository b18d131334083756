#pragma once

#include "sentinel/engine/execution_risk_engine.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sentinel {

// -----------------------------------------------------------------------------
// OperationsApi — request routing for the operator surface
// -----------------------------------------------------------------------------
//
// @brief  Maps {"method", "path", "body"} requests onto engine operations and
//         answers {"status", "body"}.
//
// @details
// Routes:
//   GET  /health          intake state, kill switch, audit size
//   GET  /risk/state      RiskState snapshot
//   GET  /positions       positions, lots and base-currency totals
//   GET  /audit/verify    chain verification result
//   POST /risk/kill       dual-operator manual trip
//   POST /risk/reset      dual-operator re-arm
//   POST /reconcile       reconcile against body.trades
//
// Status codes: 200 ok, 400 malformed request, 403 dual control refused,
// 404 unknown route, 409 reset while armed, 500 persistence failure,
// 503 engine not running.
//
// Thread model:
//   Stateless; safe to call from the IPC thread while the engine runs.
// -----------------------------------------------------------------------------
class OperationsApi {
 public:
  explicit OperationsApi(ExecutionRiskEngine& engine);

  nlohmann::json handleRequest(const nlohmann::json& request);

  // Raw string entry point for the REP socket. Parse errors answer 400.
  std::string handle(const std::string& request);

 private:
  nlohmann::json health() const;
  nlohmann::json riskState() const;
  nlohmann::json positions() const;
  nlohmann::json verifyAudit() const;
  nlohmann::json kill(const nlohmann::json& body);
  nlohmann::json reset(const nlohmann::json& body);
  nlohmann::json reconcile(const nlohmann::json& body);

  static DualControlRequest parseDualControl(const nlohmann::json& body);

  ExecutionRiskEngine& engine_;
};

}  // namespace sentinel
