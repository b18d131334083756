#include "sentinel/engine/operations_api.hpp"
#include "sentinel/codec/json_codec.hpp"
#include "sentinel/domain/errors.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace sentinel {

namespace {

nlohmann::json respond(int status, nlohmann::json body) {
  return nlohmann::json{{"status", status}, {"body", std::move(body)}};
}

nlohmann::json error(int status, const std::string& message) {
  return respond(status, nlohmann::json{{"error", message}});
}

}  // namespace

OperationsApi::OperationsApi(ExecutionRiskEngine& engine) : engine_(engine) {}

// -----------------------------------------------------------------------------
// handleRequest(): route one request
// -----------------------------------------------------------------------------
nlohmann::json OperationsApi::handleRequest(const nlohmann::json& request) {
  if (!request.is_object() || !request.contains("path")) {
    return error(400, "request must be an object with a path");
  }
  const nlohmann::json& path_field = request.at("path");
  if (!path_field.is_string()) {
    return error(400, "path must be a string");
  }
  if (request.contains("method") && !request.at("method").is_string()) {
    return error(400, "method must be a string");
  }
  if (request.contains("body") && !request.at("body").is_object()) {
    return error(400, "body must be an object");
  }

  const std::string method =
      request.contains("method") ? request.at("method").get<std::string>()
                                 : std::string("GET");
  const std::string path = path_field.get<std::string>();
  const nlohmann::json body =
      request.contains("body") ? request.at("body") : nlohmann::json::object();

  if (path == "/health" && method == "GET") {
    return respond(200, health());
  }
  if (!engine_.running()) {
    return error(503, "engine not running");
  }

  try {
    if (method == "GET") {
      if (path == "/risk/state") return respond(200, riskState());
      if (path == "/positions") return respond(200, positions());
      if (path == "/audit/verify") return respond(200, verifyAudit());
    } else if (method == "POST") {
      if (path == "/risk/kill") return kill(body);
      if (path == "/risk/reset") return reset(body);
      if (path == "/reconcile") return reconcile(body);
    }
  } catch (const nlohmann::json::exception& e) {
    return error(400, std::string("malformed body: ") + e.what());
  } catch (const std::invalid_argument& e) {
    return error(400, e.what());
  } catch (const EngineError& e) {
    return error(500, std::string(domain::toString(e.code())) + ": " + e.what());
  }
  return error(404, "no route " + method + " " + path);
}

std::string OperationsApi::handle(const std::string& request) {
  auto parsed = nlohmann::json::parse(request, nullptr, false);
  if (parsed.is_discarded()) {
    return error(400, "request is not valid JSON").dump();
  }
  return handleRequest(parsed).dump();
}

// -----------------------------------------------------------------------------
// GET handlers
// -----------------------------------------------------------------------------
nlohmann::json OperationsApi::health() const {
  return nlohmann::json{
      {"running", engine_.running()},
      {"accepting_intents", engine_.acceptingIntents()},
      {"halt_reason", engine_.haltReason()},
      {"kill_switch", domain::toString(engine_.risk().state().kill_switch)},
      {"audit_entries", engine_.audit().size()},
      {"open_orders", engine_.orders().openOrders().size()}};
}

nlohmann::json OperationsApi::riskState() const {
  return nlohmann::json(engine_.risk().state());
}

nlohmann::json OperationsApi::positions() const {
  PortfolioTotals totals = engine_.totals();
  return nlohmann::json{
      {"base_currency", engine_.config().base_currency},
      {"positions", engine_.ledger().snapshot()},
      {"realized_pnl", totals.realized_pnl_base},
      {"fees", totals.fees_base},
      {"unrealized_pnl", totals.unrealized_pnl_base},
      {"gross_exposure", totals.gross_exposure_base},
      {"fx_stale", totals.fx_stale},
      {"unpriced", totals.unpriced}};
}

nlohmann::json OperationsApi::verifyAudit() const {
  ChainVerification result = engine_.audit().verify();
  nlohmann::json body{{"valid", result.valid},
                      {"entries_checked", result.entries_checked},
                      {"first_broken_index", nullptr},
                      {"detail", result.detail}};
  if (result.first_invalid_index) {
    body["first_broken_index"] = *result.first_invalid_index;
  }
  return body;
}

// -----------------------------------------------------------------------------
// POST handlers
// -----------------------------------------------------------------------------
nlohmann::json OperationsApi::kill(const nlohmann::json& body) {
  DualControlResult result = engine_.manualTrip(parseDualControl(body));
  if (!result.approved) {
    return error(403, result.detail);
  }
  return respond(200, nlohmann::json{{"operators", result.operators},
                                     {"risk", engine_.risk().state()}});
}

nlohmann::json OperationsApi::reset(const nlohmann::json& body) {
  ResetResult result = engine_.resetKillSwitch(parseDualControl(body));
  if (!result.ok) {
    return error(result.authorized ? 409 : 403, result.detail);
  }
  return respond(200, nlohmann::json{{"operators", result.operators},
                                     {"risk", engine_.risk().state()}});
}

nlohmann::json OperationsApi::reconcile(const nlohmann::json& body) {
  if (!body.contains("trades") || !body.at("trades").is_array()) {
    throw std::invalid_argument("body.trades must be an array");
  }
  auto trades = body.at("trades").get<std::vector<domain::ExternalTrade>>();
  domain::ReconciliationReport report = engine_.reconcileNow(trades);
  return respond(200, nlohmann::json(report));
}

DualControlRequest OperationsApi::parseDualControl(const nlohmann::json& body) {
  DualControlRequest request;
  request.reason = body.value("reason", "");
  if (!body.contains("confirmations") || !body.at("confirmations").is_array()) {
    throw std::invalid_argument("body.confirmations must be an array");
  }
  for (const auto& c : body.at("confirmations")) {
    request.confirmations.push_back(OperatorConfirmation{
        c.at("operator").get<std::string>(), c.at("secret").get<std::string>()});
  }
  return request;
}

}  // namespace sentinel
