#include "sentinel/network/ipc_server.hpp"
#include "sentinel/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace sentinel {

namespace {

nlohmann::json telemetryBody(const EvDecisionEvent& e) {
  return nlohmann::json{{"type", "ev_decision"},
                        {"symbol", e.symbol},
                        {"strategy_id", e.strategy_id},
                        {"decision", e.decision}};
}

nlohmann::json telemetryBody(const IntentDeniedEvent& e) {
  return nlohmann::json{{"type", "intent_denied"},
                        {"intent_id", e.intent_id},
                        {"symbol", e.symbol},
                        {"reason", e.reason},
                        {"category", domain::toString(domain::categoryOf(e.reason))},
                        {"detail", e.detail},
                        {"timestamp_ms", e.timestamp_ms}};
}

nlohmann::json telemetryBody(const OrderUpdateEvent& e) {
  return nlohmann::json{{"type", "order_update"},
                        {"order", e.order},
                        {"previous_status", e.previous_status}};
}

nlohmann::json telemetryBody(const FillEvent& e) {
  return nlohmann::json{{"type", "fill"},
                        {"fill", e.fill},
                        {"realized_pnl", e.realized_pnl},
                        {"net_quantity", e.net_quantity}};
}

nlohmann::json telemetryBody(const KillSwitchEvent& e) {
  return nlohmann::json{{"type", "kill_switch"}, {"record", e.record}};
}

nlohmann::json telemetryBody(const AnomalyDetectedEvent& e) {
  return nlohmann::json{{"type", "anomaly"}, {"anomaly", e.anomaly}};
}

nlohmann::json telemetryBody(const ReconciliationEvent& e) {
  return nlohmann::json{{"type", "reconciliation"},
                        {"passed", e.report.passed()},
                        {"report", e.report}};
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(RequestHandler request_handler, std::string rep_endpoint,
                     std::string pub_endpoint)
    : request_handler_(std::move(request_handler)),
      rep_endpoint_(std::move(rep_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  rep_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  rep_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  rep_socket_->bind(rep_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. REP=" << rep_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  rep_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processRequests();
  }

  // Kill-switch and reconciliation telemetry must not be lost on shutdown.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    std::string line = formatTelemetry(*event);
    zmq::message_t msg(line.data(), line.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processRequests(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processRequests() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = rep_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string body(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = request_handler_(body);
  } catch (const std::exception& e) {
    // REP must answer every request or the socket wedges.
    std::cerr << "[IpcServer] request handler failed: " << e.what() << "\n";
    nlohmann::json failure;
    failure["status"] = 500;
    failure["body"]["error"] = e.what();
    response = failure.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  rep_socket_->send(reply, zmq::send_flags::none);
}

std::string IpcServer::formatTelemetry(const Event& event) {
  return std::visit([](const auto& e) { return telemetryBody(e).dump(); },
                    event);
}

}  // namespace sentinel
