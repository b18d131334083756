#pragma once

#include "sentinel/concurrent/thread_safe_queue.hpp"
#include "sentinel/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace sentinel {

// -----------------------------------------------------------------------------
// IpcServer — dual-socket ZeroMQ gateway for operator requests and telemetry
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread that answers operator requests (REP socket) and
//         broadcasts engine events (PUB socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. PUB socket (port 5557, configurable):
//      Broadcasts JSON telemetry for every engine event: EV decisions,
//      denials, order updates, fills, kill-switch transitions, anomalies
//      and reconciliation reports. Events arrive through a ThreadSafeQueue
//      so JSON encoding and socket I/O stay off the strands.
//
//   2. REP socket (port 5556, configurable):
//      Accepts JSON requests from a REQ client. Each request string is
//      passed to the request handler (bound to OperationsApi::handle) and
//      the response string is sent back. ZMQ_RCVTIMEO keeps the loop
//      alternating between requests and telemetry.
//
// Thread model:
//   start()/stop() from the owning thread (main). pushTelemetry() from any
//   thread. The request handler runs on the IPC thread.
//
// Ownership:
//   Owns the ZMQ context, both sockets, the telemetry queue and the worker
//   thread. Holds a copy of the request handler.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using RequestHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(RequestHandler request_handler,
                     std::string rep_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Idempotent.
  void start();

  // Signals the worker, joins it, closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // JSON line for one event; every Event alternative has a format.
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processRequests();

  RequestHandler request_handler_;
  std::string rep_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> rep_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace sentinel
