#pragma once

#include "sentinel/domain/market_context.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <optional>
#include <string>

namespace sentinel {

// -----------------------------------------------------------------------------
// MarketContextGateway — ZeroMQ bridge from the market-data pipeline
// -----------------------------------------------------------------------------
//
// @brief  Listens on a SUB socket for JSON market-context snapshots and hands
//         each decoded snapshot to a sink (normally the engine, which updates
//         its cache and feeds the anomaly detector).
//
// @details
// Expected JSON (one message per snapshot):
//   {
//     "symbol": "BTCUSDT", "best_bid": 100.0, "best_ask": 100.1,
//     "last_price": 100.05, "book_depth": 250.0, "depth_ratio": 1.1,
//     "volatility_pct": 0.8, "latency_ms": 35, "maker_fill_rate": 0.55,
//     "as_of_ms": 1700000000000
//   }
// Missing optional fields take MarketContext defaults; a message without a
// symbol or with a non-numeric price is logged and skipped.
//
// Thread model:
//   run() blocks; call it from a dedicated thread. stop() may be called from
//   any thread and is observed within kRecvTimeoutMs.
//
// Ownership:
//   Owns the zmq context and socket. Holds a copy of the sink.
// -----------------------------------------------------------------------------
class MarketContextGateway {
 public:
  using Sink = std::function<void(const domain::MarketContext&)>;

  MarketContextGateway(Sink sink, const std::string& endpoint);
  ~MarketContextGateway() = default;

  MarketContextGateway(const MarketContextGateway&) = delete;
  MarketContextGateway& operator=(const MarketContextGateway&) = delete;
  MarketContextGateway(MarketContextGateway&&) = delete;
  MarketContextGateway& operator=(MarketContextGateway&&) = delete;

  void run();
  void stop();

  static std::optional<domain::MarketContext> decode(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  Sink sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
};

}  // namespace sentinel
