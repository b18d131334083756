#include "sentinel/gateway/market_context_gateway.hpp"
#include "sentinel/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace sentinel {

MarketContextGateway::MarketContextGateway(Sink sink,
                                           const std::string& endpoint)
    : sink_(std::move(sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

std::optional<domain::MarketContext> MarketContextGateway::decode(
    const std::string& payload) {
  try {
    return nlohmann::json::parse(payload).get<domain::MarketContext>();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MarketContextGateway] bad snapshot: " << e.what() << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[MarketContextGateway] bad snapshot: " << e.what() << "\n";
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// run(): recv loop; the receive timeout lets stop() be noticed
// -----------------------------------------------------------------------------
void MarketContextGateway::run() {
  running_.store(true);
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }
    if (!result.has_value()) {
      continue;
    }

    auto market = decode(msg.to_string());
    if (!market || market->symbol.empty()) {
      continue;
    }
    sink_(*market);
  }
}

void MarketContextGateway::stop() {
  running_.store(false);
}

}  // namespace sentinel
