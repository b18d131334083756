// -----------------------------------------------------------------------------
// sentinel — single executable entry point.
//
// Paper-trading mode:
//   1) Load and validate the JSON configuration (argv[1]).
//   2) Create the wall clock, a static FX table and one PaperVenue per
//      configured venue.
//   3) Create the ExecutionRiskEngine and start it. start() verifies the
//      audit chain and rebuilds positions and risk state before any intent
//      is accepted.
//   4) Start the IpcServer (operator requests + telemetry) when enabled.
//   5) Run the MarketContextGateway recv loop on the main thread when a
//      market endpoint is configured; otherwise idle until Ctrl-C.
//   6) Shut down cleanly.
//
// Thread layout:
//   main thread        → MarketContextGateway::run() or idle wait
//   strand threads     → intent pipeline, one strand per symbol hash
//   scheduler thread   → anomaly signals, marks, reconciliation, checkpoints
//   audit writer       → hash-chain appends
//   ipc thread         → REP requests + PUB telemetry
// -----------------------------------------------------------------------------

#include "sentinel/config/engine_config.hpp"
#include "sentinel/domain/errors.hpp"
#include "sentinel/engine/execution_risk_engine.hpp"
#include "sentinel/engine/operations_api.hpp"
#include "sentinel/execution/paper_venue.hpp"
#include "sentinel/gateway/market_context_gateway.hpp"
#include "sentinel/network/ipc_server.hpp"
#include "sentinel/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

// -----------------------------------------------------------------------------
// Signal handling. The flag and the gateway pointer are the only globals;
// both are set before the handler is installed.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown{false};
static sentinel::MarketContextGateway* g_gateway_ptr = nullptr;

static void sigint_handler(int /*signum*/) {
  g_shutdown.store(true);
  if (g_gateway_ptr != nullptr) {
    g_gateway_ptr->stop();
  }
}

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "config/sentinel.json";

  // -------------------------------------------------------------------------
  // 1) Configuration. Invalid configuration is fatal before anything starts.
  // -------------------------------------------------------------------------
  sentinel::EngineConfig config;
  try {
    config = sentinel::loadEngineConfig(config_path);
  } catch (const sentinel::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 2;
  }

  // -------------------------------------------------------------------------
  // 2) Collaborators
  // -------------------------------------------------------------------------
  sentinel::LiveTimeProvider clock;

  sentinel::StaticFxRateProvider fx;
  for (const auto& rate : config.fx_rates) {
    fx.setRate(rate.from, rate.to, rate.rate, clock.now_ms());
  }

  std::vector<std::unique_ptr<sentinel::PaperVenue>> venues;
  std::vector<sentinel::IExecutionVenue*> venue_ptrs;
  for (const auto& name : config.venueNames()) {
    venues.push_back(std::make_unique<sentinel::PaperVenue>(
        name, clock, sentinel::SlippageModel(config.slippage),
        config.paper_venue));
    venue_ptrs.push_back(venues.back().get());
  }
  sentinel::ITradeHistorySource* history =
      venues.empty() ? nullptr : venues.front().get();

  // -------------------------------------------------------------------------
  // 3) Engine
  // -------------------------------------------------------------------------
  sentinel::ExecutionRiskEngine engine(config, clock, fx, venue_ptrs, history);
  try {
    engine.start();
  } catch (const sentinel::ChainIntegrityError& e) {
    std::cerr << "[main] CRITICAL: " << e.what()
              << ". Refusing to trade until an operator intervenes.\n";
    return 3;
  } catch (const sentinel::PersistenceError& e) {
    std::cerr << "[main] CRITICAL: " << e.what() << "\n";
    return 4;
  }

  // -------------------------------------------------------------------------
  // 4) Operator surface
  // -------------------------------------------------------------------------
  sentinel::OperationsApi api(engine);
  std::unique_ptr<sentinel::IpcServer> ipc;
  if (config.ipc.enabled) {
    ipc = std::make_unique<sentinel::IpcServer>(
        [&api](const std::string& request) { return api.handle(request); },
        config.ipc.rep_endpoint, config.ipc.pub_endpoint);
    engine.eventBus().subscribe(
        [&ipc](const sentinel::Event& event) { ipc->pushTelemetry(event); });
    ipc->start();
  }

  // -------------------------------------------------------------------------
  // 5) Market contexts on the main thread, or idle until Ctrl-C
  // -------------------------------------------------------------------------
  std::unique_ptr<sentinel::MarketContextGateway> gateway;
  if (!config.ipc.market_endpoint.empty()) {
    gateway = std::make_unique<sentinel::MarketContextGateway>(
        [&engine](const sentinel::domain::MarketContext& market) {
          engine.onMarketContext(market);
        },
        config.ipc.market_endpoint);
    g_gateway_ptr = gateway.get();
  }
  std::signal(SIGINT, sigint_handler);
  std::signal(SIGTERM, sigint_handler);

  std::cout << "[main] sentinel running (base " << config.base_currency
            << ", " << venues.size() << " paper venue(s)). Ctrl-C to stop.\n";

  if (gateway) {
    gateway->run();
  } else {
    while (!g_shutdown.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }

  // -------------------------------------------------------------------------
  // 6) Shutdown: IPC first (it calls into the engine), then the engine.
  // -------------------------------------------------------------------------
  std::cout << "[main] shutting down...\n";
  if (ipc) {
    ipc->stop();
  }
  engine.stop();
  g_gateway_ptr = nullptr;
  return 0;
}
