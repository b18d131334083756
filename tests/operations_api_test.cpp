// =============================================================================
// operations_api_test.cpp
// =============================================================================
// Tests for sentinel::OperationsApi routed against a live engine.
//
// Validates:
//   - /health answers before start(); other routes return 503 until running
//   - Kill and reset need dual control: 403 when refused, 409 when armed
//   - /positions and /audit/verify reflect executed fills
//   - /reconcile takes an external trade list and reports the result
//   - Malformed requests, including wrongly typed fields, are 400; unknown
//     routes are 404
// =============================================================================

#include "sentinel/codec/json_codec.hpp"
#include "sentinel/engine/execution_risk_engine.hpp"
#include "sentinel/engine/operations_api.hpp"
#include "sentinel/execution/paper_venue.hpp"
#include "sentinel/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

constexpr std::int64_t kStartMs = 1'699'963'200'000;

const char* kAliceHash =
    "0c848abb03307b06cf70cd4e29c157dc81af5e94ab3eb1d0c59a120269572376";
const char* kBobHash =
    "9f03ef1533a68d2f506f81ef463c1183a82a6bd40e45613f36e6fe1889cf1b99";

json request(const std::string& method, const std::string& path,
             json body = json::object()) {
  return json{{"method", method}, {"path", path}, {"body", std::move(body)}};
}

json confirmations(const std::string& bob_secret = "bob-secret") {
  return json{{"reason", "desk halt"},
              {"confirmations",
               json::array({json{{"operator", "alice"}, {"secret", "alice-secret"}},
                            json{{"operator", "bob"}, {"secret", bob_secret}}})}};
}

}  // namespace

class OperationsApiTest : public ::testing::Test {
 protected:
  sentinel::SimulationTimeProvider clock{kStartMs};
  sentinel::StaticFxRateProvider rates;
  sentinel::PaperVenue venue{"paper", clock, sentinel::SlippageModel{},
                             venueConfig()};
  fs::path dir;
  std::unique_ptr<sentinel::ExecutionRiskEngine> engine;
  std::unique_ptr<sentinel::OperationsApi> api;

  static sentinel::PaperVenueConfig venueConfig() {
    sentinel::PaperVenueConfig config;
    config.cancel_latency = 1ms;
    return config;
  }

  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir = fs::temp_directory_path() /
          (std::string("sentinel_ops_") + info->name());
    fs::remove_all(dir);
    fs::create_directories(dir);

    sentinel::EngineConfig config;
    config.fees.venues.push_back(
        sentinel::VenueFeeSchedule{"paper", 2.0, 5.0, 0.0, false});
    config.operators = {{"alice", kAliceHash}, {"bob", kBobHash}};
    config.persistence.audit_path = (dir / "audit.jsonl").string();
    config.persistence.checkpoint_interval = 1h;
    config.pipeline.signal_interval = 1h;
    config.pipeline.mark_interval = 1h;
    config.reconciliation.interval = 1h;

    engine = std::make_unique<sentinel::ExecutionRiskEngine>(
        config, clock, rates, std::vector<sentinel::IExecutionVenue*>{&venue},
        &venue);
    api = std::make_unique<sentinel::OperationsApi>(*engine);
  }

  void TearDown() override {
    api.reset();
    if (engine) engine->stop();
    engine.reset();
    fs::remove_all(dir);
  }

  // Starts the engine and fills one 10-unit BTC-USD buy.
  sentinel::SubmissionResult startAndTrade() {
    engine->start();
    sentinel::domain::MarketContext market;
    market.symbol = "BTC-USD";
    market.best_bid = 99.95;
    market.best_ask = 100.05;
    market.last_price = 100.0;
    market.book_depth = 100.0;
    market.fill_probability_hint = 0.9;
    engine->onMarketContext(market);

    sentinel::domain::TradeIntent intent;
    intent.intent_id = "i-1";
    intent.strategy_id = "grid";
    intent.symbol = "BTC-USD";
    intent.side = sentinel::domain::Side::Buy;
    intent.quantity = 10.0;
    intent.reference_price = 100.0;
    intent.venues = {"paper"};
    intent.expected_spread_bps = 200.0;
    intent.liquidity = sentinel::domain::Liquidity::Taker;

    auto future = engine->submit(intent);
    EXPECT_EQ(future.wait_for(5s), std::future_status::ready);
    return future.get();
  }

  json call(const json& req) { return api->handleRequest(req); }
};

// -----------------------------------------------------------------------------
// 1. Health is always available; everything else waits for start().
// -----------------------------------------------------------------------------
TEST_F(OperationsApiTest, HealthAnswersBeforeStart) {
  auto health = call(request("GET", "/health"));
  EXPECT_EQ(health["status"].get<int>(), 200);
  EXPECT_FALSE(health["body"]["running"].get<bool>());
  EXPECT_FALSE(health["body"]["accepting_intents"].get<bool>());
  EXPECT_EQ(health["body"]["kill_switch"].get<std::string>(), "ARMED");

  EXPECT_EQ(call(request("GET", "/risk/state"))["status"].get<int>(), 503);
  EXPECT_EQ(call(request("POST", "/risk/kill", confirmations()))["status"]
                .get<int>(),
            503);

  engine->start();
  health = call(request("GET", "/health"));
  EXPECT_TRUE(health["body"]["running"].get<bool>());
  EXPECT_TRUE(health["body"]["accepting_intents"].get<bool>());
}

// -----------------------------------------------------------------------------
// 2. Kill switch through the API: one operator is refused, two trip it;
//    reset while armed is a conflict, with a wrong secret is forbidden.
// -----------------------------------------------------------------------------
TEST_F(OperationsApiTest, KillAndResetRequireDualControl) {
  engine->start();

  auto armed_reset = call(request("POST", "/risk/reset", confirmations()));
  EXPECT_EQ(armed_reset["status"].get<int>(), 409);

  json lone{{"reason", "solo"},
            {"confirmations",
             json::array({json{{"operator", "alice"}, {"secret", "alice-secret"}}})}};
  EXPECT_EQ(call(request("POST", "/risk/kill", lone))["status"].get<int>(), 403);
  EXPECT_FALSE(engine->risk().isTripped());

  auto kill = call(request("POST", "/risk/kill", confirmations()));
  ASSERT_EQ(kill["status"].get<int>(), 200);
  EXPECT_EQ(kill["body"]["operators"].size(), 2u);
  EXPECT_TRUE(engine->risk().isTripped());
  EXPECT_EQ(call(request("GET", "/health"))["body"]["kill_switch"]
                .get<std::string>(),
            "TRIPPED");

  auto bad = call(request("POST", "/risk/reset", confirmations("wrong")));
  EXPECT_EQ(bad["status"].get<int>(), 403);
  EXPECT_TRUE(engine->risk().isTripped());

  auto reset = call(request("POST", "/risk/reset", confirmations()));
  EXPECT_EQ(reset["status"].get<int>(), 200);
  EXPECT_FALSE(engine->risk().isTripped());
}

// -----------------------------------------------------------------------------
// 3. Positions and audit verification after a fill.
// -----------------------------------------------------------------------------
TEST_F(OperationsApiTest, PositionsAndAuditReflectFills) {
  ASSERT_TRUE(startAndTrade().accepted);

  auto positions = call(request("GET", "/positions"));
  ASSERT_EQ(positions["status"].get<int>(), 200);
  EXPECT_EQ(positions["body"]["base_currency"].get<std::string>(), "USD");
  ASSERT_EQ(positions["body"]["positions"].size(), 1u);
  EXPECT_GT(positions["body"]["fees"].get<double>(), 0.0);

  auto verify = call(request("GET", "/audit/verify"));
  ASSERT_EQ(verify["status"].get<int>(), 200);
  EXPECT_TRUE(verify["body"]["valid"].get<bool>());
  EXPECT_GE(verify["body"]["entries_checked"].get<std::size_t>(), 3u);
  EXPECT_TRUE(verify["body"]["first_broken_index"].is_null());

  EXPECT_EQ(call(request("GET", "/health"))["body"]["audit_entries"]
                .get<std::size_t>(),
            engine->audit().size());
}

// -----------------------------------------------------------------------------
// 4. /reconcile with the venue's own fills passes; a bad body is 400.
// -----------------------------------------------------------------------------
TEST_F(OperationsApiTest, ReconcileAgainstSuppliedTrades) {
  auto result = startAndTrade();
  ASSERT_TRUE(result.order.has_value());

  json trades = json::array();
  for (const auto& fill : result.order->fills) {
    trades.push_back(json(sentinel::domain::ExternalTrade{
        fill.venue_trade_id, fill.symbol, fill.side, fill.price, fill.quantity,
        fill.timestamp_ms}));
  }

  auto report = call(request("POST", "/reconcile", json{{"trades", trades}}));
  ASSERT_EQ(report["status"].get<int>(), 200);
  EXPECT_TRUE(report["body"]["passed"].get<bool>());
  EXPECT_EQ(report["body"]["matched_count"].get<std::size_t>(),
            result.order->fills.size());
  EXPECT_FALSE(engine->risk().isTripped());

  EXPECT_EQ(call(request("POST", "/reconcile", json{{"trades", "none"}}))
                ["status"]
                    .get<int>(),
            400);
  EXPECT_EQ(call(request("POST", "/reconcile",
                         json{{"trades", json::array({json{{"symbol", "X"}}})}}))
                ["status"]
                    .get<int>(),
            400);
}

// -----------------------------------------------------------------------------
// 5. Malformed input and unknown routes.
// -----------------------------------------------------------------------------
TEST_F(OperationsApiTest, RejectsMalformedRequests) {
  engine->start();

  EXPECT_EQ(call(request("GET", "/nowhere"))["status"].get<int>(), 404);
  EXPECT_EQ(call(request("DELETE", "/risk/state"))["status"].get<int>(), 404);
  EXPECT_EQ(call(json::array())["status"].get<int>(), 400);
  EXPECT_EQ(call(request("POST", "/risk/kill", json{{"reason", "x"}}))["status"]
                .get<int>(),
            400);

  auto raw = json::parse(api->handle("{not json"));
  EXPECT_EQ(raw["status"].get<int>(), 400);

  auto ok = json::parse(api->handle(R"({"method":"GET","path":"/risk/state"})"));
  EXPECT_EQ(ok["status"].get<int>(), 200);
  EXPECT_EQ(ok["body"]["kill_switch"].get<std::string>(), "ARMED");
}

// -----------------------------------------------------------------------------
// 6. Wrongly typed envelope fields are a 400, never an exception.
// Why: requests arrive on the IPC thread; a throw there ends the process.
// -----------------------------------------------------------------------------
TEST_F(OperationsApiTest, WronglyTypedFieldsAreBadRequests) {
  engine->start();

  json numeric_method{{"method", 1}, {"path", "/risk/state"}};
  json numeric_path{{"method", "GET"}, {"path", 7}};
  json array_body{{"method", "POST"},
                  {"path", "/risk/kill"},
                  {"body", json::array()}};

  json response;
  ASSERT_NO_THROW(response = call(numeric_method));
  EXPECT_EQ(response["status"].get<int>(), 400);
  ASSERT_NO_THROW(response = call(numeric_path));
  EXPECT_EQ(response["status"].get<int>(), 400);
  ASSERT_NO_THROW(response = call(array_body));
  EXPECT_EQ(response["status"].get<int>(), 400);

  std::string raw;
  ASSERT_NO_THROW(raw = api->handle(R"({"method":1,"path":"/risk/state"})"));
  EXPECT_EQ(json::parse(raw)["status"].get<int>(), 400);

  // Health still answers without a method field.
  EXPECT_EQ(call(json{{"path", "/health"}})["status"].get<int>(), 200);
  EXPECT_FALSE(engine->risk().isTripped());
}
