// =============================================================================
// simulation_service_test.cpp
// =============================================================================
// Tests for procure::SimulationService, mostly with IPC disabled (empty
// endpoints) and once over real ZeroMQ ipc:// sockets.
//
// Validates:
//   - Bare-word commands: PING, STATUS, STEP, SNAPSHOT, PLACE_ORDER
//   - JSON tool commands route to the ProcurementDesk
//   - Desk errors, malformed JSON and bad arguments become error replies
//   - start()/stop() drive the step timer and join cleanly
//   - Published telemetry stays in step order while the timer and STEP
//     commands race, and stop() joins while a client is still commanding
// =============================================================================

#include "procure/engine/simulation_service.hpp"

#include <gtest/gtest.h>

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using nlohmann::json;

class SimulationServiceTest : public ::testing::Test {
 protected:
  static procure::ServiceOptions offlineOptions() {
    procure::ServiceOptions options;
    options.seed = 7;
    options.interval_ms = 10;
    options.cmd_endpoint.clear();
    options.pub_endpoint.clear();
    options.auto_place_orders = false;
    return options;
  }

  static procure::domain::SimulationConfig smallConfig() {
    procure::domain::SimulationConfig config;
    config.supplier_count = 6;
    return config;
  }

  SimulationServiceTest() : service(smallConfig(), offlineOptions()) {
    service.initialize();
  }

  json run(const std::string& cmd) {
    return json::parse(service.executeCommand(cmd));
  }

  json runTool(const json& request) { return run(request.dump()); }

  procure::SimulationService service;
};

// -----------------------------------------------------------------------------
// 1. Bare-word commands.
// -----------------------------------------------------------------------------
TEST_F(SimulationServiceTest, PingAndStatus) {
  const auto pong = run("PING");
  EXPECT_EQ(pong.at("status"), "ok");
  EXPECT_EQ(pong.at("response"), "PONG");

  const auto status = run("STATUS").at("response");
  EXPECT_EQ(status.at("simulation_step"), 0);
  EXPECT_EQ(status.at("suppliers"), 6);
  EXPECT_EQ(status.at("contracts"), 0);
  EXPECT_EQ(status.at("running"), false);
}

TEST_F(SimulationServiceTest, StepPublishesChanges) {
  const auto reply = run("STEP");
  ASSERT_EQ(reply.at("status"), "ok");

  const auto& telemetry = reply.at("response");
  EXPECT_EQ(telemetry.at("type"), "step");
  EXPECT_EQ(telemetry.at("step"), 1);
  EXPECT_TRUE(telemetry.at("changes").at("market_conditions").contains(
      "new_price"));

  EXPECT_EQ(service.stepOnce().at("step"), 2);
  EXPECT_EQ(run("SNAPSHOT").at("response").at("simulation_step"), 2);
}

TEST_F(SimulationServiceTest, CollectionCommands) {
  EXPECT_EQ(run("SUPPLIERS").at("response").size(), 6u);
  EXPECT_TRUE(run("CONTRACTS").at("response").is_array());
  EXPECT_TRUE(run("ORDERS").at("response").empty());
  EXPECT_TRUE(run("MARKET").at("response").contains("price_history"));
  EXPECT_TRUE(run("CHANGES").at("response").contains("orders"));

  const auto placed = run("PLACE_ORDER").at("response");
  EXPECT_EQ(placed.at("placed"), false);
  EXPECT_EQ(placed.at("orders"), 0);
}

TEST_F(SimulationServiceTest, UnknownCommand) {
  const auto reply = run("LAUNCH");
  EXPECT_EQ(reply.at("status"), "error");
  EXPECT_EQ(reply.at("response"), "Unknown command: LAUNCH");

  const auto tool = runTool({{"cmd", "launch_rocket"}});
  EXPECT_EQ(tool.at("status"), "error");
}

// -----------------------------------------------------------------------------
// 2. JSON tools: full contract -> order flow.
// -----------------------------------------------------------------------------
TEST_F(SimulationServiceTest, ToolWorkflow) {
  const std::string sid =
      run("SUPPLIERS").at("response")[0].at("id").get<std::string>();

  const auto proposal = runTool({{"cmd", "propose_contract"},
                                 {"supplier_id", sid},
                                 {"volume", 12000},
                                 {"price_per_pound", 4.5},
                                 {"duration_months", 4}});
  ASSERT_EQ(proposal.at("status"), "ok");
  const std::string cid = proposal.at("response").at("id").get<std::string>();

  const auto finalized =
      runTool({{"cmd", "finalize_contract"}, {"contract_id", cid}});
  EXPECT_EQ(finalized.at("response").at("status"), "active");
  EXPECT_EQ(runTool({{"cmd", "active_contracts"}}).at("response").size(), 1u);

  const auto order = runTool(
      {{"cmd", "create_order"}, {"contract_id", cid}, {"volume", 3000}});
  ASSERT_EQ(order.at("status"), "ok");
  const std::string oid = order.at("response").at("id").get<std::string>();

  const auto tracked = runTool({{"cmd", "track_order"}, {"order_id", oid}});
  EXPECT_EQ(tracked.at("response").at("current_status"), "pending");

  const auto updated = runTool({{"cmd", "update_order_status"},
                                {"order_id", oid},
                                {"status", "in_transit"}});
  EXPECT_EQ(updated.at("response").at("status"), "in_transit");
  EXPECT_EQ(runTool({{"cmd", "active_orders"}}).at("response").size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Error mapping.
// -----------------------------------------------------------------------------
TEST_F(SimulationServiceTest, DeskErrorsBecomeErrorReplies) {
  const auto reply =
      runTool({{"cmd", "contract_details"}, {"contract_id", "nope"}});
  EXPECT_EQ(reply.at("status"), "error");
  EXPECT_EQ(reply.at("response"), "Contract with ID nope not found");
}

TEST_F(SimulationServiceTest, MalformedPayloads) {
  const auto broken = run("{\"cmd\": ");
  EXPECT_EQ(broken.at("status"), "error");

  const auto missing = runTool({{"cmd", "create_order"}});
  EXPECT_EQ(missing.at("status"), "error");

  const auto mistyped = runTool(
      {{"cmd", "create_order"}, {"contract_id", "c1"}, {"volume", "many"}});
  EXPECT_EQ(mistyped.at("status"), "error");

  // The service keeps answering after bad input.
  EXPECT_EQ(run("PING").at("status"), "ok");
}

// -----------------------------------------------------------------------------
// 4. The timer advances the simulation until stop().
// -----------------------------------------------------------------------------
TEST_F(SimulationServiceTest, TimerStepsUntilStopped) {
  service.start();
  EXPECT_TRUE(service.running());

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  service.stop();
  EXPECT_FALSE(service.running());

  const auto steps = run("STATUS").at("response").at("simulation_step");
  EXPECT_GT(steps.get<int>(), 0);

  // No further steps after stop(); a second stop() is a no-op.
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(run("STATUS").at("response").at("simulation_step"), steps);
  service.stop();
}

// -----------------------------------------------------------------------------
// 5. Over ZeroMQ: timer steps and STEP commands share one ordered stream.
// -----------------------------------------------------------------------------
TEST(SimulationServiceIpcTest, TelemetryInStepOrderAndCleanShutdown) {
  const std::string cmd_endpoint =
      "ipc://" + ::testing::TempDir() + "procure_service_cmd.sock";
  const std::string pub_endpoint =
      "ipc://" + ::testing::TempDir() + "procure_service_pub.sock";

  procure::ServiceOptions options;
  options.seed = 11;
  options.interval_ms = 5;
  options.cmd_endpoint = cmd_endpoint;
  options.pub_endpoint = pub_endpoint;
  options.auto_place_orders = true;

  procure::domain::SimulationConfig config;
  config.supplier_count = 6;
  procure::SimulationService service(config, options);
  service.initialize();
  service.start();
  ASSERT_TRUE(service.running());

  zmq::context_t context(1);
  zmq::socket_t sub(context, zmq::socket_type::sub);
  sub.set(zmq::sockopt::subscribe, "");
  sub.set(zmq::sockopt::rcvtimeo, 200);
  sub.set(zmq::sockopt::linger, 0);
  sub.connect(pub_endpoint);

  std::atomic<bool> commanding{true};
  std::atomic<int> replies{0};
  std::thread client([&context, &cmd_endpoint, &commanding, &replies] {
    zmq::socket_t req(context, zmq::socket_type::req);
    req.set(zmq::sockopt::rcvtimeo, 500);
    req.set(zmq::sockopt::sndtimeo, 500);
    req.set(zmq::sockopt::linger, 0);
    req.connect(cmd_endpoint);
    while (commanding.load()) {
      if (!req.send(zmq::str_buffer("STEP"), zmq::send_flags::none)) {
        break;
      }
      zmq::message_t reply;
      // A REQ socket cannot send again after a missed reply.
      if (!req.recv(reply, zmq::recv_flags::none)) {
        break;
      }
      replies.fetch_add(1);
    }
  });

  std::vector<std::int64_t> steps;
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (steps.size() < 60 && std::chrono::steady_clock::now() < deadline) {
    zmq::message_t frame;
    if (!sub.recv(frame, zmq::recv_flags::none)) {
      continue;
    }
    const auto telemetry = json::parse(
        std::string(static_cast<const char*>(frame.data()), frame.size()));
    steps.push_back(telemetry.at("step").get<std::int64_t>());
  }

  // The client may still have a STEP in flight here.
  service.stop();
  commanding.store(false);
  client.join();

  EXPECT_FALSE(service.running());
  EXPECT_GT(replies.load(), 0);
  ASSERT_GE(steps.size(), 10u);
  for (std::size_t i = 1; i < steps.size(); ++i) {
    EXPECT_GT(steps[i], steps[i - 1]) << "frame " << i << " out of order";
  }

  const auto status =
      json::parse(service.executeCommand("STATUS")).at("response");
  EXPECT_EQ(status.at("running"), false);
  EXPECT_GE(status.at("simulation_step").get<std::int64_t>(), steps.back());
}
