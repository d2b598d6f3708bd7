#include "procure/engine/simulation_service.hpp"

#include "procure/domain/json_codec.hpp"
#include "procure/domain/labels.hpp"
#include "procure/time/calendar.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace procure {

namespace {

std::string okReply(nlohmann::json payload) {
  nlohmann::json reply;
  reply["status"] = "ok";
  reply["response"] = std::move(payload);
  return reply.dump();
}

std::string errorReply(const std::string& message) {
  nlohmann::json reply;
  reply["status"] = "error";
  reply["response"] = message;
  return reply.dump();
}

// Desk tools signal caller mistakes with an {"error": ...} payload.
std::string toolReply(nlohmann::json payload) {
  if (payload.is_object() && payload.contains("error")) {
    return errorReply(payload["error"].get<std::string>());
  }
  return okReply(std::move(payload));
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / Destructor
// -----------------------------------------------------------------------------
SimulationService::SimulationService(domain::SimulationConfig config,
                                     ServiceOptions options)
    : options_(std::move(options)),
      rng_(options_.seed),
      engine_(std::move(config), rng_, wall_clock_),
      desk_(engine_, rng_) {}

SimulationService::~SimulationService() { stop(); }

void SimulationService::initialize() {
  std::lock_guard<std::mutex> lock(mutex_);
  InitialData data = engine_.initialize();
  std::cout << "[SimulationService] initialized " << data.suppliers.size()
            << " suppliers at " << formatIsoTimestamp(engine_.simulation_date())
            << " (seed=" << options_.seed << ")\n";
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
// IPC comes up before the timer so the first step's telemetry is published.
// -----------------------------------------------------------------------------
void SimulationService::start() {
  if (running_) {
    return;
  }

  if (!options_.cmd_endpoint.empty() && !options_.pub_endpoint.empty()) {
    auto server = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        options_.cmd_endpoint, options_.pub_endpoint);
    server->start();

    std::lock_guard<std::mutex> lock(mutex_);
    ipc_server_ = std::move(server);
  }

  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    stop_requested_ = false;
  }
  timer_thread_ = std::thread([this] { timerLoop(); });
  running_ = true;

  std::cout << "[SimulationService] started. interval_ms="
            << options_.interval_ms
            << (ipc_server_ ? ", ipc enabled" : ", ipc disabled") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void SimulationService::stop() {
  if (!running_) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    stop_requested_ = true;
  }
  timer_cv_.notify_all();
  if (timer_thread_.joinable()) {
    timer_thread_.join();
  }

  // The IPC worker calls executeCommand(), which reads ipc_server_ under
  // mutex_. Join the worker first (without holding mutex_), then release
  // the server under the lock.
  if (ipc_server_) {
    ipc_server_->stop();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ipc_server_.reset();
  }

  running_ = false;
  std::cout << "[SimulationService] stopped. All threads joined.\n";
}

void SimulationService::timerLoop() {
  const auto interval = std::chrono::milliseconds(options_.interval_ms);
  std::unique_lock<std::mutex> lock(timer_mutex_);
  while (!stop_requested_) {
    if (timer_cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    stepOnce();
    lock.lock();
  }
}

// -----------------------------------------------------------------------------
// stepOnce()
// -----------------------------------------------------------------------------
// The frame is queued while mutex_ is held, so frames reach the telemetry
// queue in step order whether the timer or a STEP command produced them.
// -----------------------------------------------------------------------------
nlohmann::json SimulationService::stepOnce() {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json telemetry = stepLocked();
  if (ipc_server_) {
    ipc_server_->pushTelemetry(telemetry.dump());
  }
  return telemetry;
}

nlohmann::json SimulationService::stepLocked() {
  engine_.advance_step();
  if (options_.auto_place_orders) {
    engine_.place_fallback_order();
  }

  nlohmann::json telemetry;
  telemetry["type"] = "step";
  telemetry["step"] = engine_.simulation_step();
  telemetry["simulation_date"] = formatIsoTimestamp(engine_.simulation_date());
  telemetry["changes"] = engine_.get_changes();
  return telemetry;
}

nlohmann::json SimulationService::statusLocked() const {
  const domain::MarketConditions market = engine_.get_market_conditions();

  nlohmann::json status;
  status["simulation_date"] = formatIsoTimestamp(engine_.simulation_date());
  status["simulation_step"] = engine_.simulation_step();
  status["suppliers"] = engine_.supplier_count();
  status["contracts"] = engine_.contract_count();
  status["orders"] = engine_.order_count();
  status["average_price"] = market.average_price;
  status["price_trend"] = domain::toString(market.price_trend);
  status["running"] = running_.load();
  return status;
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string SimulationService::executeCommand(const std::string& cmd) {
  if (!cmd.empty() && cmd.front() == '{') {
    nlohmann::json request;
    try {
      request = nlohmann::json::parse(cmd);
    } catch (const nlohmann::json::parse_error& e) {
      std::cerr << "[SimulationService] Malformed command payload: " << e.what()
                << "\n";
      return errorReply(std::string("Malformed JSON: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
      return toolReply(dispatchTool(request));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[SimulationService] Bad arguments for command: " << e.what()
                << "\n";
      return errorReply(std::string("Bad arguments: ") + e.what());
    }
  }

  if (cmd == "PING") {
    return okReply("PONG");
  }
  if (cmd == "STEP") {
    return okReply(stepOnce());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (cmd == "STATUS") {
    return okReply(statusLocked());
  } else if (cmd == "SNAPSHOT") {
    return okReply(engine_.snapshot());
  } else if (cmd == "CHANGES") {
    return okReply(engine_.get_changes());
  } else if (cmd == "SUPPLIERS") {
    return okReply(desk_.list_suppliers());
  } else if (cmd == "CONTRACTS") {
    return okReply(engine_.get_contracts());
  } else if (cmd == "ORDERS") {
    return okReply(engine_.get_orders());
  } else if (cmd == "MARKET") {
    return okReply(desk_.get_market_conditions());
  } else if (cmd == "PLACE_ORDER") {
    nlohmann::json response;
    response["placed"] = engine_.place_fallback_order();
    response["orders"] = engine_.order_count();
    return okReply(std::move(response));
  }

  return errorReply("Unknown command: " + cmd);
}

// -----------------------------------------------------------------------------
// dispatchTool()
// -----------------------------------------------------------------------------
// Caller holds mutex_. Missing or mistyped arguments throw
// nlohmann::json::exception, turned into an error reply by the caller.
// -----------------------------------------------------------------------------
nlohmann::json SimulationService::dispatchTool(const nlohmann::json& request) {
  const std::string tool = request.at("cmd").get<std::string>();

  if (tool == "propose_contract") {
    return desk_.propose_contract(
        request.at("supplier_id").get<std::string>(),
        request.at("volume").get<std::int64_t>(),
        request.at("price_per_pound").get<double>(),
        request.at("duration_months").get<int>());
  }
  if (tool == "negotiate_contract") {
    return desk_.negotiate_contract(request.at("contract_id").get<std::string>(),
                                    request.at("counter_offer"));
  }
  if (tool == "finalize_contract") {
    return desk_.finalize_contract(request.at("contract_id").get<std::string>());
  }
  if (tool == "reject_contract") {
    return desk_.reject_contract(request.at("contract_id").get<std::string>());
  }
  if (tool == "contract_details") {
    return desk_.get_contract_details(
        request.at("contract_id").get<std::string>());
  }
  if (tool == "active_contracts") {
    return desk_.get_active_contracts();
  }
  if (tool == "supplier_details") {
    return desk_.get_supplier_details(
        request.at("supplier_id").get<std::string>());
  }
  if (tool == "find_suppliers_by_region") {
    return desk_.find_suppliers_by_region(
        request.at("region").get<std::string>());
  }
  if (tool == "create_order") {
    return desk_.create_order(request.at("contract_id").get<std::string>(),
                              request.at("volume").get<std::int64_t>());
  }
  if (tool == "order_details") {
    return desk_.get_order_details(request.at("order_id").get<std::string>());
  }
  if (tool == "active_orders") {
    return desk_.get_active_orders();
  }
  if (tool == "track_order") {
    return desk_.track_order(request.at("order_id").get<std::string>());
  }
  if (tool == "update_order_status") {
    return desk_.update_order_status(request.at("order_id").get<std::string>(),
                                     request.at("status").get<std::string>());
  }

  return nlohmann::json{{"error", "Unknown command: " + tool}};
}

}  // namespace procure
