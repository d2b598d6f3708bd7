#pragma once

#include "procure/domain/simulation_config.hpp"
#include "procure/engine/market_engine.hpp"
#include "procure/engine/procurement_desk.hpp"
#include "procure/network/ipc_server.hpp"
#include "procure/random/mersenne_random_source.hpp"
#include "procure/time/live_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace procure {

// Runtime knobs of the host process; SimulationConfig covers the model.
struct ServiceOptions {
  std::uint64_t seed{42};
  std::int64_t interval_ms{1000};
  /// Empty endpoints disable the IpcServer.
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
  /// Run the between-step order placement after every timed step.
  bool auto_place_orders{true};
};

// -----------------------------------------------------------------------------
// SimulationService: process host for one simulation
// -----------------------------------------------------------------------------
//
// @brief  Owns the engine, its lock, the step timer and the IPC surface.
//
// @details
// Every engine access goes through mutex_: the timer thread's steps, the
// IPC worker's commands and direct calls from main(). Telemetry is
// serialized and queued on the IpcServer under the lock, so frames are
// published in step order and the IPC thread never touches engine state.
// ipc_server_ itself is only replaced under mutex_, after its worker has
// been joined.
//
// Commands (executeCommand):
//   bare words:  PING, STATUS, STEP, SNAPSHOT, CHANGES, SUPPLIERS,
//                CONTRACTS, ORDERS, MARKET, PLACE_ORDER
//   JSON:        {"cmd": "<tool>", ...arguments} for the ProcurementDesk
//                tools (propose_contract, negotiate_contract, ...)
// Replies are {"status":"ok","response":...} or
// {"status":"error","response":"<message>"}.
//
// Thread model:
//   start()/stop() from the owning thread. executeCommand() and stepOnce()
//   from any thread.
//
// Ownership:
//   SimulationService
//    ├── rng_          (MersenneRandomSource, value member)
//    ├── wall_clock_   (LiveTimeProvider, value member)
//    ├── engine_       (MarketEngine, refs rng_ and wall_clock_)
//    ├── desk_         (ProcurementDesk, refs engine_ and rng_)
//    ├── timer_thread_ (std::thread, joined in stop())
//    └── ipc_server_   (std::unique_ptr<IpcServer>, null when disabled)
// -----------------------------------------------------------------------------
class SimulationService {
 public:
  SimulationService(domain::SimulationConfig config, ServiceOptions options);
  ~SimulationService();

  SimulationService(const SimulationService&) = delete;
  SimulationService& operator=(const SimulationService&) = delete;
  SimulationService(SimulationService&&) = delete;
  SimulationService& operator=(SimulationService&&) = delete;

  // Generates the initial population (config().supplier_count suppliers).
  void initialize();

  // Starts the IpcServer (when endpoints are set) and the step timer.
  // Throws zmq::error_t when an endpoint cannot be bound.
  void start();

  // Stops the timer first, then the IpcServer. Idempotent.
  void stop();

  // -------------------------------------------------------------------------
  // stepOnce()
  // -------------------------------------------------------------------------
  // One synchronous advance_step() (plus fallback placement when enabled),
  // published as telemetry when the IpcServer runs.
  //
  // @return {"type":"step","step":n,"simulation_date":...,"changes":{...}}
  // -------------------------------------------------------------------------
  nlohmann::json stepOnce();

  std::string executeCommand(const std::string& cmd);

  bool running() const { return running_; }

 private:
  void timerLoop();
  nlohmann::json stepLocked();
  nlohmann::json statusLocked() const;
  nlohmann::json dispatchTool(const nlohmann::json& request);

  ServiceOptions options_;
  MersenneRandomSource rng_;
  LiveTimeProvider wall_clock_;
  MarketEngine engine_;
  ProcurementDesk desk_;

  mutable std::mutex mutex_;
  std::mutex timer_mutex_;
  std::condition_variable timer_cv_;
  bool stop_requested_{false};
  std::thread timer_thread_;
  std::atomic<bool> running_{false};

  std::unique_ptr<IpcServer> ipc_server_;
};

}  // namespace procure
