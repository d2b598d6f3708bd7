// -----------------------------------------------------------------------------
// procure_sim: single executable entry point.
//
// Two modes:
//   Batch   (--steps N, N > 0): initialize, run N synchronous steps, print
//           each step's change-log and the final status, exit.
//   Service (default):          initialize, start the step timer and the
//           ZeroMQ command/telemetry surface, run until Ctrl-C.
//
// Options:
//   --config <file>      JSON SimulationConfig overlay
//   --seed <n>           random seed (default 42)
//   --steps <n>          batch mode step count
//   --interval-ms <n>    timer period in service mode (default 1000)
//   --cmd <endpoint>     REP endpoint ("" disables IPC)
//   --pub <endpoint>     PUB endpoint ("" disables IPC)
//
// Thread layout (service mode):
//   main thread   → waits for SIGINT
//   timer thread  → MarketEngine::advance_step() every interval
//   ipc thread    → IpcServer command loop and telemetry publishing
// -----------------------------------------------------------------------------

#include "procure/config/config_loader.hpp"
#include "procure/engine/simulation_service.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag for the signal handler. The only global in the program;
// an atomic store is async-signal-safe.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

namespace {

struct CommandLine {
  std::string config_path;
  procure::ServiceOptions options;
  std::int64_t steps{0};
};

void printUsage() {
  std::cerr << "usage: procure_sim [--config <file>] [--seed <n>] "
               "[--steps <n>] [--interval-ms <n>] [--cmd <endpoint>] "
               "[--pub <endpoint>]\n";
}

// Throws std::invalid_argument for an unknown flag, a missing value or a
// non-numeric number.
CommandLine parseCommandLine(int argc, char** argv) {
  CommandLine cli;
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
      throw std::invalid_argument("missing value for " + flag);
    }
    const std::string value = argv[++i];

    if (flag == "--config") {
      cli.config_path = value;
    } else if (flag == "--seed") {
      cli.options.seed = std::stoull(value);
    } else if (flag == "--steps") {
      cli.steps = std::stoll(value);
    } else if (flag == "--interval-ms") {
      cli.options.interval_ms = std::stoll(value);
    } else if (flag == "--cmd") {
      cli.options.cmd_endpoint = value;
    } else if (flag == "--pub") {
      cli.options.pub_endpoint = value;
    } else {
      throw std::invalid_argument("unknown option " + flag);
    }
  }
  if (cli.options.interval_ms <= 0) {
    throw std::invalid_argument("--interval-ms must be positive");
  }
  return cli;
}

}  // namespace

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Parse flags and load the model configuration.
  // -------------------------------------------------------------------------
  CommandLine cli;
  procure::domain::SimulationConfig config;
  try {
    cli = parseCommandLine(argc, argv);
    if (!cli.config_path.empty()) {
      config = procure::loadSimulationConfig(cli.config_path);
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    printUsage();
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Create the service and generate the initial population.
  // -------------------------------------------------------------------------
  procure::SimulationService service(config, cli.options);
  service.initialize();

  std::signal(SIGINT, sigint_handler);

  // -------------------------------------------------------------------------
  // 3a) Batch mode: synchronous steps, no threads.
  // -------------------------------------------------------------------------
  if (cli.steps > 0) {
    for (std::int64_t i = 0; i < cli.steps && !g_shutdown_requested.load();
         ++i) {
      std::cout << service.stepOnce().dump() << "\n";
    }
    std::cout << "[main] " << service.executeCommand("STATUS") << "\n";
    return 0;
  }

  // -------------------------------------------------------------------------
  // 3b) Service mode: timer + IPC until Ctrl-C.
  // -------------------------------------------------------------------------
  try {
    service.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] failed to start service: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] Simulation running. Press Ctrl-C to shut down.\n";
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 4) Clean shutdown: join the timer and IPC threads.
  // -------------------------------------------------------------------------
  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  service.stop();

  return 0;
}
