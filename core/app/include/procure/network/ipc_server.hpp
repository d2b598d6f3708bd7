#pragma once

#include "procure/concurrent/thread_safe_queue.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace procure {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry gateway for the simulation host
// -----------------------------------------------------------------------------
//
// @brief  Runs one worker thread that answers commands on a REP socket and
//         broadcasts step telemetry on a PUB socket.
//
// @details
// Two ZeroMQ sockets share the worker thread:
//
//   1. REP socket (default tcp://127.0.0.1:5556):
//      Each request is a command string (a bare word such as "STATUS" or a
//      JSON object with a "cmd" key). It is handed to the CommandHandler,
//      bound to SimulationService::executeCommand(), and the JSON reply is
//      sent back. ZMQ_RCVTIMEO bounds each recv so the loop keeps
//      alternating with telemetry draining.
//
//   2. PUB socket (default tcp://127.0.0.1:5557):
//      Publishes already-serialized JSON telemetry, one message per
//      simulated step ({"type":"step", "step":n, "changes":{...}}).
//      Messages arrive through a ThreadSafeQueue<std::string> filled by the
//      simulation timer thread.
//
// A handler that throws does not kill the worker: the exception is logged
// and an error reply is sent so the REQ peer is never left waiting.
//
// Thread model:
//   start()/stop() are called from the owning thread (SimulationService).
//   pushTelemetry() may be called from any thread.
//   The CommandHandler runs on the IPC worker thread and must do its own
//   locking (SimulationService takes its engine mutex).
//
// Ownership:
//   Owned by SimulationService via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue, and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened and no thread is spawned until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: stops the worker if still running.
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds REP and PUB, sets the receive timeout and
  // spawns the worker. Idempotent. Throws zmq::error_t when an endpoint
  // cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Clears the running flag, joins the worker (it notices within
  // kPollTimeoutMs), publishes nothing further and closes the sockets.
  // Idempotent and safe when never started.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues one serialized telemetry message. Safe from any thread.
  void pushTelemetry(std::string message);

  bool running() const { return running_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: drain telemetry, then poll one command, until stopped.
  void run();

  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<std::string> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace procure
