#pragma once

#include "evstream/logging/i_logger.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

namespace evstream {

// -----------------------------------------------------------------------------
// QueryServer: ZeroMQ REP endpoint for event log queries
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that receives request strings on a REP
//         socket, passes each to a handler callback, and sends back the
//         handler's response.
//
// @details
// The REP socket uses ZMQ_RCVTIMEO (kPollTimeoutMs) so the worker never
// blocks indefinitely in recv() and notices stop() promptly. Requests are
// served strictly one at a time, which is what REP enforces anyway.
//
// The handler is normally bound to QueryHandler::handle(), which never
// throws. Should a handler throw a std::exception anyway, the server logs it
// and replies with a 500 error document so the REQ peer is not left waiting.
//
// Thread model:
//   start() and stop() are called from the owning thread. The handler runs
//   on the server thread.
//
// Ownership:
//   Owns the ZMQ context, the socket and the worker thread. Holds a copy of
//   the handler and a reference to the logger.
// -----------------------------------------------------------------------------
class QueryServer {
 public:
  using RequestHandler = std::function<std::string(const std::string&)>;

  static constexpr const char* kDefaultEndpoint = "tcp://127.0.0.1:5560";

  QueryServer(RequestHandler handler, ILogger& logger,
              std::string endpoint = kDefaultEndpoint);

  // RAII: stops the worker if it is still running.
  ~QueryServer();

  QueryServer(const QueryServer&) = delete;
  QueryServer& operator=(const QueryServer&) = delete;
  QueryServer(QueryServer&&) = delete;
  QueryServer& operator=(QueryServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Creates the context, binds the REP socket and spawns the worker.
  //
  // @throws zmq::error_t when the endpoint cannot be bound.
  //
  // Idempotent: calling start() when already running is a no-op.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it and closes the socket. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  const std::string& endpoint() const { return endpoint_; }

  std::size_t requests_served() const { return requests_served_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();

  // One recv/handle/send cycle. Returns quietly on timeout.
  void serve_one();

  RequestHandler handler_;
  ILogger& logger_;
  std::string endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;

  std::atomic<bool> running_{false};
  std::atomic<std::size_t> requests_served_{0};
  std::thread thread_;
};

}  // namespace evstream
