// -----------------------------------------------------------------------------
// evstream_query_server: serves an event log directory over ZeroMQ.
//
//   1) Create an EventService over the output root.
//   2) Bind a QueryServer (REP socket) whose handler is QueryHandler.
//   3) Sleep on the main thread until SIGINT, then stop the server.
//
// Usage: evstream_query_server [output_root] [endpoint]
//
// Example client request (any REQ socket):
//   {"command":"get_events","simulation_id":"economy-...","limit":10}
// -----------------------------------------------------------------------------

#include "evstream/logging/console_logger.hpp"
#include "evstream/network/query_handler.hpp"
#include "evstream/network/query_server.hpp"
#include "evstream/service/event_service.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

// Set by the SIGINT handler, polled by main(). Lock-free atomic<bool> is
// safe to store from a signal handler.
static std::atomic<bool> g_stop_requested{false};

static void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

int main(int argc, char** argv) {
  const std::filesystem::path output_root =
      argc > 1 ? std::filesystem::path(argv[1])
               : std::filesystem::path("simulations");
  const std::string endpoint =
      argc > 2 ? std::string(argv[2])
               : std::string(evstream::QueryServer::kDefaultEndpoint);

  evstream::ConsoleLogger logger;
  evstream::EventService service(output_root, logger);
  evstream::QueryHandler handler(service);

  evstream::QueryServer server(
      [&handler](const std::string& request) {
        return handler.handle(request);
      },
      logger, endpoint);

  try {
    server.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] cannot bind " << endpoint << ": " << e.what()
              << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] serving " << output_root.string()
            << ". Ctrl-C to stop.\n";

  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  server.stop();
  return 0;
}
