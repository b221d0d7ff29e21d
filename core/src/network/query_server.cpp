#include "evstream/network/query_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <utility>

namespace evstream {

namespace {
constexpr const char* kComponent = "QueryServer";
}  // namespace

QueryServer::QueryServer(RequestHandler handler, ILogger& logger,
                         std::string endpoint)
    : handler_(std::move(handler)),
      logger_(logger),
      endpoint_(std::move(endpoint)) {}

QueryServer::~QueryServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create the socket and spawn the worker thread
// -----------------------------------------------------------------------------
void QueryServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->bind(endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  logger_.info(kComponent, "query_server_started endpoint=" + endpoint_);
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void QueryServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  socket_.reset();
  context_.reset();

  logger_.info(kComponent, "query_server_stopped requests_served=" +
                               std::to_string(requests_served_.load()));
}

void QueryServer::run() {
  while (running_.load()) {
    serve_one();
  }
}

// -----------------------------------------------------------------------------
// serve_one(): recv with timeout, dispatch, reply
// -----------------------------------------------------------------------------
void QueryServer::serve_one() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string text(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = handler_(text);
  } catch (const std::exception& e) {
    logger_.error(kComponent,
                  std::string("query_handler_failed error=") + e.what());
    nlohmann::json err;
    err["status"] = "error";
    err["code"] = 500;
    err["error"] = e.what();
    response = err.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  socket_->send(reply, zmq::send_flags::none);
  requests_served_.fetch_add(1);
}

}  // namespace evstream
