// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rpc/rpc_client.hpp"
#include "network/websocket_transport.hpp"
#include "rpc/codec.hpp"
#include "rpc/errors.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace almond {
namespace rpc {

RPCClient::RPCClient(const ClientConfig &config)
    : RPCClient(config,
                std::make_shared<network::WebSocketTransport>(config.connect_timeout)) {}

RPCClient::RPCClient(const ClientConfig &config,
                     std::shared_ptr<network::Transport> transport)
    : config_(config), transport_(std::move(transport)),
      connection_(transport_, config_, registry_) {
  if (!transport_) {
    throw std::invalid_argument("RPCClient requires a transport");
  }
}

RPCClient::~RPCClient() {
  connection_.close();
  // Joins the I/O thread: no transport callback can run past this point
  transport_->stop();
}

void RPCClient::Connect() { connection_.open(); }

void RPCClient::Disconnect() { connection_.close(); }

bool RPCClient::IsConnected() const { return connection_.is_open(); }

nlohmann::json RPCClient::Invoke(const std::string &method,
                                 const nlohmann::json &params) {
  return Invoke(method, params, config_.call_timeout);
}

nlohmann::json RPCClient::Invoke(const std::string &method,
                                 const nlohmann::json &params,
                                 std::chrono::milliseconds timeout) {
  if (!params.is_null() && !params.is_object()) {
    throw std::invalid_argument("params for '" + method + "' must be a JSON object");
  }

  for (int attempt = 0;; ++attempt) {
    bool reopened = connection_.ensure_open();

    RequestEnvelope request;
    request.id = next_id_.fetch_add(1);
    request.method = method;
    request.params = params.is_null() ? nlohmann::json::object() : params;

    // Registered before the send so that a fast response always finds its slot
    auto future = registry_.register_call(request.id, method);
    try {
      connection_.send(EncodeRequest(request));
    } catch (const Disconnected &e) {
      registry_.cancel(request.id);
      // At most one open() per call
      if (attempt >= MAX_SEND_RETRIES || reopened) {
        throw;
      }
      LOG_RPC_INFO("'{}' (id {}) found the connection stale ({}), retrying once",
                   method, request.id, e.what());
      continue;
    }

    LOG_RPC_DEBUG("-> '{}' (id {})", method, request.id);
    return Await(method, request.id, future, timeout);
  }
}

nlohmann::json RPCClient::Await(const std::string &method, uint64_t id,
                                std::future<nlohmann::json> &future,
                                std::chrono::milliseconds timeout) {
  if (timeout.count() > 0 &&
      future.wait_for(timeout) != std::future_status::ready) {
    // Losing the cancel race means the outcome landed at the deadline
    if (registry_.cancel(id)) {
      LOG_RPC_WARN("'{}' (id {}) timed out after {} ms", method, id, timeout.count());
      throw Timeout(method, id, timeout.count());
    }
  }

  // Rethrows RpcError or Disconnected delivered through the slot
  nlohmann::json result = future.get();
  LOG_RPC_DEBUG("<- '{}' (id {})", method, id);
  return result;
}

} // namespace rpc
} // namespace almond
