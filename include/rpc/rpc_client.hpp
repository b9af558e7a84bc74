// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include "rpc/config.hpp"
#include "rpc/connection_manager.hpp"
#include "rpc/pending_calls.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace almond {
namespace rpc {

/**
 * JSON-RPC 2.0 client for the robot server
 *
 * Many threads may call Invoke() at once; every call is multiplexed over one
 * WebSocket connection and correlated with its response by identifier, never
 * by send order. Each caller blocks only on its own call.
 *
 * Failures are reported as exceptions from errors.hpp:
 * - ConnectionError: the endpoint could not be reached (after one reconnect)
 * - Disconnected: the connection dropped while the call was pending
 * - RpcError: the server answered with an error object
 * - Timeout: the call's deadline elapsed; a late answer is discarded
 */
class RPCClient {
public:
  /**
   * Constructor
   * @param config Endpoint and timeouts; a WebSocketTransport is created
   */
  explicit RPCClient(const ClientConfig &config);

  /**
   * Constructor with an injected transport (tests, alternative links)
   */
  RPCClient(const ClientConfig &config, std::shared_ptr<network::Transport> transport);

  /**
   * Closes the connection (abandoning pending calls) and stops the transport
   */
  ~RPCClient();

  RPCClient(const RPCClient&) = delete;
  RPCClient& operator=(const RPCClient&) = delete;

  /**
   * Connect to the server. Calling Invoke() on a closed client connects
   * implicitly, so this is only needed to fail early.
   * @throws ConnectionError
   */
  void Connect();

  /**
   * Disconnect; pending calls fail with Disconnected
   */
  void Disconnect();

  bool IsConnected() const;

  /**
   * Call a remote method and wait for its result
   * @param method Method name (e.g., "set_speed", "get_joint_angles")
   * @param params Parameter object (null is sent as {})
   * @return the raw "result" value (may be null)
   */
  nlohmann::json Invoke(const std::string &method,
                        const nlohmann::json &params = nlohmann::json::object());

  /**
   * Same as Invoke() with an explicit deadline (zero disables it)
   */
  nlohmann::json Invoke(const std::string &method, const nlohmann::json &params,
                        std::chrono::milliseconds timeout);

  /**
   * Number of calls currently waiting for a response
   */
  size_t PendingCalls() const { return registry_.size(); }

  const ClientConfig &config() const { return config_; }

private:
  nlohmann::json Await(const std::string &method, uint64_t id,
                       std::future<nlohmann::json> &future,
                       std::chrono::milliseconds timeout);

  // A send that finds an already open connection stale reconnects and
  // resends once. One Invoke() opens the connection at most once.
  static constexpr int MAX_SEND_RETRIES = 1;

  ClientConfig config_;
  std::shared_ptr<network::Transport> transport_;
  PendingCallRegistry registry_;
  ConnectionManager connection_;
  std::atomic<uint64_t> next_id_{1};
};

} // namespace rpc
} // namespace almond
