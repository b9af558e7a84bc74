// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include "rpc/config.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace almond {
namespace rpc {

class PendingCallRegistry;

enum class ConnectionState { CLOSED, OPENING, OPEN };

const char *ConnectionStateName(ConnectionState state);

/**
 * ConnectionManager - owns the single link to the robot server
 *
 * State machine: CLOSED -> OPENING -> OPEN -> CLOSED. Leaving OPEN (local
 * close, peer close, write failure) abandons every pending call with
 * Disconnected under the same lock that publishes the state change, so a
 * caller never observes a half-open connection and never has a call abandoned
 * on behalf of a connection it did not use.
 *
 * Locking:
 * - lifecycle_mutex_ serializes open() and close(); the blocking connect runs
 *   under it so concurrent callers queue behind a single reconnect attempt.
 * - state_mutex_ guards state_ and connection_ and is only held briefly; the
 *   transport I/O thread takes it on disconnect, never lifecycle_mutex_.
 *
 * Inbound frames arrive on the transport I/O thread (the receive loop) and
 * are routed to the registry by identifier. Malformed frames are logged and
 * skipped without affecting other pending calls.
 */
class ConnectionManager {
public:
  ConnectionManager(std::shared_ptr<network::Transport> transport,
                    const ClientConfig &config, PendingCallRegistry &registry);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  /**
   * Establish the connection. No-op when already open.
   * @throws ConnectionError if the endpoint is unreachable, the handshake
   * fails or the connect timeout elapses
   */
  void open();

  /**
   * Close the connection and abandon all pending calls with Disconnected.
   * No-op when already closed.
   */
  void close();

  /**
   * Auto-reconnect: if closed, make exactly one open() attempt.
   * @return true if this call opened the connection
   * @throws ConnectionError if that attempt fails
   */
  bool ensure_open();

  /**
   * Write one encoded request frame.
   * @throws Disconnected if there is no open connection or the transport
   * refuses the frame (the link is then treated as dropped)
   */
  void send(const std::string &frame);

  ConnectionState state() const;
  bool is_open() const;
  const ClientConfig &config() const { return config_; }

private:
  // Transport callbacks; run on the transport I/O thread
  void on_frame(const std::string &frame);
  void on_disconnect(uint64_t connection_id);

  // Must be called with state_mutex_ held
  void drop_locked(const std::string &reason);

  std::shared_ptr<network::Transport> transport_;
  ClientConfig config_;
  PendingCallRegistry &registry_;

  std::mutex lifecycle_mutex_;
  mutable std::mutex state_mutex_;
  ConnectionState state_ = ConnectionState::CLOSED;
  network::TransportConnectionPtr connection_;
};

} // namespace rpc
} // namespace almond
