// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace almond {
namespace network {

// Abstract message transport for the robot RPC link
// Allows dependency injection of different implementations:
// - WebSocketTransport: WebSocket over TCP via boost::beast
// - MockTransport: In-memory frame passing for testing (in test/)
//
// A transport carries discrete text frames; framing is the transport's job,
// the layers above always see whole JSON documents.

class Transport;
class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

using ConnectCallback = std::function<void(bool success)>;
using ReceiveCallback = std::function<void(const std::string &frame)>;
using DisconnectCallback = std::function<void()>;

// TransportConnection - one bidirectional message link to the remote peer
class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Start the read loop (receive callback invoked per frame, disconnect
  // callback once when the link goes away)
  virtual void start() = 0;

  // Queue one frame for sending.
  // Returns false if the connection is already closed at call time. A true
  // return means the frame was accepted; write failures surface later via the
  // disconnect callback.
  virtual bool send(const std::string &frame) = 0;

  // Close the link. The disconnect callback is not delivered for a close
  // requested locally.
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual uint64_t connection_id() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

// Transport - factory for outbound connections plus the event loop that
// drives them
class Transport {
public:
  virtual ~Transport() = default;

  // Initiate an outbound connection to host:port at the given resource path.
  // The callback fires exactly once with the outcome.
  virtual TransportConnectionPtr connect(const std::string &host, uint16_t port,
                                         const std::string &path,
                                         ConnectCallback callback) = 0;

  // Start the event loop (non-blocking; spawns the I/O thread)
  virtual void run() = 0;

  // Stop the event loop and join the I/O thread
  virtual void stop() = 0;

  virtual bool is_running() const = 0;
};

} // namespace network
} // namespace almond
