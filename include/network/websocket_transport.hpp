// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <memory>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace almond {
namespace network {

/**
 * WebSocketConnection - WebSocket client implementation of TransportConnection
 *
 * Wraps boost::beast::websocket::stream over a tcp_stream. Every socket
 * operation runs on strand_, so at most one read and one write are in flight
 * and outbound frames are never interleaved.
 */
class WebSocketConnection
    : public TransportConnection,
      public std::enable_shared_from_this<WebSocketConnection> {
public:
  /**
   * Create outbound connection: resolve, TCP connect, WebSocket handshake.
   * The callback fires exactly once with the outcome.
   */
  static TransportConnectionPtr
  create_outbound(boost::asio::io_context &io_context, const std::string &host,
                  uint16_t port, const std::string &path,
                  std::chrono::milliseconds connect_timeout,
                  ConnectCallback callback);

  ~WebSocketConnection() override;

  WebSocketConnection(const WebSocketConnection&) = delete;
  WebSocketConnection& operator=(const WebSocketConnection&) = delete;
  WebSocketConnection(WebSocketConnection&&) = delete;
  WebSocketConnection& operator=(WebSocketConnection&&) = delete;

  // TransportConnection interface
  void start() override;
  bool send(const std::string &frame) override;
  void close() override;
  bool is_open() const override;
  std::string remote_address() const override;
  uint16_t remote_port() const override;
  uint64_t connection_id() const override { return id_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

  // Largest inbound frame accepted before the link is dropped
  static constexpr size_t MAX_FRAME_SIZE = 16 * 1024 * 1024;
  // Bytes allowed to wait in the send queue before the link is dropped
  static constexpr size_t SEND_QUEUE_LIMIT = 8 * 1024 * 1024;

private:
  WebSocketConnection(boost::asio::io_context &io_context,
                      const std::string &host, uint16_t port,
                      std::chrono::milliseconds connect_timeout);

  void do_connect(const std::string &host, uint16_t port,
                  const std::string &path, ConnectCallback callback);
  void finish_connect(bool success, const ConnectCallback &callback);

  // Strand-serialized internals (must be called on strand_)
  void start_read_impl();
  void do_write_impl();
  // graceful: run the WebSocket closing handshake before closing the socket
  void close_impl(bool graceful);

  // Deliver disconnect callback exactly once (must be called on strand_)
  void deliver_disconnect_once();

  boost::asio::io_context &io_context_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::asio::ip::tcp::resolver resolver_;
  boost::beast::flat_buffer read_buffer_;
  std::chrono::milliseconds connect_timeout_;
  uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  // Callbacks (accessed only on strand_)
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};

  // Send queue (accessed only on strand_)
  std::queue<std::shared_ptr<std::string>> send_queue_;
  size_t send_queue_bytes_ = 0;
  bool writing_ = false;

  // Set once the WebSocket handshake completed; guards the closing handshake
  bool handshake_done_ = false;
  bool connect_done_ = false;
  bool close_requested_ = false;

  std::atomic<bool> open_{false};
  const std::string remote_host_;
  const uint16_t remote_port_;
};

/**
 * WebSocketTransport - boost::asio/beast implementation of Transport
 *
 * Owns the io_context and the single I/O thread that runs every
 * connection's read loop and write queue.
 */
class WebSocketTransport : public Transport {
public:
  static constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{std::chrono::seconds(10)};

  explicit WebSocketTransport(std::chrono::milliseconds connect_timeout = DEFAULT_CONNECT_TIMEOUT);
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport&) = delete;
  WebSocketTransport& operator=(const WebSocketTransport&) = delete;

  // Transport interface
  TransportConnectionPtr connect(const std::string &host, uint16_t port,
                                 const std::string &path,
                                 ConnectCallback callback) override;
  void run() override;
  void stop() override;
  bool is_running() const override { return running_; }

  boost::asio::io_context &io_context() { return *io_context_; }

private:
  // io_context_ is destroyed only in ~WebSocketTransport(), after the I/O
  // thread is joined, so it outlives every connection handler.
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};
  std::chrono::milliseconds connect_timeout_;
};

} // namespace network
} // namespace almond
