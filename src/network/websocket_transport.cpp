// Copyright (c) 2025 The Unicity Foundation
// WebSocket transport implementation using boost::beast over boost::asio

#include "network/websocket_transport.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <cassert>

namespace almond {
namespace network {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// ============================================================================
// WebSocketConnection
// ============================================================================

std::atomic<uint64_t> WebSocketConnection::next_id_{1};

TransportConnectionPtr WebSocketConnection::create_outbound(
    net::io_context &io_context, const std::string &host, uint16_t port,
    const std::string &path, std::chrono::milliseconds connect_timeout,
    ConnectCallback callback) {
  auto conn = std::shared_ptr<WebSocketConnection>(
      new WebSocketConnection(io_context, host, port, connect_timeout));
  // Defer do_connect onto the strand so shared_from_this() is safe and the
  // object lifetime is extended regardless of factory return-value usage.
  net::post(conn->strand_, [conn, host, port, path, callback]() mutable {
    conn->do_connect(host, port, path, std::move(callback));
  });
  return conn;
}

WebSocketConnection::WebSocketConnection(net::io_context &io_context,
                                         const std::string &host, uint16_t port,
                                         std::chrono::milliseconds connect_timeout)
    : io_context_(io_context),
      strand_(io_context.get_executor()),
      ws_(strand_),
      resolver_(strand_),
      connect_timeout_(connect_timeout),
      id_(next_id_++),
      remote_host_(host),
      remote_port_(port) {}

WebSocketConnection::~WebSocketConnection() {
  // Cleanup happens in close() while the shared_ptr is still alive.
  // Do not log here; the logging subsystem may already be shut down.
}

void WebSocketConnection::do_connect(const std::string &host, uint16_t port,
                                     const std::string &path,
                                     ConnectCallback callback) {
  if (close_requested_) {
    finish_connect(false, callback);
    return;
  }

  resolver_.async_resolve(
      host, std::to_string(port),
      net::bind_executor(strand_,
      [this, self = shared_from_this(), path, callback](const beast::error_code &ec,
                 tcp::resolver::results_type results) {
        if (connect_done_) return;
        if (ec || close_requested_) {
          LOG_TRANSPORT_DEBUG("failed to resolve {}: {}", remote_host_, ec.message());
          finish_connect(false, callback);
          return;
        }

        // tcp_stream enforces the connect deadline
        beast::get_lowest_layer(ws_).expires_after(connect_timeout_);
        beast::get_lowest_layer(ws_).async_connect(
            results,
            net::bind_executor(strand_,
            [this, self, path, callback](const beast::error_code &ec,
                                         const tcp::endpoint &) {
              if (connect_done_) return;
              if (ec || close_requested_) {
                LOG_TRANSPORT_DEBUG("failed to connect to {}:{}: {}", remote_host_,
                                    remote_port_, ec.message());
                finish_connect(false, callback);
                return;
              }

              // The websocket layer owns timeouts from here on
              beast::get_lowest_layer(ws_).expires_never();
              beast::error_code opt_ec;
              beast::get_lowest_layer(ws_).socket().set_option(tcp::no_delay(true), opt_ec);

              websocket::stream_base::timeout timeouts{};
              timeouts.handshake_timeout = connect_timeout_;
              timeouts.idle_timeout = websocket::stream_base::none();
              timeouts.keep_alive_pings = false;
              ws_.set_option(timeouts);
              ws_.set_option(websocket::stream_base::decorator(
                  [](websocket::request_type &req) {
                    req.set(beast::http::field::user_agent, GetUserAgent());
                  }));
              ws_.read_message_max(MAX_FRAME_SIZE);

              // Host header carries the port per RFC 7230
              std::string host_header = remote_host_ + ":" + std::to_string(remote_port_);
              ws_.async_handshake(
                  host_header, path,
                  net::bind_executor(strand_,
                  [this, self, path, callback](const beast::error_code &ec) {
                    if (connect_done_) return;
                    if (ec || close_requested_) {
                      LOG_TRANSPORT_DEBUG("websocket handshake with {}:{}{} failed: {}",
                                          remote_host_, remote_port_, path, ec.message());
                      finish_connect(false, callback);
                      return;
                    }

                    ws_.text(true);
                    handshake_done_ = true;
                    open_ = true;
                    LOG_TRANSPORT_DEBUG("connected to ws://{}:{}{} (connection {})",
                                        remote_host_, remote_port_, path, id_);
                    finish_connect(true, callback);
                  }));  // end async_handshake
            }));  // end async_connect
      }));  // end async_resolve
}

void WebSocketConnection::finish_connect(bool success, const ConnectCallback &callback) {
  connect_done_ = true;
  if (!success) {
    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);
  }
  if (callback) {
    try {
      callback(success);
    } catch (const std::exception &e) {
      LOG_TRANSPORT_WARN("exception in connect callback: {}", e.what());
    }
  }
}

void WebSocketConnection::start() {
  net::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_)
      return;
    self->start_read_impl();
  });
}

void WebSocketConnection::start_read_impl() {
  if (!open_)
    return;

#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif

  ws_.async_read(
      read_buffer_,
      net::bind_executor(
          strand_,
          [this, self = shared_from_this()](const beast::error_code &ec,
                                            size_t bytes_transferred) {
        // Closed locally while the read was pending: nothing to report
        if (!open_) {
          return;
        }

        if (ec) {
          if (ec == websocket::error::closed) {
            LOG_TRANSPORT_DEBUG("peer {}:{} closed the websocket (reason: {})",
                                remote_host_, remote_port_,
                                std::string(ws_.reason().reason.c_str()));
          } else if (ec != net::error::operation_aborted) {
            LOG_TRANSPORT_DEBUG("read error from {}:{}: {}", remote_host_,
                                remote_port_, ec.message());
          }
          deliver_disconnect_once();
          close_impl(false);
          return;
        }

        std::string frame = beast::buffers_to_string(read_buffer_.data());
        read_buffer_.consume(read_buffer_.size());

        if (!ws_.got_text()) {
          LOG_TRANSPORT_WARN("ignoring binary frame ({} bytes) from {}:{}",
                             bytes_transferred, remote_host_, remote_port_);
        } else if (receive_callback_) {
          LOG_TRANSPORT_TRACE("received {} bytes from {}:{}", bytes_transferred,
                              remote_host_, remote_port_);
          ReceiveCallback saved_receive_cb = receive_callback_;
          try {
            saved_receive_cb(frame);
          } catch (const std::exception &e) {
            LOG_TRANSPORT_WARN("exception in receive callback from {}:{}: {}",
                               remote_host_, remote_port_, e.what());
          }
        }

        // If the receive callback closed the connection, do not reschedule
        if (!open_) {
          return;
        }
        start_read_impl();
      }));
}

// Returns false only if the connection is already closed at call time. Queue
// overflow is enforced on the strand and results in a disconnect.
bool WebSocketConnection::send(const std::string &frame) {
  if (!open_) return false;
  // Copy before posting: the caller's buffer may be gone by the time the
  // strand runs the lambda.
  auto payload = std::make_shared<std::string>(frame);
  net::dispatch(strand_, [this, self = shared_from_this(), payload]() {
    if (!open_) return;

    if (send_queue_bytes_ + payload->size() > SEND_QUEUE_LIMIT) {
      LOG_TRANSPORT_WARN("send queue overflow ({} bytes queued, {} incoming), "
                         "dropping connection to {}:{}",
                         send_queue_bytes_, payload->size(), remote_host_, remote_port_);
      deliver_disconnect_once();
      close_impl(false);
      return;
    }

    send_queue_.push(payload);
    send_queue_bytes_ += payload->size();

    if (!writing_) {
      writing_ = true;
      do_write_impl();
    }
  });
  return true;
}

void WebSocketConnection::do_write_impl() {
  if (!open_)
    return;
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif

  if (send_queue_.empty()) {
    writing_ = false;
    return;
  }

  auto data_ptr = send_queue_.front();

  ws_.async_write(
      net::buffer(*data_ptr),
      net::bind_executor(
          strand_,
          [this, self = shared_from_this(), data_ptr](const beast::error_code &ec,
                                                      size_t) {
        // Connection closed while the write was in flight; queue already cleared
        if (!open_) {
          return;
        }

        if (ec) {
          LOG_TRANSPORT_DEBUG("write error to {}:{}: {}", remote_host_, remote_port_,
                              ec.message());
          deliver_disconnect_once();
          close_impl(false);
          return;
        }

        send_queue_.pop();
        send_queue_bytes_ -= data_ptr->size();
        LOG_TRANSPORT_TRACE("sent {} bytes to {}:{}", data_ptr->size(),
                            remote_host_, remote_port_);

        if (!send_queue_.empty()) {
          do_write_impl();
        } else {
          writing_ = false;
        }
      }));
}

void WebSocketConnection::deliver_disconnect_once() {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif
  if (disconnect_delivered_) {
    return;
  }
  disconnect_delivered_ = true;

  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  disconnect_callback_ = {};
  if (saved_disconnect_cb) {
    // Post to io_context (not strand) to avoid re-entering the strand
    net::post(io_context_, [cb = std::move(saved_disconnect_cb)]() {
      try {
        cb();
      } catch (const std::exception &e) {
        LOG_TRANSPORT_WARN("exception in disconnect callback: {}", e.what());
      }
    });
  }
}

void WebSocketConnection::close() {
  net::dispatch(strand_, [this, self = shared_from_this()]() {
    close_impl(true);
  });
}

void WebSocketConnection::close_impl(bool graceful) {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif
  close_requested_ = true;
  bool was_open = open_.exchange(false);

  // Callbacks are dropped without invocation: a local close is not reported
  receive_callback_ = {};
  disconnect_callback_ = {};

  // Frames still queued are discarded with the connection
  std::queue<std::shared_ptr<std::string>> queue_to_destroy;
  std::swap(send_queue_, queue_to_destroy);
  send_queue_bytes_ = 0;
  writing_ = false;

  if (!connect_done_) {
    // Abort an in-progress connect; its handlers observe the error and report
    // failure through the connect callback.
    resolver_.cancel();
    beast::get_lowest_layer(ws_).cancel();
    return;
  }

  if (!was_open || !handshake_done_ || !graceful) {
    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);
    return;
  }

  // Closing handshake; bounded by the websocket handshake timeout
  ws_.async_close(
      websocket::close_code::normal,
      net::bind_executor(strand_, [this, self = shared_from_this()](const beast::error_code &ec) {
        if (ec && ec != net::error::operation_aborted) {
          LOG_TRANSPORT_TRACE("websocket close with {}:{} ended with: {}", remote_host_,
                              remote_port_, ec.message());
        }
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
      }));
}

bool WebSocketConnection::is_open() const { return open_; }

std::string WebSocketConnection::remote_address() const { return remote_host_; }

uint16_t WebSocketConnection::remote_port() const { return remote_port_; }

void WebSocketConnection::set_receive_callback(ReceiveCallback callback) {
  net::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    receive_callback_ = std::move(cb);
  });
}

void WebSocketConnection::set_disconnect_callback(DisconnectCallback callback) {
  net::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    disconnect_callback_ = std::move(cb);
  });
}

// ============================================================================
// WebSocketTransport
// ============================================================================

WebSocketTransport::WebSocketTransport(std::chrono::milliseconds connect_timeout)
    : io_context_(std::make_unique<net::io_context>()),
      connect_timeout_(connect_timeout) {}

WebSocketTransport::~WebSocketTransport() { stop(); }

TransportConnectionPtr WebSocketTransport::connect(const std::string &host,
                                                   uint16_t port,
                                                   const std::string &path,
                                                   ConnectCallback callback) {
  return WebSocketConnection::create_outbound(*io_context_, host, port, path,
                                              connect_timeout_, std::move(callback));
}

void WebSocketTransport::run() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<net::executor_work_guard<
      net::io_context::executor_type>>(net::make_work_guard(*io_context_));
  io_thread_ = std::thread([this]() { io_context_->run(); });
}

void WebSocketTransport::stop() {
  running_.store(false);

  // Don't log here - this is called from destructor, logger may be shut down

  work_guard_.reset();
  io_context_->stop();

  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

} // namespace network
} // namespace almond
