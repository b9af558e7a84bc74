// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rpc/connection_manager.hpp"
#include "rpc/codec.hpp"
#include "rpc/errors.hpp"
#include "rpc/pending_calls.hpp"
#include "util/logging.hpp"
#include <future>

namespace almond {
namespace rpc {

const char *ConnectionStateName(ConnectionState state) {
  switch (state) {
  case ConnectionState::CLOSED:
    return "closed";
  case ConnectionState::OPENING:
    return "opening";
  case ConnectionState::OPEN:
    return "open";
  }
  return "unknown";
}

ConnectionManager::ConnectionManager(std::shared_ptr<network::Transport> transport,
                                     const ClientConfig &config,
                                     PendingCallRegistry &registry)
    : transport_(std::move(transport)), config_(config), registry_(registry) {}

ConnectionManager::~ConnectionManager() { close(); }

void ConnectionManager::open() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == ConnectionState::OPEN) {
      return;
    }
    state_ = ConnectionState::OPENING;
  }

  if (!transport_->is_running()) {
    transport_->run();
  }

  LOG_RPC_DEBUG("connecting to {}", config_.endpoint());

  auto outcome = std::make_shared<std::promise<bool>>();
  auto connected_future = outcome->get_future();
  auto conn = transport_->connect(config_.host, config_.port, config_.path,
                                  [outcome](bool success) { outcome->set_value(success); });

  bool connected = false;
  if (conn) {
    if (connected_future.wait_for(config_.connect_timeout) == std::future_status::ready) {
      connected = connected_future.get();
    } else {
      LOG_RPC_WARN("connect to {} timed out after {} ms", config_.endpoint(),
                   config_.connect_timeout.count());
      conn->close();
    }
  }

  if (!connected) {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      state_ = ConnectionState::CLOSED;
    }
    throw ConnectionError("cannot connect to " + config_.endpoint());
  }

  // Callbacks go in before the connection is published so no drop is missed
  uint64_t connection_id = conn->connection_id();
  conn->set_receive_callback([this](const std::string &frame) { on_frame(frame); });
  conn->set_disconnect_callback([this, connection_id]() { on_disconnect(connection_id); });
  conn->start();

  std::lock_guard<std::mutex> lock(state_mutex_);
  connection_ = conn;
  state_ = ConnectionState::OPEN;

  // The link may have died before the disconnect callback could match it
  if (!connection_->is_open()) {
    drop_locked("connection to " + config_.endpoint() + " lost while opening");
    throw ConnectionError("connection to " + config_.endpoint() + " lost while opening");
  }

  LOG_RPC_INFO("connected to {} (connection {})", config_.endpoint(), connection_id);
}

void ConnectionManager::close() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  std::lock_guard<std::mutex> lock(state_mutex_);

  if (state_ == ConnectionState::CLOSED && !connection_) {
    return;
  }

  LOG_RPC_INFO("closing connection to {}", config_.endpoint());
  drop_locked("connection to " + config_.endpoint() + " closed by client");
}

bool ConnectionManager::ensure_open() {
  if (is_open()) {
    return false;
  }
  LOG_RPC_INFO("connection to {} is closed, reconnecting", config_.endpoint());
  open();
  return true;
}

void ConnectionManager::send(const std::string &frame) {
  std::lock_guard<std::mutex> lock(state_mutex_);

  if (state_ != ConnectionState::OPEN || !connection_) {
    throw Disconnected("not connected to " + config_.endpoint());
  }

  if (!connection_->send(frame)) {
    std::string reason = "connection to " + config_.endpoint() + " lost before send";
    LOG_RPC_WARN("{}", reason);
    drop_locked(reason);
    throw Disconnected(reason);
  }

  LOG_RPC_TRACE("sent frame: {}", frame);
}

ConnectionState ConnectionManager::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

bool ConnectionManager::is_open() const {
  return state() == ConnectionState::OPEN;
}

void ConnectionManager::on_frame(const std::string &frame) {
  LOG_RPC_TRACE("received frame: {}", frame);

  ResponseEnvelope response;
  try {
    response = DecodeResponse(frame);
  } catch (const MalformedResponse &e) {
    if (e.id() && registry_.fail(*e.id(), std::current_exception())) {
      LOG_RPC_WARN("malformed response for call {} from {}: {}", *e.id(),
                   config_.endpoint(), e.what());
      return;
    }
    LOG_RPC_WARN("dropping malformed frame from {}: {}", config_.endpoint(), e.what());
    return;
  }

  if (response.is_error()) {
    registry_.reject(response.id, *response.error);
  } else {
    registry_.resolve(response.id, std::move(response.result));
  }
}

void ConnectionManager::on_disconnect(uint64_t connection_id) {
  std::lock_guard<std::mutex> lock(state_mutex_);

  if (!connection_ || connection_->connection_id() != connection_id) {
    LOG_RPC_DEBUG("ignoring close of stale connection {}", connection_id);
    return;
  }

  std::string reason = "connection to " + config_.endpoint() + " lost";
  LOG_RPC_WARN("{}", reason);
  drop_locked(reason);
}

void ConnectionManager::drop_locked(const std::string &reason) {
  auto conn = std::move(connection_);
  connection_.reset();
  state_ = ConnectionState::CLOSED;

  if (conn) {
    conn->close();
  }

  size_t abandoned = registry_.abandon_all(std::make_exception_ptr(Disconnected(reason)));
  if (abandoned > 0) {
    LOG_RPC_WARN("{} pending call(s) abandoned: {}", abandoned, reason);
  }
}

} // namespace rpc
} // namespace almond
