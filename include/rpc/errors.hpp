// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace almond {
namespace rpc {

// Base for every failure a caller of the RPC client can observe
class RPCException : public std::runtime_error {
public:
  explicit RPCException(const std::string &what) : std::runtime_error(what) {}
};

// The transport connection could not be established
class ConnectionError : public RPCException {
public:
  explicit ConnectionError(const std::string &what) : RPCException(what) {}
};

// The call was abandoned because the connection closed while it was pending
class Disconnected : public RPCException {
public:
  explicit Disconnected(const std::string &what) : RPCException(what) {}
};

// A frame or result could not be decoded into the expected shape.
// id is set when the frame named a call before it failed to decode.
class MalformedResponse : public RPCException {
public:
  explicit MalformedResponse(const std::string &what,
                             std::optional<uint64_t> id = std::nullopt)
      : RPCException(what), id_(id) {}

  const std::optional<uint64_t> &id() const noexcept { return id_; }

private:
  std::optional<uint64_t> id_;
};

// No response arrived before the caller's deadline
class Timeout : public RPCException {
public:
  Timeout(const std::string &method, uint64_t id, int64_t timeout_ms)
      : RPCException("RPC call '" + method + "' (id " + std::to_string(id) +
                     ") timed out after " + std::to_string(timeout_ms) + " ms"),
        method_(method), id_(id), timeout_ms_(timeout_ms) {}

  const std::string &method() const noexcept { return method_; }
  uint64_t id() const noexcept { return id_; }
  int64_t timeout_ms() const noexcept { return timeout_ms_; }

private:
  std::string method_;
  uint64_t id_;
  int64_t timeout_ms_;
};

// The remote peer reported a failure for one specific call
class RpcError : public RPCException {
public:
  RpcError(int64_t code, const std::string &message, const std::string &method,
           uint64_t id)
      : RPCException("RPC error " + std::to_string(code) + " from '" + method +
                     "' (id " + std::to_string(id) + "): " + message),
        code_(code), message_(message), method_(method), id_(id) {}

  int64_t code() const noexcept { return code_; }
  const std::string &message() const noexcept { return message_; }
  const std::string &method() const noexcept { return method_; }
  uint64_t id() const noexcept { return id_; }

private:
  int64_t code_;
  std::string message_;
  std::string method_;
  uint64_t id_;
};

} // namespace rpc
} // namespace almond
