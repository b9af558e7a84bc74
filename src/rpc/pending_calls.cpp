// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rpc/pending_calls.hpp"
#include "rpc/errors.hpp"
#include "util/logging.hpp"
#include <stdexcept>
#include <vector>

namespace almond {
namespace rpc {

namespace {

int64_t ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

} // namespace

PendingCallRegistry::~PendingCallRegistry() {
  // Nothing may be left waiting forever on a destroyed registry
  abandon_all(std::make_exception_ptr(Disconnected("RPC client destroyed")));
}

std::future<nlohmann::json> PendingCallRegistry::register_call(uint64_t id,
                                                               const std::string &method) {
  std::lock_guard<std::mutex> lock(mutex_);

  PendingCall call{id, method, std::promise<nlohmann::json>(),
                   std::chrono::steady_clock::now()};
  auto future = call.promise.get_future();

  auto [it, inserted] = calls_.emplace(id, std::move(call));
  if (!inserted) {
    throw std::logic_error("RPC id " + std::to_string(id) +
                           " registered twice (pending call '" + it->second.method + "')");
  }
  return future;
}

bool PendingCallRegistry::take(uint64_t id, const char *action, PendingCall &out) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(id);
    if (it != calls_.end()) {
      out = std::move(it->second);
      calls_.erase(it);
      return true;
    }
  }
  LOG_RPC_WARN("protocol anomaly: {} for unknown or completed id {} dropped", action, id);
  return false;
}

bool PendingCallRegistry::resolve(uint64_t id, nlohmann::json result) {
  PendingCall call;
  if (!take(id, "result", call)) {
    return false;
  }
  LOG_RPC_TRACE("'{}' (id {}) resolved after {} ms", call.method, id, ElapsedMs(call.created_at));
  call.promise.set_value(std::move(result));
  return true;
}

bool PendingCallRegistry::reject(uint64_t id, const ErrorObject &error) {
  PendingCall call;
  if (!take(id, "error", call)) {
    return false;
  }
  LOG_RPC_DEBUG("'{}' (id {}) failed remotely after {} ms: {} {}", call.method, id,
                ElapsedMs(call.created_at), error.code, error.message);
  call.promise.set_exception(
      std::make_exception_ptr(RpcError(error.code, error.message, call.method, id)));
  return true;
}

bool PendingCallRegistry::fail(uint64_t id, std::exception_ptr error) {
  PendingCall call;
  if (!take(id, "failure", call)) {
    return false;
  }
  call.promise.set_exception(error);
  return true;
}

bool PendingCallRegistry::cancel(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_.erase(id) > 0;
}

size_t PendingCallRegistry::abandon_all(std::exception_ptr error) {
  std::vector<PendingCall> abandoned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    abandoned.reserve(calls_.size());
    for (auto &[id, call] : calls_) {
      abandoned.push_back(std::move(call));
    }
    calls_.clear();
  }

  for (auto &call : abandoned) {
    LOG_RPC_DEBUG("abandoning '{}' (id {}) after {} ms", call.method, call.id,
                  ElapsedMs(call.created_at));
    call.promise.set_exception(error);
  }
  return abandoned.size();
}

size_t PendingCallRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_.size();
}

bool PendingCallRegistry::contains(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_.count(id) > 0;
}

} // namespace rpc
} // namespace almond
