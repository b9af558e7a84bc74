// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "rpc/codec.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace almond {
namespace rpc {

/**
 * PendingCallRegistry - tracks every in-flight request by identifier
 *
 * Each registered call owns a single-resolution slot (std::promise). The
 * registry is the only place a call's lifetime is decided: a call leaves it
 * exactly once, by resolve(), reject(), fail(), cancel() or abandon_all().
 *
 * Registration happens on caller threads, completion on the transport I/O
 * thread; one mutex serializes all access to the map. Promises are completed
 * after the entry is removed and outside the lock.
 *
 * The remote peer is not trusted: completing an unknown identifier (never
 * registered, already completed, or cancelled after a timeout) is a no-op that
 * is logged as a protocol anomaly.
 */
class PendingCallRegistry {
public:
  PendingCallRegistry() = default;
  ~PendingCallRegistry();

  PendingCallRegistry(const PendingCallRegistry&) = delete;
  PendingCallRegistry& operator=(const PendingCallRegistry&) = delete;

  /**
   * Create the slot for a new call.
   * @throws std::logic_error if id is already registered
   */
  std::future<nlohmann::json> register_call(uint64_t id, const std::string &method);

  // Complete with the peer's result. Returns false for an unknown id.
  bool resolve(uint64_t id, nlohmann::json result);

  // Complete with RpcError built from the peer's error object.
  bool reject(uint64_t id, const ErrorObject &error);

  // Complete with an arbitrary failure.
  bool fail(uint64_t id, std::exception_ptr error);

  // Remove without completing; the caller owning the future reports the
  // outcome itself (timeout, failed send). Returns false if already gone.
  bool cancel(uint64_t id);

  // Fail every registered call with error and clear the registry.
  // Returns the number of calls abandoned.
  size_t abandon_all(std::exception_ptr error);

  size_t size() const;
  bool contains(uint64_t id) const;

private:
  struct PendingCall {
    uint64_t id;
    std::string method;
    std::promise<nlohmann::json> promise;
    std::chrono::steady_clock::time_point created_at;
  };

  // Remove the entry for id; returns false (and logs) if it is unknown
  bool take(uint64_t id, const char *action, PendingCall &out);

  mutable std::mutex mutex_;
  std::unordered_map<uint64_t, PendingCall> calls_;
};

} // namespace rpc
} // namespace almond
