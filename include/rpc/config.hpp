// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace almond {
namespace rpc {

namespace defaults {
constexpr const char *HOST = "almond-bot.local";
constexpr uint16_t PORT = 8000;
constexpr const char *PATH = "/ws";
constexpr std::chrono::milliseconds CONNECT_TIMEOUT{std::chrono::seconds(10)};
} // namespace defaults

/**
 * ClientConfig - everything needed to reach the robot server
 *
 * call_timeout applies to every invoke() that does not pass its own deadline;
 * zero means wait indefinitely.
 */
struct ClientConfig {
  std::string host = defaults::HOST;
  uint16_t port = defaults::PORT;
  std::string path = defaults::PATH;
  std::chrono::milliseconds connect_timeout = defaults::CONNECT_TIMEOUT;
  std::chrono::milliseconds call_timeout{0};

  // ws://host:port/path, for logs and error messages
  std::string endpoint() const {
    return "ws://" + host + ":" + std::to_string(port) + path;
  }
};

} // namespace rpc
} // namespace almond
