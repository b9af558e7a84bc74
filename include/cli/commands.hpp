// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "robot/almond_client.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace almond {
namespace cli {

// Bad command name, argument count or argument value
class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * CommandDispatcher - maps text commands onto AlmondClient calls
 *
 * Shared by the one-shot CLI and the interactive shell. Arguments are
 * positional strings; each handler validates and converts its own. Commands
 * without a result return null.
 *
 * Execute() throws UsageError for input problems; rpc:: exceptions from the
 * robot propagate unchanged.
 */
class CommandDispatcher {
public:
  using CommandHandler = std::function<nlohmann::json(const std::vector<std::string> &)>;

  explicit CommandDispatcher(robot::AlmondClient &client);

  nlohmann::json Execute(const std::string &command, const std::vector<std::string> &params);

  bool HasCommand(const std::string &command) const;

  // One line per command: usage and description
  std::string HelpText() const;

private:
  static constexpr size_t UNLIMITED = static_cast<size_t>(-1);

  struct Entry {
    std::string usage;
    std::string description;
    size_t min_args;
    size_t max_args;
    CommandHandler handler;
  };

  void Register(const std::string &name, const std::string &usage,
                const std::string &description, size_t min_args, size_t max_args,
                CommandHandler handler);

  void RegisterConnectionCommands();
  void RegisterMotionCommands();
  void RegisterVisionCommands();
  void RegisterTrainingCommands();

  robot::AlmondClient &client_;
  std::map<std::string, Entry> handlers_;
};

} // namespace cli
} // namespace almond
