// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cli/commands.hpp"
#include "robot/almond_client.hpp"
#include "rpc/errors.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace almond;

namespace {

constexpr const char *CLI_DEFAULT_HOST = "localhost";

void PrintUsage(const char *program_name) {
  std::cout
      << "Almond CLI - Control the Almond Bot arm\n\n"
      << "Usage: " << program_name << " [options] <command> [params]\n"
      << "       " << program_name << " [options] shell\n\n"
      << "Options:\n"
      << "  --host=<host>        Robot server host (default: " << CLI_DEFAULT_HOST
      << ", env ALMOND_HOST)\n"
      << "  --port=<port>        Robot server port (default: " << rpc::defaults::PORT
      << ", env ALMOND_PORT)\n"
      << "  --path=<path>        WebSocket path (default: " << rpc::defaults::PATH << ")\n"
      << "  --timeout=<ms>       Per-call timeout, 0 waits forever (default: 0)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,off)\n"
      << "                       Default: warn\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: transport, rpc, robot, all\n"
      << "                       Can be comma-separated: --debug=transport,rpc\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

void PrintCommands(const cli::CommandDispatcher &dispatcher) {
  std::cout << "Commands:\n" << dispatcher.HelpText() << std::endl;
}

void PrintResult(const nlohmann::json &result) {
  if (!result.is_null()) {
    std::cout << result.dump(2) << std::endl;
  }
}

// Runs one command; returns false (after reporting) on failure
bool RunCommand(cli::CommandDispatcher &dispatcher, const std::string &command,
                const std::vector<std::string> &params) {
  try {
    PrintResult(dispatcher.Execute(command, params));
    return true;
  } catch (const cli::UsageError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
  } catch (const rpc::RpcError &e) {
    std::cerr << "Error: robot rejected '" << e.method() << "' (code " << e.code()
              << "): " << e.message() << std::endl;
  } catch (const rpc::ConnectionError &e) {
    std::cerr << "Error: " << e.what() << "\n"
              << "Make sure the robot server is running." << std::endl;
  } catch (const rpc::RPCException &e) {
    std::cerr << "Error: " << e.what() << std::endl;
  }
  return false;
}

int RunShell(cli::CommandDispatcher &dispatcher) {
  const bool interactive = isatty(STDIN_FILENO);
  if (interactive) {
    std::cout << GetFullVersionString() << "\n"
              << "Type 'help' for commands, 'exit' to quit." << std::endl;
  }

  std::string line;
  while (true) {
    if (interactive) {
      std::cout << "almond> " << std::flush;
    }
    if (!std::getline(std::cin, line)) {
      break;
    }

    auto tokens = util::SplitCommandLine(line);
    if (!tokens) {
      std::cerr << "Error: unterminated quote" << std::endl;
      continue;
    }
    if (tokens->empty() || (*tokens)[0][0] == '#') {
      continue;
    }

    const std::string &command = tokens->front();
    if (command == "exit" || command == "quit") {
      break;
    }
    if (command == "help") {
      PrintCommands(dispatcher);
      continue;
    }

    std::vector<std::string> params(tokens->begin() + 1, tokens->end());
    RunCommand(dispatcher, command, params);
  }

  if (interactive) {
    std::cout << std::endl;
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    if (argc < 2) {
      PrintUsage(argv[0]);
      return 1;
    }

    rpc::ClientConfig config;
    config.host = CLI_DEFAULT_HOST;
    std::string log_level = "warn";
    std::vector<std::string> debug_components;
    std::string command;
    std::vector<std::string> params;

    if (const char *env_host = std::getenv("ALMOND_HOST")) {
      config.host = env_host;
    }
    if (const char *env_port = std::getenv("ALMOND_PORT")) {
      auto port_opt = util::SafeParsePort(env_port);
      if (!port_opt) {
        std::cerr << "Error: Invalid ALMOND_PORT: " << env_port << std::endl;
        return 1;
      }
      config.port = *port_opt;
    }

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      // Everything after the command belongs to the command
      if (!command.empty()) {
        params.push_back(arg);
        continue;
      }

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << GetFullVersionString() << std::endl;
        std::cout << GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--host=") == 0) {
        config.host = arg.substr(7);
      } else if (arg.find("--port=") == 0) {
        auto port_opt = util::SafeParsePort(arg.substr(7));
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(7) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.port = *port_opt;
      } else if (arg.find("--path=") == 0) {
        config.path = arg.substr(7);
        if (config.path.empty() || config.path[0] != '/') {
          std::cerr << "Error: WebSocket path must start with '/'" << std::endl;
          return 1;
        }
      } else if (arg.find("--timeout=") == 0) {
        auto timeout_opt = util::SafeParseInt64(arg.substr(10), 0, 24LL * 3600 * 1000);
        if (!timeout_opt) {
          std::cerr << "Error: Invalid timeout: " << arg.substr(10) << std::endl;
          std::cerr << "Timeout must be a number of milliseconds (0 = none)" << std::endl;
          return 1;
        }
        config.call_timeout = std::chrono::milliseconds(*timeout_opt);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=transport,rpc
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << std::endl;
        PrintUsage(argv[0]);
        return 1;
      } else {
        command = arg;
      }
    }

    if (command.empty()) {
      std::cerr << "Error: No command specified\n";
      PrintUsage(argv[0]);
      return 1;
    }

    util::LogManager::Initialize(log_level);
    for (const auto &component : debug_components) {
      if (component == "all") {
        util::LogManager::SetLogLevel("trace");
      } else {
        util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int exit_code = 0;

    // Client must be destroyed before LogManager::Shutdown()
    {
      robot::AlmondClient client(config);
      cli::CommandDispatcher dispatcher(client);

      if (command == "shell") {
        exit_code = RunShell(dispatcher);
      } else if (command == "help") {
        PrintUsage(argv[0]);
        PrintCommands(dispatcher);
      } else {
        exit_code = RunCommand(dispatcher, command, params) ? 0 : 1;
      }
    }

    util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    util::LogManager::Shutdown();
    return 1;
  }
}
