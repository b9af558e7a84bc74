// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "robot/almond_client.hpp"
#include "rpc/errors.hpp"
#include "teleop/keyboard_teleop.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <poll.h>
#include <stdexcept>
#include <string>
#include <termios.h>
#include <thread>
#include <unistd.h>

using namespace almond;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void SignalHandler(int) { g_shutdown_requested = 1; }

/**
 * Puts the controlling terminal in cbreak mode (no line buffering, no echo)
 * and non-blocking reads for the lifetime of the object
 */
class TerminalRawMode {
public:
  TerminalRawMode() {
    if (!isatty(STDIN_FILENO) || tcgetattr(STDIN_FILENO, &saved_) != 0) {
      throw std::runtime_error("stdin is not a terminal");
    }
    termios raw = saved_;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
      throw std::runtime_error("cannot switch terminal to raw mode");
    }
  }

  ~TerminalRawMode() { tcsetattr(STDIN_FILENO, TCSADRAIN, &saved_); }

  TerminalRawMode(const TerminalRawMode&) = delete;
  TerminalRawMode& operator=(const TerminalRawMode&) = delete;

private:
  termios saved_{};
};

// Drain whatever the terminal has buffered without blocking
std::string ReadPendingInput() {
  std::string input;
  pollfd pfd{STDIN_FILENO, POLLIN, 0};
  while (poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN)) {
    char buf[64];
    ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
      break;
    }
    input.append(buf, static_cast<size_t>(n));
  }
  return input;
}

void PrintKeyHelp() {
  std::cout << "\n[Keyboard control ENABLED - press ESC to stop]\n"
            << "\nTranslation (mm/frame):\n"
            << "  w/s : up / down\n"
            << "  a/d : left / right\n"
            << "  q/e : forward / backward\n"
            << "\nRotation (deg/frame):\n"
            << "  j/l : rotate left / rotate right\n"
            << "  i/k : tilt up / tilt down\n"
            << "  u/o : turn clockwise / turn counterclockwise\n"
            << "\nTool stroke:\n"
            << "  v/b   : open / close by 10%\n"
            << "  space : toggle fully open / closed\n"
            << std::endl;
}

void PrintUsage(const char *program_name) {
  std::cout << "Almond teleop - drive the arm from the keyboard\n\n"
            << "Usage: " << program_name << " [options]\n\n"
            << "Options:\n"
            << "  --host=<host>        Robot server host (default: " << rpc::defaults::HOST
            << ", env ALMOND_HOST)\n"
            << "  --port=<port>        Robot server port (default: " << rpc::defaults::PORT
            << ", env ALMOND_PORT)\n"
            << "  --loglevel=<level>   Log level (trace,debug,info,warn,error)\n"
            << "                       Default: warn\n"
            << "  --logfile=<path>     Log to a file instead of the terminal\n"
            << "  --version            Show version information\n"
            << "  --help               Show this help message\n"
            << std::endl;
}

void RunControlLoop(robot::AlmondClient &client) {
  teleop::TeleopInputState state;
  teleop::TeleopController controller;
  teleop::KeyRepeatTracker keys;

  TerminalRawMode raw_mode;
  PrintKeyHelp();

  auto next_tick = teleop::Clock::now();
  while (!g_shutdown_requested && !state.exit_requested) {
    auto now = teleop::Clock::now();

    for (char c : ReadPendingInput()) {
      if (auto event = keys.OnCharacter(c, now)) {
        teleop::HandleKeyEvent(state, *event);
      }
    }
    for (const auto &event : keys.Expire(now)) {
      teleop::HandleKeyEvent(state, event);
    }
    if (state.exit_requested) {
      break;
    }

    if (auto command = controller.Step(state, now)) {
      try {
        client.teleop(command->pose_offset, command->tool_stroke);
        controller.Acknowledge(*command);
      } catch (const rpc::RPCException &e) {
        LOG_TELEOP_WARN("teleop command failed: {}", e.what());
        std::cerr << "[Keyboard Control Error] " << e.what() << std::endl;
      }
    }

    next_tick += teleop::UPDATE_INTERVAL;
    auto after = teleop::Clock::now();
    if (next_tick < after) {
      // Fell behind (slow round trip); do not try to catch up
      next_tick = after;
    }
    std::this_thread::sleep_until(next_tick);
  }

  std::cout << "\n[Keyboard control DISABLED]" << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    rpc::ClientConfig config;
    std::string log_level = "warn";
    std::string log_file;

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
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        PrintUsage(argv[0]);
        return 1;
      }
    }

    if (log_file.empty()) {
      util::LogManager::Initialize(log_level);
    } else {
      util::LogManager::Initialize(log_level, true, log_file);
    }

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    int exit_code = 0;

    // Client must be destroyed before LogManager::Shutdown()
    {
      robot::AlmondClient client(config);
      try {
        client.connect();
        LOG_APP_INFO("teleoperating {}", config.endpoint());
        RunControlLoop(client);
        client.disconnect();
      } catch (const rpc::ConnectionError &e) {
        std::cerr << "Error: " << e.what() << "\n"
                  << "Make sure the robot server is running.\n";
        exit_code = 1;
      }
    }

    util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    util::LogManager::Shutdown();
    return 1;
  }
}
