// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "robot/types.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace almond {
namespace teleop {

using Clock = std::chrono::steady_clock;

// Per-tick increments and loop rate
constexpr double TRANSLATION_DELTA_MM = 1.0;
constexpr double ROTATION_DELTA_DEG = 0.5;
constexpr int UPDATE_HZ = 100;
constexpr std::chrono::milliseconds UPDATE_INTERVAL{1000 / UPDATE_HZ};

constexpr int STROKE_STEP = 10;
constexpr int STROKE_MIN = 0;
constexpr int STROKE_MAX = 100;
constexpr std::chrono::milliseconds STROKE_DEBOUNCE{1000};

constexpr char KEY_ESCAPE = 27;
constexpr char KEY_SPACE = ' ';

enum class KeyAction { PRESS, RELEASE };

struct KeyEvent {
  char key = 0;
  KeyAction action = KeyAction::PRESS;
};

/**
 * Keys currently held, plus the exit request raised by ESC.
 * Letters are stored lower-case.
 */
struct TeleopInputState {
  std::set<char> held;
  bool exit_requested = false;

  bool is_held(char key) const { return held.count(key) > 0; }
};

void HandleKeyEvent(TeleopInputState &state, const KeyEvent &event);

struct TeleopCommand {
  robot::Pose pose_offset;
  // Set only when the stroke differs from the last acknowledged one
  std::optional<int> tool_stroke;
};

/**
 * TeleopController - turns held keys into incremental teleop commands
 *
 * Translation keys move the tool 1 mm per tick, rotation keys 0.5 degrees.
 * Stroke keys (v/b, space to toggle fully open/closed) share one 1 s
 * debounce. A command is produced only when the pose moves or the stroke
 * changed; call Acknowledge() once the server accepted it.
 */
class TeleopController {
public:
  std::optional<TeleopCommand> Step(const TeleopInputState &state, Clock::time_point now);

  void Acknowledge(const TeleopCommand &command);

  int tool_stroke() const { return tool_stroke_; }
  int acknowledged_stroke() const { return acknowledged_stroke_; }

private:
  bool StrokeChangeAllowed(Clock::time_point now) const;

  int tool_stroke_ = 0;
  int acknowledged_stroke_ = 0;
  std::optional<Clock::time_point> last_stroke_change_;
};

/**
 * KeyRepeatTracker - synthesizes press/release events from a terminal
 *
 * A terminal reports only characters, repeated while a key is held. The
 * first character of a key becomes a PRESS; a key that has not repeated
 * within the hold window becomes a RELEASE.
 */
class KeyRepeatTracker {
public:
  explicit KeyRepeatTracker(std::chrono::milliseconds hold_window = DEFAULT_HOLD_WINDOW)
      : hold_window_(hold_window) {}

  // Initial autorepeat delay of common terminals is up to ~500 ms
  static constexpr std::chrono::milliseconds DEFAULT_HOLD_WINDOW{550};

  std::optional<KeyEvent> OnCharacter(char key, Clock::time_point now);
  std::vector<KeyEvent> Expire(Clock::time_point now);

private:
  std::chrono::milliseconds hold_window_;
  std::map<char, Clock::time_point> last_seen_;
};

} // namespace teleop
} // namespace almond
