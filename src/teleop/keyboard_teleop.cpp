// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "teleop/keyboard_teleop.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace almond {
namespace teleop {

namespace {

struct AxisBinding {
  char key;
  size_t axis; // index into x, y, z, roll, pitch, yaw
  int direction;
};

constexpr std::array<AxisBinding, 6> TRANSLATION_KEYS = {{
    {'w', 1, -1}, // up
    {'s', 1, +1}, // down
    {'a', 0, -1}, // left
    {'d', 0, +1}, // right
    {'e', 2, -1}, // backward
    {'q', 2, +1}, // forward
}};

constexpr std::array<AxisBinding, 6> ROTATION_KEYS = {{
    {'j', 4, -1}, // rotate left
    {'l', 4, +1}, // rotate right
    {'i', 3, +1}, // tilt up
    {'k', 3, -1}, // tilt down
    {'u', 5, -1}, // turn clockwise
    {'o', 5, +1}, // turn counterclockwise
}};

constexpr std::array<std::pair<char, int>, 2> STROKE_KEYS = {{
    {'v', +STROKE_STEP}, // open
    {'b', -STROKE_STEP}, // close
}};

char NormalizeKey(char key) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(key)));
}

double &Axis(robot::Pose &pose, size_t axis) {
  switch (axis) {
  case 0:
    return pose.x;
  case 1:
    return pose.y;
  case 2:
    return pose.z;
  case 3:
    return pose.roll;
  case 4:
    return pose.pitch;
  default:
    return pose.yaw;
  }
}

} // namespace

void HandleKeyEvent(TeleopInputState &state, const KeyEvent &event) {
  if (event.key == KEY_ESCAPE) {
    if (event.action == KeyAction::PRESS) {
      state.exit_requested = true;
    }
    return;
  }

  char key = NormalizeKey(event.key);
  if (event.action == KeyAction::PRESS) {
    state.held.insert(key);
  } else {
    state.held.erase(key);
  }
}

bool TeleopController::StrokeChangeAllowed(Clock::time_point now) const {
  return !last_stroke_change_ || now - *last_stroke_change_ > STROKE_DEBOUNCE;
}

std::optional<TeleopCommand> TeleopController::Step(const TeleopInputState &state,
                                                    Clock::time_point now) {
  robot::Pose delta;
  for (const auto &binding : TRANSLATION_KEYS) {
    if (state.is_held(binding.key)) {
      Axis(delta, binding.axis) += binding.direction * TRANSLATION_DELTA_MM;
    }
  }
  for (const auto &binding : ROTATION_KEYS) {
    if (state.is_held(binding.key)) {
      Axis(delta, binding.axis) += binding.direction * ROTATION_DELTA_DEG;
    }
  }

  for (const auto &[key, step] : STROKE_KEYS) {
    if (state.is_held(key) && StrokeChangeAllowed(now)) {
      tool_stroke_ += step;
      last_stroke_change_ = now;
    }
  }
  if (state.is_held(KEY_SPACE) && StrokeChangeAllowed(now)) {
    tool_stroke_ = tool_stroke_ == STROKE_MIN ? STROKE_MAX : STROKE_MIN;
    last_stroke_change_ = now;
  }
  tool_stroke_ = std::clamp(tool_stroke_, STROKE_MIN, STROKE_MAX);

  TeleopCommand command;
  command.pose_offset = delta;
  if (tool_stroke_ != acknowledged_stroke_) {
    command.tool_stroke = tool_stroke_;
  }

  if (delta == robot::Pose{} && !command.tool_stroke) {
    return std::nullopt;
  }
  return command;
}

void TeleopController::Acknowledge(const TeleopCommand &command) {
  if (command.tool_stroke) {
    acknowledged_stroke_ = *command.tool_stroke;
    LOG_TELEOP_DEBUG("tool stroke now {}", acknowledged_stroke_);
  }
}

std::optional<KeyEvent> KeyRepeatTracker::OnCharacter(char key, Clock::time_point now) {
  if (key != KEY_ESCAPE) {
    key = NormalizeKey(key);
  }
  bool first_seen = last_seen_.insert_or_assign(key, now).second;
  if (!first_seen) {
    return std::nullopt;
  }
  return KeyEvent{key, KeyAction::PRESS};
}

std::vector<KeyEvent> KeyRepeatTracker::Expire(Clock::time_point now) {
  std::vector<KeyEvent> released;
  for (auto it = last_seen_.begin(); it != last_seen_.end();) {
    if (now - it->second > hold_window_) {
      released.push_back(KeyEvent{it->first, KeyAction::RELEASE});
      it = last_seen_.erase(it);
    } else {
      ++it;
    }
  }
  return released;
}

} // namespace teleop
} // namespace almond
