// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace almond {
namespace robot {

// Operating mode of the arm
enum class Mode { DRAG, TELEOPERATION, AUTONOMOUS };

// Policy architectures the server can train
enum class AIModel { PI0, PI0_FAST, ACT, DIFFUSION, TDMPC, VQBET };

// Tool pose: position in mm, orientation in degrees
struct Pose {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
  double roll = 0.0;
  double pitch = 0.0;
  double yaw = 0.0;

  std::array<double, 6> to_array() const { return {x, y, z, roll, pitch, yaw}; }

  bool operator==(const Pose &other) const = default;
};

// Joint angles in degrees, base to wrist
struct Joints {
  static constexpr size_t COUNT = 6;

  double j1 = 0.0;
  double j2 = 0.0;
  double j3 = 0.0;
  double j4 = 0.0;
  double j5 = 0.0;
  double j6 = 0.0;

  std::array<double, COUNT> to_array() const { return {j1, j2, j3, j4, j5, j6}; }

  bool operator==(const Joints &other) const = default;
};

// Image-plane point in pixels
struct Point {
  double x = 0.0;
  double y = 0.0;

  bool operator==(const Point &other) const = default;
};

struct AprilTag {
  int64_t id = 0;
  Point center;
  std::vector<Point> corners;
  // Tool offset that would center the arm on the tag
  Pose offset;
};

struct Status {
  Mode mode = Mode::DRAG;
  std::string status;
  std::optional<std::string> error_message;
};

struct TrainingEpisode {
  std::string id;
  std::string task_name;
  double duration_seconds = 0.0;
  std::string created_at;
};

struct TaskTraining {
  std::string id;
  std::string task_name;
  std::string training_name;
  AIModel model = AIModel::PI0;
  int64_t training_episode_count = 0;
  std::string status;
  std::string created_at;
};

} // namespace robot
} // namespace almond
