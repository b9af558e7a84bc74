// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include "robot/types.hpp"
#include "rpc/config.hpp"
#include "rpc/rpc_client.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace almond {
namespace robot {

/**
 * AlmondClient - typed interface to the Almond Bot arm
 *
 * Each method maps to one JSON-RPC call on the robot server. Methods whose
 * result is ignored still block until the server acknowledges the command.
 * Thread-safe: any number of threads may issue commands concurrently.
 *
 * Errors surface as the rpc:: exceptions (ConnectionError, Disconnected,
 * RpcError, Timeout); a result of the wrong shape throws MalformedResponse.
 */
class AlmondClient {
public:
  explicit AlmondClient(const rpc::ClientConfig &config = rpc::ClientConfig{});
  AlmondClient(const rpc::ClientConfig &config,
               std::shared_ptr<network::Transport> transport);

  AlmondClient(const AlmondClient&) = delete;
  AlmondClient& operator=(const AlmondClient&) = delete;

  void connect();
  void disconnect();
  bool is_connected() const;

  // === Mode and configuration ===

  void set_mode(Mode mode);
  void set_collision_sensitivity(int percent);
  void set_speed(int percent);

  // === State ===

  Status get_status();
  Joints get_joint_angles();
  Pose get_tool_pose();

  // === Motion ===

  /**
   * Stream a joint target at a fixed rate (servo mode)
   * @param frequency Stream rate in Hz
   * @param tool_stroke Gripper stroke 0-100, omitted when unset
   * @param tool_force Gripper force 0-100, omitted when unset
   */
  void stream_joint_angles(int frequency, const Joints &joint_angles,
                           std::optional<int> tool_stroke = std::nullopt,
                           std::optional<int> tool_force = std::nullopt);

  // When is_offset is set the target is relative to the current tool pose
  void set_tool_pose(const Pose &pose, bool is_offset = false);
  void set_joint_angles(const Joints &angles, bool is_offset = false);
  void move_arc(double radius, const Pose &pose, bool is_offset = false);

  // === Gripper ===

  void open_tool();
  void close_tool();
  void set_tool_stroke(int stroke, int force = 0);

  /**
   * Incremental teleoperation step: move the tool by pose_offset and
   * optionally set the gripper stroke
   */
  void teleop(const Pose &pose_offset, std::optional<int> tool_stroke = std::nullopt);

  // === Vision ===

  std::vector<AprilTag> detect_april_tags();

  // Without an offset the arm centers itself on the tag
  void align_with_apriltag(int64_t id, std::optional<Pose> pose_offset = std::nullopt);

  std::vector<Pose> detect_poses(const std::string &object_name);

  // Ask the vision model a yes/no question about the scene
  bool verify_scene(const std::string &question);

  // === Episodes and training ===

  TrainingEpisode record_episode(const std::string &task_name, double duration_seconds);
  void replay_episode(const std::string &task_name, const std::string &id);
  void delete_episode(const std::string &task_name, const std::string &id);
  std::vector<TrainingEpisode> list_episodes(const std::string &task_name);

  void train_task(const std::string &task_name, const std::string &training_name,
                  AIModel model = AIModel::PI0);

  // All trainings when task_name is unset
  std::vector<TaskTraining> list_trainings(
      const std::optional<std::string> &task_name = std::nullopt);

  // An empty training_name runs the latest training of the task
  void run_task(const std::string &task_name, const std::string &training_name = "");

  // Underlying JSON-RPC client, for raw calls
  rpc::RPCClient &rpc() { return rpc_; }

private:
  rpc::RPCClient rpc_;
};

} // namespace robot
} // namespace almond
