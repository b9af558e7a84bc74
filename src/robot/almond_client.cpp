// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "robot/almond_client.hpp"
#include "robot/marshalling.hpp"
#include "rpc/errors.hpp"
#include "util/logging.hpp"

using json = nlohmann::json;

namespace almond {
namespace robot {

namespace {

json OptionalInt(const std::optional<int> &value) {
  return value ? json(*value) : json(nullptr);
}

} // namespace

AlmondClient::AlmondClient(const rpc::ClientConfig &config) : rpc_(config) {}

AlmondClient::AlmondClient(const rpc::ClientConfig &config,
                           std::shared_ptr<network::Transport> transport)
    : rpc_(config, std::move(transport)) {}

void AlmondClient::connect() { rpc_.Connect(); }

void AlmondClient::disconnect() { rpc_.Disconnect(); }

bool AlmondClient::is_connected() const { return rpc_.IsConnected(); }

void AlmondClient::set_mode(Mode mode) {
  LOG_ROBOT_INFO("set mode {}", ModeToString(mode));
  rpc_.Invoke("set_mode", {{"mode", ModeToString(mode)}});
}

void AlmondClient::set_collision_sensitivity(int percent) {
  rpc_.Invoke("set_collision_sensitivity", {{"percent", percent}});
}

void AlmondClient::set_speed(int percent) {
  rpc_.Invoke("set_speed", {{"percent", percent}});
}

Status AlmondClient::get_status() {
  return StatusFromJson(rpc_.Invoke("get_status"));
}

Joints AlmondClient::get_joint_angles() {
  return JointsFromJson(rpc_.Invoke("get_joint_angles"));
}

Pose AlmondClient::get_tool_pose() {
  return PoseFromJson(rpc_.Invoke("get_tool_pose"));
}

void AlmondClient::stream_joint_angles(int frequency, const Joints &joint_angles,
                                       std::optional<int> tool_stroke,
                                       std::optional<int> tool_force) {
  rpc_.Invoke("stream_joint_angles", {{"frequency", frequency},
                                      {"joint_angles", JointsToJson(joint_angles)},
                                      {"tool_stroke", OptionalInt(tool_stroke)},
                                      {"tool_force", OptionalInt(tool_force)}});
}

void AlmondClient::set_tool_pose(const Pose &pose, bool is_offset) {
  rpc_.Invoke("set_tool_pose", {{"pose", PoseToJson(pose)}, {"is_offset", is_offset}});
}

void AlmondClient::set_joint_angles(const Joints &angles, bool is_offset) {
  rpc_.Invoke("set_joint_angles",
              {{"angles", JointsToJson(angles)}, {"is_offset", is_offset}});
}

void AlmondClient::move_arc(double radius, const Pose &pose, bool is_offset) {
  rpc_.Invoke("move_arc",
              {{"radius", radius}, {"pose", PoseToJson(pose)}, {"is_offset", is_offset}});
}

void AlmondClient::open_tool() { rpc_.Invoke("open_tool"); }

void AlmondClient::close_tool() { rpc_.Invoke("close_tool"); }

void AlmondClient::set_tool_stroke(int stroke, int force) {
  rpc_.Invoke("set_tool_stroke", {{"stroke", stroke}, {"force", force}});
}

void AlmondClient::teleop(const Pose &pose_offset, std::optional<int> tool_stroke) {
  rpc_.Invoke("teleop", {{"pose_offset", PoseToJson(pose_offset)},
                         {"tool_stroke", OptionalInt(tool_stroke)}});
}

std::vector<AprilTag> AlmondClient::detect_april_tags() {
  auto tags = AprilTagsFromJson(rpc_.Invoke("detect_april_tags"));
  LOG_ROBOT_DEBUG("detected {} april tag(s)", tags.size());
  return tags;
}

void AlmondClient::align_with_apriltag(int64_t id, std::optional<Pose> pose_offset) {
  rpc_.Invoke("align_with_apriltag",
              {{"id", id},
               {"pose_offset", pose_offset ? PoseToJson(*pose_offset) : json(nullptr)}});
}

std::vector<Pose> AlmondClient::detect_poses(const std::string &object_name) {
  return PosesFromJson(rpc_.Invoke("detect_poses", {{"object_name", object_name}}));
}

bool AlmondClient::verify_scene(const std::string &question) {
  json result = rpc_.Invoke("verify_scene", {{"question", question}});
  if (!result.is_boolean()) {
    throw rpc::MalformedResponse(std::string("verify_scene: expected boolean, got ") +
                                 result.type_name());
  }
  return result.get<bool>();
}

TrainingEpisode AlmondClient::record_episode(const std::string &task_name,
                                             double duration_seconds) {
  LOG_ROBOT_INFO("recording {:.1f}s episode for task '{}'", duration_seconds, task_name);
  return TrainingEpisodeFromJson(rpc_.Invoke(
      "record_episode", {{"task_name", task_name}, {"duration_seconds", duration_seconds}}));
}

void AlmondClient::replay_episode(const std::string &task_name, const std::string &id) {
  rpc_.Invoke("replay_episode", {{"task_name", task_name}, {"id", id}});
}

void AlmondClient::delete_episode(const std::string &task_name, const std::string &id) {
  rpc_.Invoke("delete_episode", {{"task_name", task_name}, {"id", id}});
}

std::vector<TrainingEpisode> AlmondClient::list_episodes(const std::string &task_name) {
  return TrainingEpisodesFromJson(rpc_.Invoke("list_episodes", {{"task_name", task_name}}));
}

void AlmondClient::train_task(const std::string &task_name,
                              const std::string &training_name, AIModel model) {
  LOG_ROBOT_INFO("training '{}' on task '{}' with {}", training_name, task_name,
                 AIModelToString(model));
  rpc_.Invoke("train", {{"task_name", task_name},
                        {"training_name", training_name},
                        {"model", AIModelToString(model)}});
}

std::vector<TaskTraining>
AlmondClient::list_trainings(const std::optional<std::string> &task_name) {
  return TaskTrainingsFromJson(rpc_.Invoke(
      "list_trainings", {{"task_name", task_name ? json(*task_name) : json(nullptr)}}));
}

void AlmondClient::run_task(const std::string &task_name, const std::string &training_name) {
  LOG_ROBOT_INFO("running task '{}' (training '{}')", task_name,
                 training_name.empty() ? "latest" : training_name);
  rpc_.Invoke("run_task", {{"task_name", task_name}, {"training_name", training_name}});
}

} // namespace robot
} // namespace almond
