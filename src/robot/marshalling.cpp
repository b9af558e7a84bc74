// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "robot/marshalling.hpp"
#include "rpc/errors.hpp"

using json = nlohmann::json;

namespace almond {
namespace robot {

namespace {

const json &RequireObject(const json &j, const char *what) {
  if (!j.is_object()) {
    throw rpc::MalformedResponse(std::string(what) + ": expected object, got " +
                                 j.type_name());
  }
  return j;
}

const json &RequireArray(const json &j, const char *what) {
  if (!j.is_array()) {
    throw rpc::MalformedResponse(std::string(what) + ": expected array, got " +
                                 j.type_name());
  }
  return j;
}

const json &RequireField(const json &obj, const char *key, const char *what) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    throw rpc::MalformedResponse(std::string(what) + ": missing field '" + key + "'");
  }
  return *it;
}

double GetDouble(const json &obj, const char *key, const char *what) {
  const json &value = RequireField(obj, key, what);
  if (!value.is_number()) {
    throw rpc::MalformedResponse(std::string(what) + ": field '" + key +
                                 "' must be a number");
  }
  return value.get<double>();
}

int64_t GetInt(const json &obj, const char *key, const char *what) {
  const json &value = RequireField(obj, key, what);
  if (!value.is_number_integer()) {
    throw rpc::MalformedResponse(std::string(what) + ": field '" + key +
                                 "' must be an integer");
  }
  return value.get<int64_t>();
}

std::string GetString(const json &obj, const char *key, const char *what) {
  const json &value = RequireField(obj, key, what);
  if (!value.is_string()) {
    throw rpc::MalformedResponse(std::string(what) + ": field '" + key +
                                 "' must be a string");
  }
  return value.get<std::string>();
}

// Record identifiers are strings, but some server builds emit integers
std::string GetIdentifier(const json &obj, const char *key, const char *what) {
  const json &value = RequireField(obj, key, what);
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return value.dump();
  }
  throw rpc::MalformedResponse(std::string(what) + ": field '" + key +
                               "' must be a string or integer");
}

template <typename T, typename Decode>
std::vector<T> DecodeList(const json &j, Decode decode, const char *what) {
  RequireArray(j, what);
  std::vector<T> out;
  out.reserve(j.size());
  for (const auto &item : j) {
    out.push_back(decode(item));
  }
  return out;
}

} // namespace

std::string ModeToString(Mode mode) {
  switch (mode) {
  case Mode::DRAG:
    return "drag";
  case Mode::TELEOPERATION:
    return "teleoperation";
  case Mode::AUTONOMOUS:
    return "autonomous";
  }
  return "unknown";
}

Mode ModeFromString(const std::string &value) {
  if (value == "drag")
    return Mode::DRAG;
  if (value == "teleoperation")
    return Mode::TELEOPERATION;
  if (value == "autonomous")
    return Mode::AUTONOMOUS;
  throw rpc::MalformedResponse("unknown mode '" + value + "'");
}

std::string AIModelToString(AIModel model) {
  switch (model) {
  case AIModel::PI0:
    return "PI0";
  case AIModel::PI0_FAST:
    return "PI0_FAST";
  case AIModel::ACT:
    return "ACT";
  case AIModel::DIFFUSION:
    return "DIFFUSION";
  case AIModel::TDMPC:
    return "TDMPC";
  case AIModel::VQBET:
    return "VQBET";
  }
  return "unknown";
}

AIModel AIModelFromString(const std::string &value) {
  static const std::pair<const char *, AIModel> models[] = {
      {"PI0", AIModel::PI0},         {"PI0_FAST", AIModel::PI0_FAST},
      {"ACT", AIModel::ACT},         {"DIFFUSION", AIModel::DIFFUSION},
      {"TDMPC", AIModel::TDMPC},     {"VQBET", AIModel::VQBET},
  };
  for (const auto &[name, model] : models) {
    if (value == name) {
      return model;
    }
  }
  throw rpc::MalformedResponse("unknown model '" + value + "'");
}

json PoseToJson(const Pose &pose) {
  auto values = pose.to_array();
  return json(std::vector<double>(values.begin(), values.end()));
}

Pose PoseFromJson(const json &j) {
  constexpr const char *what = "pose";
  RequireObject(j, what);
  Pose pose;
  pose.x = GetDouble(j, "x", what);
  pose.y = GetDouble(j, "y", what);
  pose.z = GetDouble(j, "z", what);
  pose.roll = GetDouble(j, "roll", what);
  pose.pitch = GetDouble(j, "pitch", what);
  pose.yaw = GetDouble(j, "yaw", what);
  return pose;
}

json JointsToJson(const Joints &joints) {
  auto values = joints.to_array();
  return json(std::vector<double>(values.begin(), values.end()));
}

Joints JointsFromJson(const json &j) {
  constexpr const char *what = "joints";
  RequireObject(j, what);
  Joints joints;
  joints.j1 = GetDouble(j, "j1", what);
  joints.j2 = GetDouble(j, "j2", what);
  joints.j3 = GetDouble(j, "j3", what);
  joints.j4 = GetDouble(j, "j4", what);
  joints.j5 = GetDouble(j, "j5", what);
  joints.j6 = GetDouble(j, "j6", what);
  return joints;
}

Point PointFromJson(const json &j) {
  constexpr const char *what = "point";
  RequireObject(j, what);
  return Point{GetDouble(j, "x", what), GetDouble(j, "y", what)};
}

AprilTag AprilTagFromJson(const json &j) {
  constexpr const char *what = "april tag";
  RequireObject(j, what);
  AprilTag tag;
  tag.id = GetInt(j, "id", what);
  tag.center = PointFromJson(RequireField(j, "center", what));
  tag.corners = DecodeList<Point>(RequireField(j, "corners", what), PointFromJson,
                                  "april tag corners");
  tag.offset = PoseFromJson(RequireField(j, "offset", what));
  return tag;
}

Status StatusFromJson(const json &j) {
  constexpr const char *what = "status";
  RequireObject(j, what);
  Status status;
  status.mode = ModeFromString(GetString(j, "mode", what));
  status.status = GetString(j, "status", what);

  auto it = j.find("error_message");
  if (it != j.end() && !it->is_null()) {
    if (!it->is_string()) {
      throw rpc::MalformedResponse("status: field 'error_message' must be a string");
    }
    status.error_message = it->get<std::string>();
  }
  return status;
}

TrainingEpisode TrainingEpisodeFromJson(const json &j) {
  constexpr const char *what = "training episode";
  RequireObject(j, what);
  TrainingEpisode episode;
  episode.id = GetIdentifier(j, "id", what);
  episode.task_name = GetString(j, "task_name", what);
  episode.duration_seconds = GetDouble(j, "duration_seconds", what);
  episode.created_at = GetString(j, "created_at", what);
  return episode;
}

TaskTraining TaskTrainingFromJson(const json &j) {
  constexpr const char *what = "task training";
  RequireObject(j, what);
  TaskTraining training;
  training.id = GetIdentifier(j, "id", what);
  training.task_name = GetString(j, "task_name", what);
  training.training_name = GetString(j, "training_name", what);
  training.model = AIModelFromString(GetString(j, "model", what));
  training.training_episode_count = GetInt(j, "training_episode_count", what);
  training.status = GetString(j, "status", what);
  training.created_at = GetString(j, "created_at", what);
  return training;
}

std::vector<Pose> PosesFromJson(const json &j) {
  return DecodeList<Pose>(j, PoseFromJson, "pose list");
}

std::vector<AprilTag> AprilTagsFromJson(const json &j) {
  return DecodeList<AprilTag>(j, AprilTagFromJson, "april tag list");
}

std::vector<TrainingEpisode> TrainingEpisodesFromJson(const json &j) {
  return DecodeList<TrainingEpisode>(j, TrainingEpisodeFromJson, "episode list");
}

std::vector<TaskTraining> TaskTrainingsFromJson(const json &j) {
  return DecodeList<TaskTraining>(j, TaskTrainingFromJson, "training list");
}

json ToJson(const Pose &pose) {
  return json{{"x", pose.x},       {"y", pose.y},         {"z", pose.z},
              {"roll", pose.roll}, {"pitch", pose.pitch}, {"yaw", pose.yaw}};
}

json ToJson(const Joints &joints) {
  return json{{"j1", joints.j1}, {"j2", joints.j2}, {"j3", joints.j3},
              {"j4", joints.j4}, {"j5", joints.j5}, {"j6", joints.j6}};
}

json ToJson(const Status &status) {
  json out = {{"mode", ModeToString(status.mode)}, {"status", status.status}};
  out["error_message"] = status.error_message ? json(*status.error_message) : json(nullptr);
  return out;
}

json ToJson(const AprilTag &tag) {
  json corners = json::array();
  for (const auto &corner : tag.corners) {
    corners.push_back({{"x", corner.x}, {"y", corner.y}});
  }
  return json{{"id", tag.id},
              {"center", {{"x", tag.center.x}, {"y", tag.center.y}}},
              {"corners", corners},
              {"offset", ToJson(tag.offset)}};
}

json ToJson(const TrainingEpisode &episode) {
  return json{{"id", episode.id},
              {"task_name", episode.task_name},
              {"duration_seconds", episode.duration_seconds},
              {"created_at", episode.created_at}};
}

json ToJson(const TaskTraining &training) {
  return json{{"id", training.id},
              {"task_name", training.task_name},
              {"training_name", training.training_name},
              {"model", AIModelToString(training.model)},
              {"training_episode_count", training.training_episode_count},
              {"status", training.status},
              {"created_at", training.created_at}};
}

} // namespace robot
} // namespace almond
