// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cli/commands.hpp"
#include "robot/marshalling.hpp"
#include "rpc/errors.hpp"
#include "util/string_parsing.hpp"
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace almond {
namespace cli {

namespace {

int ParsePercent(const std::string &value, const char *name) {
  auto parsed = util::SafeParseInt(value, 0, 100);
  if (!parsed) {
    throw UsageError(std::string(name) + " must be an integer between 0 and 100, got '" +
                     value + "'");
  }
  return *parsed;
}

double ParseDouble(const std::string &value, const char *name) {
  auto parsed = util::SafeParseDouble(value);
  if (!parsed) {
    throw UsageError(std::string(name) + " must be a number, got '" + value + "'");
  }
  return *parsed;
}

bool ParseBool(const std::string &value, const char *name) {
  auto parsed = util::SafeParseBool(value);
  if (!parsed) {
    throw UsageError(std::string(name) + " must be true or false, got '" + value + "'");
  }
  return *parsed;
}

// Six numbers starting at params[first]
robot::Pose ParsePose(const std::vector<std::string> &params, size_t first) {
  robot::Pose pose;
  pose.x = ParseDouble(params.at(first), "x");
  pose.y = ParseDouble(params.at(first + 1), "y");
  pose.z = ParseDouble(params.at(first + 2), "z");
  pose.roll = ParseDouble(params.at(first + 3), "roll");
  pose.pitch = ParseDouble(params.at(first + 4), "pitch");
  pose.yaw = ParseDouble(params.at(first + 5), "yaw");
  return pose;
}

robot::Joints ParseJoints(const std::vector<std::string> &params, size_t first) {
  robot::Joints joints;
  joints.j1 = ParseDouble(params.at(first), "j1");
  joints.j2 = ParseDouble(params.at(first + 1), "j2");
  joints.j3 = ParseDouble(params.at(first + 2), "j3");
  joints.j4 = ParseDouble(params.at(first + 3), "j4");
  joints.j5 = ParseDouble(params.at(first + 4), "j5");
  joints.j6 = ParseDouble(params.at(first + 5), "j6");
  return joints;
}

bool OptionalFlag(const std::vector<std::string> &params, size_t index, const char *name) {
  return params.size() > index && ParseBool(params[index], name);
}

std::string JoinFrom(const std::vector<std::string> &params, size_t first) {
  std::string out;
  for (size_t i = first; i < params.size(); ++i) {
    if (!out.empty()) {
      out += ' ';
    }
    out += params[i];
  }
  return out;
}

template <typename T> json ToJsonList(const std::vector<T> &items) {
  json out = json::array();
  for (const auto &item : items) {
    out.push_back(robot::ToJson(item));
  }
  return out;
}

} // namespace

CommandDispatcher::CommandDispatcher(robot::AlmondClient &client) : client_(client) {
  RegisterConnectionCommands();
  RegisterMotionCommands();
  RegisterVisionCommands();
  RegisterTrainingCommands();
}

void CommandDispatcher::Register(const std::string &name, const std::string &usage,
                                 const std::string &description, size_t min_args,
                                 size_t max_args, CommandHandler handler) {
  handlers_[name] = Entry{usage, description, min_args, max_args, std::move(handler)};
}

void CommandDispatcher::RegisterConnectionCommands() {
  Register("connect", "connect", "Connect to the robot server", 0, 0, [this](const auto &) {
    client_.connect();
    return json(nullptr);
  });
  Register("disconnect", "disconnect", "Close the connection", 0, 0, [this](const auto &) {
    client_.disconnect();
    return json(nullptr);
  });
  Register("call", "call <method> [params-json]", "Send a raw JSON-RPC request", 1, 2,
           [this](const auto &p) {
             json params = json::object();
             if (p.size() > 1) {
               try {
                 params = json::parse(p[1]);
               } catch (const json::parse_error &e) {
                 throw UsageError(std::string("params must be JSON: ") + e.what());
               }
               if (!params.is_object()) {
                 throw UsageError("params must be a JSON object");
               }
             }
             return client_.rpc().Invoke(p[0], params);
           });
}

void CommandDispatcher::RegisterMotionCommands() {
  Register("set_mode", "set_mode <drag|teleoperation|autonomous>", "Set the operating mode",
           1, 1, [this](const auto &p) {
             robot::Mode mode = robot::Mode::DRAG;
             try {
               mode = robot::ModeFromString(p[0]);
             } catch (const rpc::MalformedResponse &) {
               throw UsageError("unknown mode '" + p[0] + "'");
             }
             client_.set_mode(mode);
             return json(nullptr);
           });
  Register("set_collision_sensitivity", "set_collision_sensitivity <percent>",
           "Set collision sensitivity (0-100)", 1, 1, [this](const auto &p) {
             client_.set_collision_sensitivity(ParsePercent(p[0], "percent"));
             return json(nullptr);
           });
  Register("set_speed", "set_speed <percent>", "Set movement speed (0-100)", 1, 1,
           [this](const auto &p) {
             client_.set_speed(ParsePercent(p[0], "percent"));
             return json(nullptr);
           });

  Register("get_status", "get_status", "Show mode and status", 0, 0,
           [this](const auto &) { return robot::ToJson(client_.get_status()); });
  Register("get_joint_angles", "get_joint_angles", "Show joint angles (degrees)", 0, 0,
           [this](const auto &) { return robot::ToJson(client_.get_joint_angles()); });
  Register("get_tool_pose", "get_tool_pose", "Show tool pose (mm, degrees)", 0, 0,
           [this](const auto &) { return robot::ToJson(client_.get_tool_pose()); });

  Register("stream_joint_angles",
           "stream_joint_angles <hz> <j1> <j2> <j3> <j4> <j5> <j6> [stroke] [force]",
           "Stream a joint target", 7, 9, [this](const auto &p) {
             auto frequency = util::SafeParseInt(p[0], 1, 1000);
             if (!frequency) {
               throw UsageError("frequency must be an integer between 1 and 1000, got '" +
                                p[0] + "'");
             }
             std::optional<int> stroke;
             std::optional<int> force;
             if (p.size() > 7)
               stroke = ParsePercent(p[7], "stroke");
             if (p.size() > 8)
               force = ParsePercent(p[8], "force");
             client_.stream_joint_angles(*frequency, ParseJoints(p, 1), stroke, force);
             return json(nullptr);
           });
  Register("set_tool_pose", "set_tool_pose <x> <y> <z> <roll> <pitch> <yaw> [is_offset]",
           "Move the tool to a pose", 6, 7, [this](const auto &p) {
             client_.set_tool_pose(ParsePose(p, 0), OptionalFlag(p, 6, "is_offset"));
             return json(nullptr);
           });
  Register("set_joint_angles", "set_joint_angles <j1> <j2> <j3> <j4> <j5> <j6> [is_offset]",
           "Move the joints", 6, 7, [this](const auto &p) {
             client_.set_joint_angles(ParseJoints(p, 0), OptionalFlag(p, 6, "is_offset"));
             return json(nullptr);
           });
  Register("move_arc", "move_arc <radius> <x> <y> <z> <roll> <pitch> <yaw> [is_offset]",
           "Move the tool along an arc", 7, 8, [this](const auto &p) {
             client_.move_arc(ParseDouble(p[0], "radius"), ParsePose(p, 1),
                              OptionalFlag(p, 7, "is_offset"));
             return json(nullptr);
           });

  Register("open_tool", "open_tool", "Open the gripper", 0, 0, [this](const auto &) {
    client_.open_tool();
    return json(nullptr);
  });
  Register("close_tool", "close_tool", "Close the gripper", 0, 0, [this](const auto &) {
    client_.close_tool();
    return json(nullptr);
  });
  Register("set_tool_stroke", "set_tool_stroke <stroke> [force]",
           "Set gripper stroke and force (0-100)", 1, 2, [this](const auto &p) {
             int force = p.size() > 1 ? ParsePercent(p[1], "force") : 0;
             client_.set_tool_stroke(ParsePercent(p[0], "stroke"), force);
             return json(nullptr);
           });
  Register("teleop", "teleop <dx> <dy> <dz> <droll> <dpitch> <dyaw> [stroke]",
           "Nudge the tool by an offset", 6, 7, [this](const auto &p) {
             std::optional<int> stroke;
             if (p.size() > 6)
               stroke = ParsePercent(p[6], "stroke");
             client_.teleop(ParsePose(p, 0), stroke);
             return json(nullptr);
           });
}

void CommandDispatcher::RegisterVisionCommands() {
  Register("detect_april_tags", "detect_april_tags", "List visible AprilTags", 0, 0,
           [this](const auto &) { return ToJsonList(client_.detect_april_tags()); });
  Register("align_with_apriltag",
           "align_with_apriltag <id> [x y z roll pitch yaw]",
           "Align the tool with an AprilTag (centered without an offset)", 1, 7,
           [this](const auto &p) {
             auto id = util::SafeParseInt64(p[0], 0, std::numeric_limits<int64_t>::max());
             if (!id) {
               throw UsageError("tag id must be a non-negative integer, got '" + p[0] + "'");
             }
             std::optional<robot::Pose> offset;
             if (p.size() == 7) {
               offset = ParsePose(p, 1);
             } else if (p.size() != 1) {
               throw UsageError("offset needs all six values: x y z roll pitch yaw");
             }
             client_.align_with_apriltag(*id, offset);
             return json(nullptr);
           });
  Register("detect_poses", "detect_poses <object_name>", "Locate objects by name", 1, 1,
           [this](const auto &p) {
             json out = json::array();
             for (const auto &pose : client_.detect_poses(p[0])) {
               out.push_back(robot::ToJson(pose));
             }
             return out;
           });
  Register("verify_scene", "verify_scene <question...>",
           "Ask a yes/no question about the scene", 1, UNLIMITED,
           [this](const auto &p) { return json(client_.verify_scene(JoinFrom(p, 0))); });
}

void CommandDispatcher::RegisterTrainingCommands() {
  Register("record_episode", "record_episode <task_name> <seconds>",
           "Record a training episode", 2, 2, [this](const auto &p) {
             double seconds = ParseDouble(p[1], "seconds");
             if (seconds <= 0) {
               throw UsageError("seconds must be positive");
             }
             return robot::ToJson(client_.record_episode(p[0], seconds));
           });
  Register("replay_episode", "replay_episode <task_name> <id>", "Replay a recorded episode",
           2, 2, [this](const auto &p) {
             client_.replay_episode(p[0], p[1]);
             return json(nullptr);
           });
  Register("delete_episode", "delete_episode <task_name> <id>", "Delete a recorded episode",
           2, 2, [this](const auto &p) {
             client_.delete_episode(p[0], p[1]);
             return json(nullptr);
           });
  Register("list_episodes", "list_episodes <task_name>", "List recorded episodes", 1, 1,
           [this](const auto &p) { return ToJsonList(client_.list_episodes(p[0])); });
  Register("train", "train <task_name> <training_name> [model]",
           "Train a policy (PI0, PI0_FAST, ACT, DIFFUSION, TDMPC, VQBET)", 2, 3,
           [this](const auto &p) {
             robot::AIModel model = robot::AIModel::PI0;
             if (p.size() > 2) {
               try {
                 model = robot::AIModelFromString(p[2]);
               } catch (const rpc::MalformedResponse &) {
                 throw UsageError("unknown model '" + p[2] + "'");
               }
             }
             client_.train_task(p[0], p[1], model);
             return json(nullptr);
           });
  Register("list_trainings", "list_trainings [task_name]", "List trainings", 0, 1,
           [this](const auto &p) {
             std::optional<std::string> task;
             if (!p.empty())
               task = p[0];
             return ToJsonList(client_.list_trainings(task));
           });
  Register("run_task", "run_task <task_name> [training_name]",
           "Run a trained task (latest training by default)", 1, 2, [this](const auto &p) {
             client_.run_task(p[0], p.size() > 1 ? p[1] : "");
             return json(nullptr);
           });
}

json CommandDispatcher::Execute(const std::string &command,
                                const std::vector<std::string> &params) {
  auto it = handlers_.find(command);
  if (it == handlers_.end()) {
    throw UsageError("unknown command '" + command + "'");
  }

  const Entry &entry = it->second;
  if (params.size() < entry.min_args || params.size() > entry.max_args) {
    throw UsageError("usage: " + entry.usage);
  }
  return entry.handler(params);
}

bool CommandDispatcher::HasCommand(const std::string &command) const {
  return handlers_.count(command) > 0;
}

std::string CommandDispatcher::HelpText() const {
  std::ostringstream oss;
  for (const auto &[name, entry] : handlers_) {
    oss << "  " << entry.usage << "\n      " << entry.description << "\n";
  }
  return oss.str();
}

} // namespace cli
} // namespace almond
