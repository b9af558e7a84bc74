// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "robot/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace almond {
namespace robot {

/*
 Conversions between domain values and their JSON-RPC shapes

 Outbound poses and joint vectors are 6-element arrays; inbound ones are
 objects keyed by field name (x..yaw, j1..j6). Every *FromJson function
 throws rpc::MalformedResponse when a required field is missing or has the
 wrong type. No I/O, no state.
*/

std::string ModeToString(Mode mode);
Mode ModeFromString(const std::string &value);

std::string AIModelToString(AIModel model);
AIModel AIModelFromString(const std::string &value);

nlohmann::json PoseToJson(const Pose &pose);
Pose PoseFromJson(const nlohmann::json &j);

nlohmann::json JointsToJson(const Joints &joints);
Joints JointsFromJson(const nlohmann::json &j);

Point PointFromJson(const nlohmann::json &j);
AprilTag AprilTagFromJson(const nlohmann::json &j);
Status StatusFromJson(const nlohmann::json &j);
TrainingEpisode TrainingEpisodeFromJson(const nlohmann::json &j);
TaskTraining TaskTrainingFromJson(const nlohmann::json &j);

// List results; the top-level value must be an array
std::vector<Pose> PosesFromJson(const nlohmann::json &j);
std::vector<AprilTag> AprilTagsFromJson(const nlohmann::json &j);
std::vector<TrainingEpisode> TrainingEpisodesFromJson(const nlohmann::json &j);
std::vector<TaskTraining> TaskTrainingsFromJson(const nlohmann::json &j);

// Printable forms for the CLI
nlohmann::json ToJson(const Pose &pose);
nlohmann::json ToJson(const Joints &joints);
nlohmann::json ToJson(const Status &status);
nlohmann::json ToJson(const AprilTag &tag);
nlohmann::json ToJson(const TrainingEpisode &episode);
nlohmann::json ToJson(const TaskTraining &training);

} // namespace robot
} // namespace almond
