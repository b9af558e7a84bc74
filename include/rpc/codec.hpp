// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace almond {
namespace rpc {

/*
 JSON-RPC 2.0 wire codec

 Request:  {"jsonrpc":"2.0","method":<string>,"params":<object>,"id":<uint>}
 Success:  {"id":<uint>,"result":<any>}
 Failure:  {"id":<uint>,"error":{"code":<int>,"message":<string>[,"data":<any>]}}

 Decoders throw MalformedResponse when a frame is not valid JSON or does not
 have the envelope shape. When the response id was readable the exception
 carries it, so the call it names can be failed instead of left waiting.
 "jsonrpc" is emitted on encode and tolerated (but not required) on decode;
 the robot server omits it in responses.
*/

constexpr const char *JSONRPC_VERSION = "2.0";

struct RequestEnvelope {
  uint64_t id = 0;
  std::string method;
  nlohmann::json params = nlohmann::json::object();
};

struct ErrorObject {
  int64_t code = 0;
  std::string message;
  nlohmann::json data;  // null when absent
};

struct ResponseEnvelope {
  uint64_t id = 0;
  nlohmann::json result;  // meaningful only when error is empty; may be null
  std::optional<ErrorObject> error;

  bool is_error() const { return error.has_value(); }
};

std::string EncodeRequest(const RequestEnvelope &request);
RequestEnvelope DecodeRequest(const std::string &frame);

std::string EncodeResponse(const ResponseEnvelope &response);
ResponseEnvelope DecodeResponse(const std::string &frame);

} // namespace rpc
} // namespace almond
