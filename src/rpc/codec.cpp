// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rpc/codec.hpp"
#include "rpc/errors.hpp"

namespace almond {
namespace rpc {

using nlohmann::json;

namespace {

json ParseObject(const std::string &frame, const char *what) {
  json j;
  try {
    j = json::parse(frame);
  } catch (const json::parse_error &e) {
    throw MalformedResponse(std::string("invalid JSON in ") + what + ": " + e.what());
  }
  if (!j.is_object()) {
    throw MalformedResponse(std::string(what) + " is not a JSON object");
  }
  if (j.contains("jsonrpc") &&
      (!j["jsonrpc"].is_string() || j["jsonrpc"].get<std::string>() != JSONRPC_VERSION)) {
    throw MalformedResponse(std::string(what) + " has unsupported jsonrpc version");
  }
  return j;
}

uint64_t ParseId(const json &j, const char *what) {
  auto it = j.find("id");
  if (it == j.end() || it->is_null()) {
    throw MalformedResponse(std::string(what) + " has no id");
  }
  if (!it->is_number_unsigned()) {
    throw MalformedResponse(std::string(what) + " id is not an unsigned integer: " + it->dump());
  }
  return it->get<uint64_t>();
}

} // namespace

std::string EncodeRequest(const RequestEnvelope &request) {
  json j = {{"jsonrpc", JSONRPC_VERSION},
            {"method", request.method},
            {"params", request.params.is_null() ? json::object() : request.params},
            {"id", request.id}};
  return j.dump();
}

RequestEnvelope DecodeRequest(const std::string &frame) {
  json j = ParseObject(frame, "request");

  RequestEnvelope request;
  request.id = ParseId(j, "request");

  auto method = j.find("method");
  if (method == j.end() || !method->is_string()) {
    throw MalformedResponse("request has no method name");
  }
  request.method = method->get<std::string>();

  auto params = j.find("params");
  if (params != j.end() && !params->is_null()) {
    if (!params->is_object()) {
      throw MalformedResponse("request params are not an object");
    }
    request.params = *params;
  }
  return request;
}

std::string EncodeResponse(const ResponseEnvelope &response) {
  json j = {{"id", response.id}};
  if (response.error) {
    json error = {{"code", response.error->code},
                  {"message", response.error->message}};
    if (!response.error->data.is_null()) {
      error["data"] = response.error->data;
    }
    j["error"] = std::move(error);
  } else {
    j["result"] = response.result;
  }
  return j.dump();
}

ResponseEnvelope DecodeResponse(const std::string &frame) {
  json j = ParseObject(frame, "response");

  ResponseEnvelope response;
  response.id = ParseId(j, "response");

  bool has_result = j.contains("result");
  bool has_error = j.contains("error") && !j["error"].is_null();
  if (has_result == has_error) {
    throw MalformedResponse("response " + std::to_string(response.id) +
                            " must carry exactly one of result or error",
                            response.id);
  }

  if (has_result) {
    response.result = j["result"];
    return response;
  }

  const json &error = j["error"];
  if (!error.is_object()) {
    throw MalformedResponse("response " + std::to_string(response.id) +
                            " error is not an object",
                            response.id);
  }
  auto code = error.find("code");
  auto message = error.find("message");
  if (code == error.end() || !code->is_number_integer()) {
    throw MalformedResponse("response " + std::to_string(response.id) +
                            " error has no integer code",
                            response.id);
  }
  if (message == error.end() || !message->is_string()) {
    throw MalformedResponse("response " + std::to_string(response.id) +
                            " error has no message",
                            response.id);
  }

  ErrorObject error_object;
  error_object.code = code->get<int64_t>();
  error_object.message = message->get<std::string>();
  if (auto data = error.find("data"); data != error.end()) {
    error_object.data = *data;
  }
  response.error = std::move(error_object);
  return response;
}

} // namespace rpc
} // namespace almond
