// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/infra/mock_transport.hpp"
#include "rpc/codec.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace almond {
namespace test {

inline std::string ResultFrame(uint64_t id, const nlohmann::json& result) {
    rpc::ResponseEnvelope response;
    response.id = id;
    response.result = result;
    return rpc::EncodeResponse(response);
}

inline std::string ErrorFrame(uint64_t id, int64_t code, const std::string& message) {
    rpc::ResponseEnvelope response;
    response.id = id;
    response.error = rpc::ErrorObject{code, message, nullptr};
    return rpc::EncodeResponse(response);
}

/**
 * ScriptedRobot - fake robot server behind a MockTransport
 *
 * Answers each request by method name: a scripted result, a scripted error,
 * or null. Methods marked silent get no answer at all. Every request is
 * recorded for parameter checks.
 */
class ScriptedRobot : public std::enable_shared_from_this<ScriptedRobot> {
public:
    void on(const std::string& method, nlohmann::json result) {
        std::lock_guard<std::mutex> lock(mutex_);
        results_[method] = std::move(result);
    }

    void fail(const std::string& method, int64_t code, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_[method] = {code, message};
    }

    void silent(const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex_);
        silent_[method] = true;
    }

    Responder responder() {
        std::weak_ptr<ScriptedRobot> weak = shared_from_this();
        return [weak](const std::string& frame) -> std::optional<std::string> {
            auto self = weak.lock();
            if (!self) return std::nullopt;
            return self->answer(frame);
        };
    }

    std::vector<rpc::RequestEnvelope> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    // Most recent request for method; throws if there was none
    rpc::RequestEnvelope last_request(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = requests_.rbegin(); it != requests_.rend(); ++it) {
            if (it->method == method) return *it;
        }
        throw std::runtime_error("no request for " + method);
    }

private:
    std::optional<std::string> answer(const std::string& frame) {
        rpc::RequestEnvelope request = rpc::DecodeRequest(frame);
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);

        if (silent_.count(request.method)) {
            return std::nullopt;
        }
        auto err = errors_.find(request.method);
        if (err != errors_.end()) {
            return ErrorFrame(request.id, err->second.first, err->second.second);
        }
        auto res = results_.find(request.method);
        return ResultFrame(request.id, res != results_.end() ? res->second : nlohmann::json(nullptr));
    }

    mutable std::mutex mutex_;
    std::map<std::string, nlohmann::json> results_;
    std::map<std::string, std::pair<int64_t, std::string>> errors_;
    std::map<std::string, bool> silent_;
    std::vector<rpc::RequestEnvelope> requests_;
};

} // namespace test
} // namespace almond
