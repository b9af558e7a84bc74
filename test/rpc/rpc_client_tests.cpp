// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// RPCClient tests: correlation, failure delivery, reconnect and timeouts

#include <catch2/catch.hpp>
#include "network/infra/mock_transport.hpp"
#include "network/infra/scripted_robot.hpp"
#include "rpc/codec.hpp"
#include "rpc/errors.hpp"
#include "rpc/rpc_client.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace almond;
using namespace almond::rpc;
using almond::test::ErrorFrame;
using almond::test::MockTransport;
using almond::test::ResultFrame;
using almond::test::ScriptedRobot;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

ClientConfig TestConfig() {
    ClientConfig config;
    config.host = "robot.test";
    config.connect_timeout = 500ms;
    return config;
}

struct ClientFixture {
    std::shared_ptr<MockTransport> transport = std::make_shared<MockTransport>();
    std::shared_ptr<ScriptedRobot> robot = std::make_shared<ScriptedRobot>();

    ClientFixture() { transport->set_default_responder(robot->responder()); }
};

} // namespace

TEST_CASE("RPCClient - construction", "[rpc][client]") {
    SECTION("Null transport is rejected") {
        REQUIRE_THROWS_AS(RPCClient(TestConfig(), nullptr), std::invalid_argument);
    }

    SECTION("No connection until first use") {
        auto transport = std::make_shared<MockTransport>();
        RPCClient client(TestConfig(), transport);
        REQUIRE_FALSE(client.IsConnected());
        REQUIRE(transport->connect_attempts() == 0);
        REQUIRE(client.PendingCalls() == 0);
    }
}

TEST_CASE("RPCClient - set_speed request on the wire", "[rpc][client]") {
    ClientFixture fx;
    RPCClient client(TestConfig(), fx.transport);

    json result = client.Invoke("set_speed", {{"percent", 50}});
    REQUIRE(result.is_null());

    auto frames = fx.transport->last_connection()->sent_frames();
    REQUIRE(frames.size() == 1);
    REQUIRE(json::parse(frames[0]) ==
            json{{"jsonrpc", "2.0"}, {"method", "set_speed"}, {"params", {{"percent", 50}}}, {"id", 1}});

    SECTION("Identifiers increase per call") {
        client.Invoke("get_status");
        auto requests = fx.robot->requests();
        REQUIRE(requests.size() == 2);
        REQUIRE(requests[1].id == 2);
        REQUIRE(requests[1].params == json::object());
    }
}

TEST_CASE("RPCClient - server error becomes RpcError", "[rpc][client]") {
    ClientFixture fx;
    RPCClient client(TestConfig(), fx.transport);

    for (int i = 0; i < 6; ++i) {
        client.Invoke("get_status");
    }
    fx.robot->fail("get_joint_angles", -32000, "joint encoder offline");

    try {
        client.Invoke("get_joint_angles");
        FAIL("expected RpcError");
    } catch (const RpcError& e) {
        REQUIRE(e.id() == 7);
        REQUIRE(e.code() == -32000);
        REQUIRE(e.message() == "joint encoder offline");
        REQUIRE(e.method() == "get_joint_angles");
    }

    // The link survives a server-side error
    REQUIRE(client.IsConnected());
    REQUIRE(client.PendingCalls() == 0);
}

TEST_CASE("RPCClient - params must be an object", "[rpc][client]") {
    ClientFixture fx;
    RPCClient client(TestConfig(), fx.transport);

    REQUIRE_THROWS_AS(client.Invoke("set_speed", json::array({50})), std::invalid_argument);
    REQUIRE_THROWS_AS(client.Invoke("set_speed", 50), std::invalid_argument);
    REQUIRE(fx.transport->connect_attempts() == 0);

    // Null is sent as an empty object
    client.Invoke("open_tool", nullptr);
    REQUIRE(fx.robot->last_request("open_tool").params == json::object());
}

TEST_CASE("RPCClient - concurrent calls are correlated by id", "[rpc][client]") {
    auto transport = std::make_shared<MockTransport>();
    RPCClient client(TestConfig(), transport);
    client.Connect();
    auto conn = transport->last_connection();

    constexpr int CALLERS = 8;
    std::atomic<int> mismatches{0};
    std::atomic<int> completed{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < CALLERS; ++i) {
        callers.emplace_back([&, i]() {
            json result = client.Invoke("get_tool_pose", {{"caller", i}});
            if (result != json{{"echo", i}}) {
                ++mismatches;
            }
            ++completed;
        });
    }

    REQUIRE(conn->wait_for_sent(CALLERS));
    REQUIRE(completed.load() == 0);

    // Answer in reverse send order
    auto frames = conn->sent_frames();
    for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
        auto request = DecodeRequest(*it);
        conn->simulate_receive(ResultFrame(request.id, {{"echo", request.params["caller"]}}));
    }

    for (auto& caller : callers) {
        caller.join();
    }
    REQUIRE(mismatches.load() == 0);
    REQUIRE(completed.load() == CALLERS);
    REQUIRE(client.PendingCalls() == 0);
}

TEST_CASE("RPCClient - unknown response ids are ignored", "[rpc][client]") {
    auto transport = std::make_shared<MockTransport>();
    RPCClient client(TestConfig(), transport);
    client.Connect();
    auto conn = transport->last_connection();

    json result;
    std::thread caller([&]() { result = client.Invoke("get_joint_angles"); });
    REQUIRE(conn->wait_for_sent(1));

    conn->simulate_receive(ResultFrame(999, {{"j1", 0}}));
    conn->simulate_receive(ErrorFrame(1000, -1, "stray"));
    REQUIRE(client.PendingCalls() == 1);

    conn->simulate_receive(ResultFrame(1, {{"j1", 45}}));
    caller.join();
    REQUIRE(result["j1"] == 45);
}

TEST_CASE("RPCClient - disconnect fails every pending call", "[rpc][client]") {
    ClientFixture fx;
    fx.robot->silent("record_episode");
    RPCClient client(TestConfig(), fx.transport);
    client.Connect();
    auto conn = fx.transport->last_connection();

    constexpr int PENDING = 5;
    std::atomic<int> disconnected{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < PENDING; ++i) {
        callers.emplace_back([&]() {
            try {
                client.Invoke("record_episode", {{"task_name", "pick"}, {"duration", 30}});
            } catch (const Disconnected&) {
                ++disconnected;
            }
        });
    }

    REQUIRE(conn->wait_for_sent(PENDING));
    REQUIRE(client.PendingCalls() == PENDING);

    SECTION("Local disconnect") {
        client.Disconnect();
    }

    SECTION("Peer disconnect") {
        conn->simulate_disconnect();
    }

    for (auto& caller : callers) {
        caller.join();
    }
    REQUIRE(disconnected.load() == PENDING);
    REQUIRE(client.PendingCalls() == 0);
    REQUIRE_FALSE(client.IsConnected());
}

TEST_CASE("RPCClient - drop after send, then reconnect", "[rpc][client]") {
    ClientFixture fx;
    fx.robot->silent("move_arc");
    RPCClient client(TestConfig(), fx.transport);

    client.Invoke("get_status");
    client.Invoke("get_tool_pose");
    auto first_conn = fx.transport->last_connection();

    std::atomic<bool> got_disconnected{false};
    std::thread caller([&]() {
        try {
            client.Invoke("move_arc", {{"radius", 10}});
        } catch (const Disconnected&) {
            got_disconnected = true;
        }
    });
    REQUIRE(first_conn->wait_for_sent(3));
    REQUIRE(DecodeRequest(first_conn->sent_frames()[2]).id == 3);

    first_conn->simulate_disconnect();
    caller.join();
    REQUIRE(got_disconnected.load());
    REQUIRE_FALSE(client.IsConnected());

    // The next call opens a new connection and the id sequence carries on
    client.Invoke("get_status");
    REQUIRE(client.IsConnected());
    REQUIRE(fx.transport->connect_attempts() == 2);
    auto second_conn = fx.transport->last_connection();
    REQUIRE(second_conn != first_conn);
    REQUIRE(DecodeRequest(second_conn->sent_frames()[0]).id == 4);
}

TEST_CASE("RPCClient - stale connection found at send", "[rpc][client]") {
    ClientFixture fx;
    fx.robot->on("get_status", {{"mode", "drag"}, {"status", "idle"}});
    RPCClient client(TestConfig(), fx.transport);
    client.Connect();

    SECTION("One reconnect and resend") {
        fx.transport->last_connection()->break_silently();
        json result = client.Invoke("get_status");
        REQUIRE(result["status"] == "idle");
        REQUIRE(fx.transport->connect_attempts() == 2);
        // The retry used a fresh identifier
        REQUIRE(fx.robot->last_request("get_status").id == 2);
    }

    SECTION("Reconnect refused") {
        fx.transport->last_connection()->break_silently();
        fx.transport->set_refuse_connections(true);
        REQUIRE_THROWS_AS(client.Invoke("get_status"), ConnectionError);
        REQUIRE(client.PendingCalls() == 0);
    }
}

TEST_CASE("RPCClient - send fails on a link the call just opened", "[rpc][client]") {
    ClientFixture fx;
    fx.transport->set_refuse_sends(true);
    RPCClient client(TestConfig(), fx.transport);
    REQUIRE_FALSE(client.IsConnected());

    REQUIRE_THROWS_AS(client.Invoke("get_status"), Disconnected);
    // Only the one open, no second reconnect
    REQUIRE(fx.transport->connect_attempts() == 1);
    REQUIRE(client.PendingCalls() == 0);

    // The next call opens afresh and succeeds
    fx.transport->set_refuse_sends(false);
    REQUIRE(client.Invoke("get_status").is_null());
    REQUIRE(fx.transport->connect_attempts() == 2);
}

TEST_CASE("RPCClient - malformed response fails its call", "[rpc][client]") {
    auto transport = std::make_shared<MockTransport>();
    RPCClient client(TestConfig(), transport);
    client.Connect();
    auto conn = transport->last_connection();

    std::atomic<bool> malformed{false};
    std::thread caller([&]() {
        try {
            client.Invoke("get_joint_angles");
        } catch (const MalformedResponse& e) {
            malformed = e.id() == std::optional<uint64_t>(1);
        }
    });
    REQUIRE(conn->wait_for_sent(1));

    SECTION("Error member is not an object") {
        conn->simulate_receive(R"({"id":1,"error":"arm not calibrated"})");
    }

    SECTION("Neither result nor error") {
        conn->simulate_receive(R"({"id":1})");
    }

    SECTION("Error object without a code") {
        conn->simulate_receive(R"({"id":1,"error":{"message":"fault"}})");
    }

    caller.join();
    REQUIRE(malformed.load());
    REQUIRE(client.PendingCalls() == 0);
    // The link is still usable
    REQUIRE(client.IsConnected());
}

TEST_CASE("RPCClient - unreachable server", "[rpc][client]") {
    auto transport = std::make_shared<MockTransport>();
    transport->set_refuse_connections(true);
    RPCClient client(TestConfig(), transport);

    REQUIRE_THROWS_AS(client.Connect(), ConnectionError);
    REQUIRE_THROWS_AS(client.Invoke("get_status"), ConnectionError);
    REQUIRE(client.PendingCalls() == 0);

    // Recovers once the server is back
    transport->set_refuse_connections(false);
    REQUIRE_NOTHROW(client.Connect());
}

TEST_CASE("RPCClient - call timeout", "[rpc][client]") {
    ClientFixture fx;
    fx.robot->silent("run_task");
    RPCClient client(TestConfig(), fx.transport);
    client.Connect();
    auto conn = fx.transport->last_connection();

    try {
        client.Invoke("run_task", {{"task_name", "pick"}, {"training_name", nullptr}}, 100ms);
        FAIL("expected Timeout");
    } catch (const Timeout& e) {
        REQUIRE(e.method() == "run_task");
        REQUIRE(e.id() == 1);
        REQUIRE(e.timeout_ms() == 100);
    }
    REQUIRE(client.PendingCalls() == 0);

    // A late answer is discarded and the link stays usable
    conn->simulate_receive(ResultFrame(1, true));
    REQUIRE(client.IsConnected());
    REQUIRE(client.Invoke("get_status").is_null());

    SECTION("Configured default deadline") {
        ClientFixture other;
        other.robot->silent("run_task");
        ClientConfig config = TestConfig();
        config.call_timeout = 50ms;
        RPCClient bounded(config, other.transport);
        REQUIRE_THROWS_AS(bounded.Invoke("run_task"), Timeout);
        REQUIRE(bounded.Invoke("get_status").is_null());
    }
}
