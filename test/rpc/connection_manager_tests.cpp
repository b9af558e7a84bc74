// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// ConnectionManager state machine tests over an in-memory transport

#include <catch2/catch.hpp>
#include "network/infra/mock_transport.hpp"
#include "network/infra/scripted_robot.hpp"
#include "rpc/codec.hpp"
#include "rpc/connection_manager.hpp"
#include "rpc/errors.hpp"
#include "rpc/pending_calls.hpp"
#include <chrono>
#include <optional>

using namespace almond;
using namespace almond::rpc;
using almond::test::MockTransport;
using almond::test::ResultFrame;
using namespace std::chrono_literals;

namespace {

ClientConfig TestConfig() {
    ClientConfig config;
    config.host = "robot.test";
    config.port = 8123;
    config.path = "/ws";
    config.connect_timeout = 200ms;
    return config;
}

std::string RequestFrame(uint64_t id, const std::string& method) {
    RequestEnvelope request;
    request.id = id;
    request.method = method;
    return EncodeRequest(request);
}

} // namespace

TEST_CASE("ConnectionManager - open establishes one connection", "[rpc][connection]") {
    auto transport = std::make_shared<MockTransport>();
    PendingCallRegistry registry;
    ConnectionManager manager(transport, TestConfig(), registry);

    REQUIRE(manager.state() == ConnectionState::CLOSED);
    manager.open();

    REQUIRE(manager.state() == ConnectionState::OPEN);
    REQUIRE(manager.is_open());
    REQUIRE(transport->is_running());
    REQUIRE(transport->connect_attempts() == 1);
    REQUIRE(transport->last_host() == "robot.test");
    REQUIRE(transport->last_port() == 8123);
    REQUIRE(transport->last_path() == "/ws");
    REQUIRE(transport->last_connection()->started());

    SECTION("Open is idempotent") {
        manager.open();
        REQUIRE_FALSE(manager.ensure_open());
        REQUIRE(transport->connect_attempts() == 1);
    }
}

TEST_CASE("ConnectionManager - unreachable endpoint", "[rpc][connection]") {
    auto transport = std::make_shared<MockTransport>();
    PendingCallRegistry registry;
    ConnectionManager manager(transport, TestConfig(), registry);

    SECTION("Connection refused") {
        transport->set_refuse_connections(true);
        REQUIRE_THROWS_AS(manager.open(), ConnectionError);
        REQUIRE(manager.state() == ConnectionState::CLOSED);
    }

    SECTION("Connect timeout") {
        transport->set_hang_connections(true);
        auto start = std::chrono::steady_clock::now();
        REQUIRE_THROWS_AS(manager.open(), ConnectionError);
        REQUIRE(std::chrono::steady_clock::now() - start >= 200ms);
        REQUIRE(manager.state() == ConnectionState::CLOSED);
        // The half-made connection was torn down
        REQUIRE_FALSE(transport->last_connection()->is_open());
    }

    SECTION("A later attempt can succeed") {
        transport->set_refuse_connections(true);
        REQUIRE_THROWS_AS(manager.ensure_open(), ConnectionError);
        transport->set_refuse_connections(false);
        manager.ensure_open();
        REQUIRE(manager.is_open());
    }
}

TEST_CASE("ConnectionManager - close abandons pending calls", "[rpc][connection]") {
    auto transport = std::make_shared<MockTransport>();
    PendingCallRegistry registry;
    ConnectionManager manager(transport, TestConfig(), registry);
    manager.open();
    auto conn = transport->last_connection();

    auto first = registry.register_call(1, "record_episode");
    auto second = registry.register_call(2, "train");

    manager.close();

    REQUIRE(manager.state() == ConnectionState::CLOSED);
    REQUIRE_FALSE(conn->is_open());
    REQUIRE(registry.size() == 0);
    REQUIRE_THROWS_AS(first.get(), Disconnected);
    REQUIRE_THROWS_AS(second.get(), Disconnected);

    // Second close is a no-op
    manager.close();
    REQUIRE(manager.state() == ConnectionState::CLOSED);
}

TEST_CASE("ConnectionManager - peer disconnect abandons pending calls", "[rpc][connection]") {
    auto transport = std::make_shared<MockTransport>();
    PendingCallRegistry registry;
    ConnectionManager manager(transport, TestConfig(), registry);
    manager.open();

    auto pending = registry.register_call(3, "replay_episode");
    transport->last_connection()->simulate_disconnect();

    REQUIRE(manager.state() == ConnectionState::CLOSED);
    REQUIRE_THROWS_AS(pending.get(), Disconnected);

    SECTION("ensure_open reconnects with a fresh connection") {
        REQUIRE(manager.ensure_open());
        REQUIRE(manager.is_open());
        REQUIRE(transport->connect_attempts() == 2);
        auto connections = transport->connections();
        REQUIRE(connections.size() == 2);
        REQUIRE(connections[0]->connection_id() != connections[1]->connection_id());
    }
}

TEST_CASE("ConnectionManager - replaced connection cannot close the new one", "[rpc][connection]") {
    auto transport = std::make_shared<MockTransport>();
    PendingCallRegistry registry;
    ConnectionManager manager(transport, TestConfig(), registry);

    manager.open();
    auto old_conn = transport->last_connection();
    manager.close();
    manager.open();

    auto pending = registry.register_call(1, "get_status");
    old_conn->simulate_disconnect();

    REQUIRE(manager.is_open());
    REQUIRE(registry.contains(1));
}

TEST_CASE("ConnectionManager - send", "[rpc][connection]") {
    auto transport = std::make_shared<MockTransport>();
    PendingCallRegistry registry;
    ConnectionManager manager(transport, TestConfig(), registry);

    SECTION("Closed manager refuses to send") {
        REQUIRE_THROWS_AS(manager.send(RequestFrame(1, "open_tool")), Disconnected);
        REQUIRE(transport->connect_attempts() == 0);
    }

    SECTION("Frame reaches the transport") {
        manager.open();
        manager.send(RequestFrame(1, "open_tool"));
        auto frames = transport->last_connection()->sent_frames();
        REQUIRE(frames.size() == 1);
        REQUIRE(DecodeRequest(frames[0]).method == "open_tool");
    }

    SECTION("Refused frame drops the connection") {
        manager.open();
        auto pending = registry.register_call(5, "close_tool");
        transport->last_connection()->break_silently();

        REQUIRE_THROWS_AS(manager.send(RequestFrame(6, "open_tool")), Disconnected);
        REQUIRE(manager.state() == ConnectionState::CLOSED);
        REQUIRE_THROWS_AS(pending.get(), Disconnected);
    }
}

TEST_CASE("ConnectionManager - inbound frames are routed by id", "[rpc][connection]") {
    auto transport = std::make_shared<MockTransport>();
    PendingCallRegistry registry;
    ConnectionManager manager(transport, TestConfig(), registry);
    manager.open();
    auto conn = transport->last_connection();

    auto first = registry.register_call(1, "get_joint_angles");
    auto second = registry.register_call(2, "get_tool_pose");

    SECTION("Frames without a usable id are skipped") {
        conn->simulate_receive("not json");
        conn->simulate_receive(R"({"result":null})");
        conn->simulate_receive(R"({"id":"1","result":null})");
        conn->simulate_receive(R"([{"id":1,"result":null}])");
        REQUIRE(registry.size() == 2);
        REQUIRE(manager.is_open());
    }

    SECTION("A malformed response fails the call it names") {
        conn->simulate_receive(R"({"id":1})");
        REQUIRE_FALSE(registry.contains(1));
        REQUIRE(registry.contains(2));
        try {
            first.get();
            FAIL("expected MalformedResponse");
        } catch (const MalformedResponse& e) {
            REQUIRE(e.id() == std::optional<uint64_t>(1));
        }

        // Same shape for an id nobody waits for: logged and dropped
        conn->simulate_receive(R"({"id":9,"error":"boom"})");
        REQUIRE(registry.size() == 1);
        REQUIRE(manager.is_open());
    }

    SECTION("Responses complete the matching call only") {
        conn->simulate_receive(ResultFrame(2, {{"x", 1}}));
        REQUIRE(registry.contains(1));
        REQUIRE_FALSE(registry.contains(2));
        REQUIRE(second.get()["x"] == 1);

        conn->simulate_receive(R"({"id":1,"error":{"code":-32000,"message":"fault"}})");
        REQUIRE_THROWS_AS(first.get(), RpcError);
    }

    SECTION("Unknown ids do not disturb pending calls") {
        conn->simulate_receive(ResultFrame(77, nullptr));
        REQUIRE(registry.size() == 2);
    }
}

TEST_CASE("ConnectionState names", "[rpc][connection]") {
    REQUIRE(std::string(ConnectionStateName(ConnectionState::CLOSED)) == "closed");
    REQUIRE(std::string(ConnectionStateName(ConnectionState::OPENING)) == "opening");
    REQUIRE(std::string(ConnectionStateName(ConnectionState::OPEN)) == "open");
}
