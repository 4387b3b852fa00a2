//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session_shutdown.cpp
// Purpose: Draining behaviour: grace period, abandoned calls and refusal of late requests
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "toolhost/InMemoryTransport.hpp"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/MetricsCollector.h"
#include "toolhost/Protocol.h"
#include "toolhost/SessionLoop.h"
#include "toolhost/ShutdownCoordinator.hpp"
#include "toolhost/ToolRegistry.h"
#include "toolhost/tools/SchemaBuilder.h"

using namespace toolhost;
using namespace std::chrono_literals;

namespace {

class SessionShutdownTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Blocks until released or stopped; reports which one happened.
        registry.Register(ToolSpec{"wait", "Waits for release", tools::SchemaBuilder().build()},
                          [this](const JSONValue&, std::stop_token st) -> ToolOutput {
                              ++entered;
                              while (!released.load() && !st.stop_requested()) {
                                  std::this_thread::sleep_for(2ms);
                              }
                              return {makeText(released.load() ? "released" : "stopped")};
                          });
        registry.Register(ToolSpec{"sleep", "Sleeps for 'ms' milliseconds",
                                   tools::SchemaBuilder().property("ms", "integer", "").required({"ms"}).build()},
                          [](const JSONValue& args, std::stop_token) -> ToolOutput {
                              std::this_thread::sleep_for(
                                  std::chrono::milliseconds(static_cast<int>(getNumber(args, "ms").value_or(0))));
                              return {makeText("done")};
                          });
    }

    void TearDown() override {
        released = true;
        if (client) {
            client->Close().get();
        }
    }

    void startSession(std::chrono::milliseconds grace) {
        SessionOptions options;
        options.gracePeriod = grace;
        auto pair = InMemoryTransport::CreatePair();
        client = std::move(pair.second);
        session = std::make_unique<SessionLoop>(registry, metrics, options);
        session->Start(std::move(pair.first)).get();
        client->Start().get();
        running = session->Run(coordinator.GetToken());
    }

    std::future<std::unique_ptr<JSONRPCResponse>> call(int64_t id, const std::string& name, const std::string& args) {
        JSONValue::Object params;
        setField(params, "name", JSONValue(name));
        setField(params, "arguments", parseJSONValue(args));
        return client->SendRequest(std::make_unique<JSONRPCRequest>(id, Methods::CallTool, JSONValue(std::move(params))));
    }

    bool waitEntered(int n) {
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (entered.load() < n) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(2ms);
        }
        return true;
    }

    ToolRegistry registry;
    MetricsCollector metrics;
    ShutdownCoordinator coordinator;
    std::atomic<int> entered{0};
    std::atomic<bool> released{false};
    std::unique_ptr<SessionLoop> session;
    std::unique_ptr<InMemoryTransport> client;
    std::future<MetricsSnapshot> running;
};

} // namespace

TEST_F(SessionShutdownTest, CallFinishingWithinGraceIsDelivered) {
    startSession(2000ms);
    auto pending = call(1, "sleep", R"({"ms":150})");
    std::this_thread::sleep_for(30ms);
    coordinator.Trigger("test");

    ASSERT_EQ(pending.wait_for(3s), std::future_status::ready);
    auto resp = pending.get();
    ASSERT_TRUE(resp->result.has_value());
    EXPECT_FALSE(getBoolOr(*resp->result, "isError", true));

    ASSERT_EQ(running.wait_for(3s), std::future_status::ready);
    MetricsSnapshot summary = running.get();
    EXPECT_EQ(summary.requestsSuccessful, 1u);
    EXPECT_EQ(session->GetState(), ServerState::Stopped);
}

TEST_F(SessionShutdownTest, CallOutlivingGraceIsAbandoned) {
    startSession(100ms);
    auto pending = call(1, "wait", "{}");
    ASSERT_TRUE(waitEntered(1));

    const auto begin = std::chrono::steady_clock::now();
    coordinator.Trigger("test");
    ASSERT_EQ(running.wait_for(3s), std::future_status::ready);
    MetricsSnapshot summary = running.get();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
    EXPECT_EQ(summary.requestsSuccessful, 0u);

    // The session closed without answering; the caller sees its request fail
    ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(pending.get()->IsError());

    // Destroying the session waits for the stopped handler; it is recorded as a failure
    session.reset();
    auto after = metrics.Snapshot();
    EXPECT_EQ(after.requestsSuccessful, 0u);
    EXPECT_EQ(after.requestsFailed, 1u);
}

TEST_F(SessionShutdownTest, RequestsDuringDrainAreRefused) {
    startSession(3000ms);
    auto blocker = call(1, "wait", "{}");
    ASSERT_TRUE(waitEntered(1));
    coordinator.Trigger("test");

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (session->GetState() != ServerState::Draining && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(2ms);
    }
    ASSERT_EQ(session->GetState(), ServerState::Draining);

    auto late = client->SendRequest(std::make_unique<JSONRPCRequest>(static_cast<int64_t>(2), Methods::Ping));
    ASSERT_EQ(late.wait_for(2s), std::future_status::ready);
    auto resp = late.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(getNumber(*resp->error, "code").value_or(0), JSONRPCErrorCodes::ServerShuttingDown);

    released = true;
    ASSERT_EQ(blocker.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(getStringOr(*std::get<JSONValue::Array>(blocker.get()->result->find("content")->value).front(), "text", ""),
              "released");
    ASSERT_EQ(running.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(running.get().requestsSuccessful, 1u);
}

TEST_F(SessionShutdownTest, SuccessfulCountMatchesDeliveredResponsesAtGraceBoundary) {
    startSession(60ms);
    std::vector<std::future<std::unique_ptr<JSONRPCResponse>>> pending;
    for (int i = 0; i < 8; ++i) {
        pending.push_back(call(i + 1, "sleep", "{\"ms\":" + std::to_string(45 + i * 4) + "}"));
    }
    std::this_thread::sleep_for(10ms);
    coordinator.Trigger("test");

    ASSERT_EQ(running.wait_for(3s), std::future_status::ready);
    MetricsSnapshot summary = running.get();

    std::uint64_t delivered = 0;
    for (auto& f : pending) {
        ASSERT_EQ(f.wait_for(2s), std::future_status::ready);
        auto resp = f.get();
        if (!resp->IsError()) {
            ++delivered;
        }
    }
    EXPECT_EQ(summary.requestsSuccessful, delivered);

    session.reset();
    auto after = metrics.Snapshot();
    EXPECT_EQ(after.requestsSuccessful, delivered);
    EXPECT_EQ(after.requestsTotal, 8u);
}
