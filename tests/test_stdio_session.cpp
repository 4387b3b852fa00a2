//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_session.cpp
// Purpose: SessionLoop served over a pipe-backed StdioTransport with server-derived frame limits
//==========================================================================================================

#include <gtest/gtest.h>

#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <variant>

#include "toolhost/Config.h"
#include "toolhost/ContentFramer.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/MetricsCollector.h"
#include "toolhost/Protocol.h"
#include "toolhost/SessionLoop.h"
#include "toolhost/StdioTransport.hpp"
#include "toolhost/ToolRegistry.h"
#include "toolhost/tools/BuiltinTools.h"

using namespace toolhost;
using namespace std::chrono_literals;

namespace {

class StdioSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::pipe(inPipe), 0);
        ASSERT_EQ(::pipe(outPipe), 0);

        config.maxRequestSize = 1024;
        tools::RegisterProfileTools(registry, ToolProfile::Simple, &metrics, config.version, nullptr);

        auto transport = std::make_unique<StdioTransport>(inPipe[0], outPipe[1]);
        transport->SetMaxContentLength(config.maxRequestSize + ServerConfig::kEnvelopeAllowance);
        session = std::make_unique<SessionLoop>(registry, metrics, config.ToSessionOptions());
        session->Start(std::move(transport)).get();
        running = session->Run(stop.get_token());
    }

    void TearDown() override {
        stop.request_stop();
        if (running.valid()) {
            (void)running.wait_for(5s);
        }
        session.reset();
        for (int fd : {inPipe[0], inPipe[1], outPipe[0], outPipe[1]}) {
            if (fd >= 0) ::close(fd);
        }
    }

    // The transport reads concurrently, so bodies larger than the pipe buffer still go through.
    void send(const std::string& body) {
        const std::string bytes = MakeContentLengthFramer()->encode(body);
        std::size_t off = 0;
        while (off < bytes.size()) {
            const ssize_t n = ::write(inPipe[1], bytes.data() + off, bytes.size() - off);
            ASSERT_GT(n, 0);
            off += static_cast<std::size_t>(n);
        }
    }

    std::string callBody(int64_t id, const std::string& message) {
        return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) +
               R"(,"method":"tools/call","params":{"name":"echo","arguments":{"message":")" + message + R"("}}})";
    }

    std::optional<JSONValue> readResponse() {
        auto framer = MakeContentLengthFramer(4 * 1024 * 1024);
        const auto deadline = std::chrono::steady_clock::now() + 3s;
        while (std::chrono::steady_clock::now() < deadline) {
            if (auto payload = framer->tryDecode(output)) {
                return parseJSONValue(*payload);
            }
            pollfd pfd{outPipe[0], POLLIN, 0};
            if (::poll(&pfd, 1, 50) > 0) {
                char buf[8192];
                const ssize_t n = ::read(outPipe[0], buf, sizeof(buf));
                if (n > 0) output.append(buf, static_cast<std::size_t>(n));
            }
        }
        return std::nullopt;
    }

    static double errorCode(const JSONValue& response) {
        const JSONValue* error = response.find("error");
        return error ? getNumber(*error, "code").value_or(0) : 0;
    }

    int inPipe[2]{-1, -1};
    int outPipe[2]{-1, -1};
    std::string output;
    ServerConfig config;
    ToolRegistry registry;
    MetricsCollector metrics;
    std::stop_source stop;
    std::unique_ptr<SessionLoop> session;
    std::future<MetricsSnapshot> running;
};

} // namespace

TEST_F(StdioSessionTest, OversizedArgumentsGetRequestTooLargeAndSessionKeepsServing) {
    send(callBody(1, std::string(4000, 'a')));
    auto resp = readResponse();
    ASSERT_TRUE(resp.has_value());
    EXPECT_DOUBLE_EQ(getNumber(*resp, "id").value_or(0), 1.0);
    EXPECT_DOUBLE_EQ(errorCode(*resp), JSONRPCErrorCodes::RequestTooLarge);
    EXPECT_EQ(session->GetState(), ServerState::Serving);

    send(callBody(2, "still here"));
    auto next = readResponse();
    ASSERT_TRUE(next.has_value());
    EXPECT_DOUBLE_EQ(getNumber(*next, "id").value_or(0), 2.0);
    EXPECT_FALSE(getBoolOr(*next->find("result"), "isError", true));

    // The rejected call never reached the dispatcher
    EXPECT_EQ(metrics.Snapshot().requestsTotal, 1u);
}

TEST_F(StdioSessionTest, FrameBeyondTransportLimitIsAnsweredWithoutEndingSession) {
    send(callBody(3, std::string(config.maxRequestSize + ServerConfig::kEnvelopeAllowance + 100, 'b')));
    auto resp = readResponse();
    ASSERT_TRUE(resp.has_value());
    ASSERT_NE(resp->find("id"), nullptr);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(resp->find("id")->value));
    EXPECT_DOUBLE_EQ(errorCode(*resp), JSONRPCErrorCodes::RequestTooLarge);

    send(R"({"jsonrpc":"2.0","id":4,"method":"ping"})");
    auto pong = readResponse();
    ASSERT_TRUE(pong.has_value());
    EXPECT_DOUBLE_EQ(getNumber(*pong, "id").value_or(0), 4.0);
    EXPECT_EQ(session->GetState(), ServerState::Serving);
}
