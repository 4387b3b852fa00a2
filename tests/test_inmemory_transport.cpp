//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_transport.cpp
// Purpose: InMemoryTransport pairing, routing and close semantics
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>

#include "toolhost/InMemoryTransport.hpp"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"

using namespace toolhost;

TEST(InMemoryTransport, RequestResponseRoutes) {
    auto pair = InMemoryTransport::CreatePair();
    auto server = std::move(pair.first);
    auto client = std::move(pair.second);

    InMemoryTransport* serverRaw = server.get();
    server->SetRequestHandler([serverRaw](std::unique_ptr<JSONRPCRequest> req) {
        JSONValue::Object obj;
        setField(obj, "method", JSONValue(req->method));
        (void)serverRaw->SendResponse(std::make_unique<JSONRPCResponse>(req->id, JSONValue(std::move(obj))));
    });

    server->Start().get();
    client->Start().get();

    auto fut = client->SendRequest(std::make_unique<JSONRPCRequest>(static_cast<int64_t>(1), Methods::Ping));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp != nullptr);
    ASSERT_FALSE(resp->IsError());
    ASSERT_TRUE(resp->result.has_value());
    EXPECT_EQ(getStringOr(*resp->result, "method", ""), Methods::Ping);

    client->Close().get();
    server->Close().get();
}

TEST(InMemoryTransport, GeneratesIdWhenCallerLeavesItEmpty) {
    auto pair = InMemoryTransport::CreatePair();
    auto server = std::move(pair.first);
    auto client = std::move(pair.second);

    std::promise<std::string> seenId;
    server->SetRequestHandler([&seenId](std::unique_ptr<JSONRPCRequest> req) { seenId.set_value(idToString(req->id)); });
    server->Start().get();
    client->Start().get();

    auto req = std::make_unique<JSONRPCRequest>();
    req->method = Methods::Ping;
    (void)client->SendRequest(std::move(req));
    auto f = seenId.get_future();
    ASSERT_EQ(f.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(f.get().rfind("mem-req-", 0), 0u);

    client->Close().get();
    server->Close().get();
}

TEST(InMemoryTransport, MissingHandlerAnswersMethodNotFound) {
    auto pair = InMemoryTransport::CreatePair();
    auto server = std::move(pair.first);
    auto client = std::move(pair.second);
    server->Start().get();
    client->Start().get();

    auto fut = client->SendRequest(std::make_unique<JSONRPCRequest>(std::string("x"), Methods::ListTools));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(getNumber(*resp->error, "code").value_or(0), JSONRPCErrorCodes::MethodNotFound);

    client->Close().get();
    server->Close().get();
}

TEST(InMemoryTransport, ErrorWhenPeerDisconnected) {
    auto pair = InMemoryTransport::CreatePair();
    auto server = std::move(pair.first);
    auto client = std::move(pair.second);
    client->Start().get();
    server->Start().get();
    server->Close().get();

    auto fut = client->SendRequest(std::make_unique<JSONRPCRequest>(std::string("late"), Methods::Ping));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ASSERT_TRUE(fut.get()->IsError());

    client->Close().get();
}

TEST(InMemoryTransport, PeerCloseReportedAfterQueuedMessages) {
    auto pair = InMemoryTransport::CreatePair();
    auto server = std::move(pair.first);
    auto client = std::move(pair.second);

    std::atomic<int> delivered{0};
    std::promise<void> closed;
    server->SetRequestHandler([&delivered](std::unique_ptr<JSONRPCRequest>) { ++delivered; });
    server->SetErrorHandler([&closed, &delivered](const std::string&) {
        EXPECT_EQ(delivered.load(), 2);
        closed.set_value();
    });
    server->Start().get();
    client->Start().get();

    (void)client->SendRequest(std::make_unique<JSONRPCRequest>(static_cast<int64_t>(1), Methods::Ping));
    (void)client->SendRequest(std::make_unique<JSONRPCRequest>(static_cast<int64_t>(2), Methods::Ping));
    client->Close().get();

    auto f = closed.get_future();
    ASSERT_EQ(f.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_FALSE(server->IsConnected());
    server->Close().get();
}

TEST(InMemoryTransport, PendingRequestsFailOnClose) {
    auto pair = InMemoryTransport::CreatePair();
    auto server = std::move(pair.first);
    auto client = std::move(pair.second);
    // The handler never answers, so the request stays pending
    server->SetRequestHandler([](std::unique_ptr<JSONRPCRequest>) {});
    client->Start().get();
    server->Start().get();

    auto fut = client->SendRequest(std::make_unique<JSONRPCRequest>(std::string("wait"), Methods::Ping));
    client->Close().get();

    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ASSERT_TRUE(fut.get()->IsError());
    EXPECT_THROW(client->Start().get(), std::runtime_error);
    server->Close().get();
}
