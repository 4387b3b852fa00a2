//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_router.cpp
// Purpose: Tests for JsonRpcMessageRouter classification
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/JsonRpcMessageRouter.h"

using namespace toolhost;

using Kind = IJsonRpcMessageRouter::MessageKind;

TEST(Router, ClassifyBasic) {
    auto router = MakeDefaultJsonRpcMessageRouter();

    JSONRPCRequest req(std::string("id-1"), "ping");
    EXPECT_EQ(router->classify(req.Serialize()), Kind::Request);

    JSONRPCResponse resp(std::string("id-1"), JSONValue(static_cast<int64_t>(123)));
    EXPECT_EQ(router->classify(resp.Serialize()), Kind::Response);

    EXPECT_EQ(router->classify(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"), Kind::Notification);
}

TEST(Router, ClassifyInvalidJsonIsUnknown) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify("{"), Kind::Unknown);
    EXPECT_EQ(router->classify("[1,2,3]"), Kind::Unknown);
}

TEST(Router, ClassifyIdOnlyIsUnknown) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify(R"({"jsonrpc":"2.0","id":"x"})"), Kind::Unknown);
}

TEST(Router, ClassifyNullIdIsRequest) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify(R"({"jsonrpc":"2.0","method":"ping","id":null})"), Kind::Request);
}

TEST(Router, ClassifyNonStringMethodIsNotARequest) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify(R"({"jsonrpc":"2.0","method":7,"id":1})"), Kind::Unknown);
}

TEST(Router, ClassifyNestedMembersDoNotCount) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify(R"({"jsonrpc":"2.0","method":"ping","params":{"id":"x"}})"), Kind::Notification);
    EXPECT_NE(router->classify(R"({"jsonrpc":"2.0","method":"ping","params":{"result":{}}})"), Kind::Response);
}

TEST(Router, ClassifyErrorResponse) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    auto resp = CreateErrorResponse(static_cast<int64_t>(3), JSONRPCErrorCodes::InternalError, "boom");
    EXPECT_EQ(router->classify(resp->Serialize()), Kind::Response);
}

TEST(Router, KindNames) {
    EXPECT_STREQ(toString(Kind::Request), "request");
    EXPECT_STREQ(toString(Kind::Unknown), "unknown");
}
