//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_registry.cpp
// Purpose: ToolRegistry registration, lookup and freeze semantics
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "toolhost/ToolRegistry.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/tools/SchemaBuilder.h"

using namespace toolhost;

namespace {

ToolSpec simpleSpec(const std::string& name) {
    return ToolSpec{name, "Test tool " + name,
                    tools::SchemaBuilder().property("message", "string", "").required({"message"}).build()};
}

ToolHandler constantHandler(const std::string& text) {
    return [text](const JSONValue&, std::stop_token) -> ToolOutput { return {makeText(text)}; };
}

} // namespace

TEST(ToolRegistry, ListsSpecsInRegistrationOrder) {
    ToolRegistry registry;
    for (const char* name : {"zeta", "alpha", "mid"}) {
        registry.Register(simpleSpec(name), constantHandler(name));
    }
    auto specs = registry.GetAllSpecs();
    ASSERT_EQ(specs.size(), 3u);
    EXPECT_EQ(specs[0].name, "zeta");
    EXPECT_EQ(specs[1].name, "alpha");
    EXPECT_EQ(specs[2].name, "mid");
    EXPECT_EQ(registry.Size(), 3u);
}

TEST(ToolRegistry, ResolveReturnsBoundHandler) {
    ToolRegistry registry;
    registry.Register(simpleSpec("echo"), constantHandler("from echo"));

    const RegisteredTool* tool = registry.Resolve("echo");
    ASSERT_NE(tool, nullptr);
    EXPECT_EQ(tool->spec.description, "Test tool echo");
    ToolOutput out = tool->handler(JSONValue(JSONValue::Object{}), std::stop_token{});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(*getText(out[0]), "from echo");

    EXPECT_EQ(registry.Resolve("Echo"), nullptr);
    EXPECT_EQ(registry.Resolve(""), nullptr);
}

TEST(ToolRegistry, DuplicateNameRejectedAndOriginalKept) {
    ToolRegistry registry;
    registry.Register(simpleSpec("echo"), constantHandler("first"));
    EXPECT_THROW(registry.Register(simpleSpec("echo"), constantHandler("second")), errors::DuplicateNameError);
    EXPECT_EQ(registry.Size(), 1u);
    ToolOutput out = registry.Resolve("echo")->handler(JSONValue(JSONValue::Object{}), std::stop_token{});
    EXPECT_EQ(*getText(out[0]), "first");
}

TEST(ToolRegistry, MalformedRegistrationsRejected) {
    ToolRegistry registry;
    EXPECT_THROW(registry.Register(simpleSpec(""), constantHandler("x")), std::invalid_argument);
    EXPECT_THROW(registry.Register(simpleSpec("nohandler"), ToolHandler{}), std::invalid_argument);

    ToolSpec badRequired{"bad", "required names an undeclared property",
                         parseJSONValue(R"({"type":"object","properties":{},"required":["ghost"]})")};
    EXPECT_THROW(registry.Register(badRequired, constantHandler("x")), std::invalid_argument);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(ToolRegistry, FrozenRegistryRefusesRegistration) {
    ToolRegistry registry;
    registry.Register(simpleSpec("echo"), constantHandler("x"));
    EXPECT_FALSE(registry.IsFrozen());
    registry.Freeze();
    EXPECT_TRUE(registry.IsFrozen());
    EXPECT_THROW(registry.Register(simpleSpec("late"), constantHandler("x")), std::logic_error);
    EXPECT_NE(registry.Resolve("echo"), nullptr);
}

TEST(ToolRegistry, ConcurrentLookupsAfterFreeze) {
    ToolRegistry registry;
    for (int i = 0; i < 50; ++i) {
        registry.Register(simpleSpec("tool" + std::to_string(i)), constantHandler("x"));
    }
    registry.Freeze();

    std::atomic<int> misses{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&registry, &misses]() {
            for (int i = 0; i < 1000; ++i) {
                if (registry.Resolve("tool" + std::to_string(i % 50)) == nullptr) {
                    ++misses;
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(misses.load(), 0);
}
