//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Tool-invocation protocol data structures and constants
//==========================================================================================================

#pragma once

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Content.h"
#include "toolhost/errors/Errors.h"
#include <string>
#include <variant>
#include <vector>

namespace toolhost {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Method names
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Server identity reported by initialize
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
//==========================================================================================================
// ToolSpec
// Purpose: Immutable description of a callable tool.
// Fields:
//   name: Unique key within a registry.
//   description: Human-readable summary shown to callers.
//   inputSchema: JSON-Schema-like object { type, properties, required?, additionalProperties? }.
//==========================================================================================================
struct ToolSpec {
    std::string name;
    std::string description;
    JSONValue inputSchema;

    ToolSpec() = default;
    ToolSpec(std::string name, std::string description, JSONValue inputSchema)
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}
};

// Ordered content items produced by a tool handler.
using ToolOutput = std::vector<ContentItem>;

///////////////////////////////////////// Invocation results ///////////////////////////////////////////
struct InvocationSuccess {
    ToolOutput content;
};

struct InvocationFailure {
    errors::ErrorKind kind;
    std::string message;
};

//==========================================================================================================
// InvocationResult
// Purpose: Outcome of one tool call: Success{content} or Failure{kind, message}.
//==========================================================================================================
struct InvocationResult {
    std::variant<InvocationSuccess, InvocationFailure> outcome;

    static InvocationResult success(ToolOutput content) {
        return InvocationResult{InvocationSuccess{std::move(content)}};
    }
    static InvocationResult failure(errors::ErrorKind kind, std::string message) {
        return InvocationResult{InvocationFailure{kind, std::move(message)}};
    }

    bool ok() const { return std::holds_alternative<InvocationSuccess>(outcome); }
    const InvocationSuccess* asSuccess() const { return std::get_if<InvocationSuccess>(&outcome); }
    const InvocationFailure* asFailure() const { return std::get_if<InvocationFailure>(&outcome); }
};

///////////////////////////////////////// Session state ///////////////////////////////////////////
enum class ServerState {
    Starting,
    Serving,
    Draining,
    Stopped
};

inline const char* toString(ServerState state) {
    switch (state) {
        case ServerState::Starting: return "Starting";
        case ServerState::Serving: return "Serving";
        case ServerState::Draining: return "Draining";
        case ServerState::Stopped: return "Stopped";
    }
    return "Unknown";
}

} // namespace toolhost
