//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Name-keyed storage of tool specifications and their bound handlers
//==========================================================================================================

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "toolhost/Protocol.h"

namespace toolhost {

// Tool handler: receives validated arguments (defaults applied) and a stop token that fires when the
// invocation is abandoned. Returns content items, or throws (errors::ToolError for a specific kind).
using ToolHandler = std::function<ToolOutput(const JSONValue&, std::stop_token)>;

struct RegisteredTool {
    ToolSpec spec;
    ToolHandler handler;
};

//==========================================================================================================
// ToolRegistry
// Purpose: Holds the tools a session exposes. Populated before serving and frozen when a session starts;
//          after Freeze() lookups are lock-free and the contents never change.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry();
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    //==========================================================================================================
    // Registers a tool.
    // Args:
    //   spec: Tool description. "required" may only name declared properties.
    //   handler: Callable bound to the tool.
    // Returns:
    //   (none)
    // Throws:
    //   errors::DuplicateNameError when the name is taken; std::invalid_argument for a malformed schema
    //   or empty handler; std::logic_error once the registry is frozen.
    //==========================================================================================================
    void Register(ToolSpec spec, ToolHandler handler);

    //==========================================================================================================
    // Returns all specs in registration order.
    //==========================================================================================================
    std::vector<ToolSpec> GetAllSpecs() const;

    //==========================================================================================================
    // Looks up a tool by name.
    // Args:
    //   name: Tool name.
    // Returns:
    //   Pointer to the registered entry (valid for the registry's lifetime), or nullptr when absent.
    //==========================================================================================================
    const RegisteredTool* Resolve(const std::string& name) const;

    void Freeze();
    bool IsFrozen() const;
    size_t Size() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
