//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: Validates and executes one tool invocation, normalizing the outcome into InvocationResult
//==========================================================================================================

#pragma once

#include <functional>
#include <stop_token>
#include <string>

#include "toolhost/Protocol.h"

namespace toolhost {

class ToolRegistry;
class MetricsCollector;

//==========================================================================================================
// Dispatcher
// Purpose: The per-call error isolation boundary. Never throws from Invoke; every outcome (including
//          unknown tool and validation failures) is reported to the MetricsCollector exactly once.
//==========================================================================================================
class Dispatcher {
public:
    // metrics may be null when metrics collection is disabled.
    Dispatcher(const ToolRegistry& registry, MetricsCollector* metrics);

    //==========================================================================================================
    // Runs one invocation.
    // Args:
    //   name: Tool name from the request.
    //   arguments: Caller supplied arguments; must be a JSON object.
    //   stopToken: Fires when the invocation is abandoned during draining.
    //   claim: Optional; called once the handler has returned and before metrics are recorded. Returning
    //          false means the caller already gave up on the call, which is then recorded as an
    //          abandoned failure.
    // Returns:
    //   Success{content} (a single "no content" text item when the handler returned nothing), or
    //   Failure{kind, message}.
    //==========================================================================================================
    InvocationResult Invoke(const std::string& name, const JSONValue& arguments, std::stop_token stopToken,
                            const std::function<bool()>& claim = {}) const;

private:
    InvocationResult execute(const std::string& name, const JSONValue& arguments, std::stop_token stopToken) const;

    const ToolRegistry& registry_;
    MetricsCollector* metrics_;
};

} // namespace toolhost
