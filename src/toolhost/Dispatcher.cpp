//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: Validates and executes one tool invocation, normalizing the outcome into InvocationResult
//==========================================================================================================

#include <chrono>
#include <exception>

#include "logging/Logger.h"
#include "toolhost/Dispatcher.h"
#include "toolhost/MetricsCollector.h"
#include "toolhost/ToolRegistry.h"
#include "toolhost/validation/SchemaValidator.h"

namespace toolhost {

using errors::ErrorKind;

Dispatcher::Dispatcher(const ToolRegistry& registry, MetricsCollector* metrics)
    : registry_(registry), metrics_(metrics) {}

InvocationResult Dispatcher::Invoke(const std::string& name, const JSONValue& arguments, std::stop_token stopToken,
                                    const std::function<bool()>& claim) const {
    FUNC_SCOPE();
    const auto started = std::chrono::steady_clock::now();
    InvocationResult result = execute(name, arguments, stopToken);
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    if (claim && !claim()) {
        result = InvocationResult::failure(ErrorKind::ExecutionError, "invocation abandoned");
    }

    if (const auto* failure = result.asFailure()) {
        LOG_WARN("Tool '{}' failed ({}): {}", name, errors::toString(failure->kind), failure->message);
    } else {
        LOG_DEBUG("Tool '{}' completed in {:.3f}s", name, elapsed.count());
    }
    if (metrics_ != nullptr) {
        // Names the registry does not know share one bucket so client input cannot grow the table.
        const auto* failure = result.asFailure();
        const bool unknown = failure != nullptr && failure->kind == ErrorKind::UnknownTool;
        metrics_->Record(result.ok(), elapsed, unknown ? std::string(MetricsCollector::kUnknownToolBucket) : name);
    }
    return result;
}

InvocationResult Dispatcher::execute(const std::string& name, const JSONValue& arguments, std::stop_token stopToken) const {
    const RegisteredTool* tool = registry_.Resolve(name);
    if (tool == nullptr) {
        return InvocationResult::failure(ErrorKind::UnknownTool, "Unknown tool: " + name);
    }

    if (auto problem = validation::validateArguments(tool->spec.inputSchema, arguments)) {
        return InvocationResult::failure(ErrorKind::ValidationError, *problem);
    }
    const JSONValue effective = validation::applyDefaults(tool->spec.inputSchema, arguments);

    ToolOutput output;
    try {
        output = tool->handler(effective, stopToken);
    } catch (const errors::ToolError& e) {
        return InvocationResult::failure(e.kind(), e.what());
    } catch (const std::exception& e) {
        return InvocationResult::failure(ErrorKind::ExecutionError, e.what());
    } catch (...) {
        return InvocationResult::failure(ErrorKind::ExecutionError, "Tool '" + name + "' threw a non-standard exception");
    }

    if (stopToken.stop_requested()) {
        return InvocationResult::failure(ErrorKind::ExecutionError, "invocation abandoned");
    }
    if (output.empty()) {
        output.push_back(makeText("no content"));
    }
    return InvocationResult::success(std::move(output));
}

} // namespace toolhost
