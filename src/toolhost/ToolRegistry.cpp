//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Name-keyed storage of tool specifications and their bound handlers
//==========================================================================================================

#include <deque>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

#include "logging/Logger.h"
#include "toolhost/ToolRegistry.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/validation/SchemaValidator.h"

namespace toolhost {

class ToolRegistry::Impl {
public:
    // deque keeps entry addresses stable across registrations
    std::deque<RegisteredTool> tools;
    std::unordered_map<std::string, const RegisteredTool*> byName;
    std::atomic<bool> frozen{false};
    mutable std::mutex registerMutex;
};

ToolRegistry::ToolRegistry() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }
ToolRegistry::~ToolRegistry() { FUNC_SCOPE(); }

void ToolRegistry::Register(ToolSpec spec, ToolHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->registerMutex);
    if (pImpl->frozen) {
        throw std::logic_error("ToolRegistry is frozen; cannot register '" + spec.name + "'");
    }
    if (spec.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool '" + spec.name + "' has no handler");
    }
    if (auto problem = validation::checkSchemaShape(spec.inputSchema)) {
        throw std::invalid_argument("Tool '" + spec.name + "': " + *problem);
    }
    if (pImpl->byName.find(spec.name) != pImpl->byName.end()) {
        throw errors::DuplicateNameError(spec.name);
    }
    LOG_DEBUG("Registering tool: {}", spec.name);
    pImpl->tools.push_back(RegisteredTool{std::move(spec), std::move(handler)});
    const RegisteredTool& entry = pImpl->tools.back();
    pImpl->byName.emplace(entry.spec.name, &entry);
}

std::vector<ToolSpec> ToolRegistry::GetAllSpecs() const {
    FUNC_SCOPE();
    std::vector<ToolSpec> specs;
    if (!pImpl->frozen) {
        std::lock_guard<std::mutex> lock(pImpl->registerMutex);
        for (const auto& t : pImpl->tools) specs.push_back(t.spec);
        return specs;
    }
    specs.reserve(pImpl->tools.size());
    for (const auto& t : pImpl->tools) specs.push_back(t.spec);
    return specs;
}

const RegisteredTool* ToolRegistry::Resolve(const std::string& name) const {
    FUNC_SCOPE();
    if (!pImpl->frozen) {
        std::lock_guard<std::mutex> lock(pImpl->registerMutex);
        auto it = pImpl->byName.find(name);
        return it == pImpl->byName.end() ? nullptr : it->second;
    }
    auto it = pImpl->byName.find(name);
    return it == pImpl->byName.end() ? nullptr : it->second;
}

void ToolRegistry::Freeze() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->registerMutex);
    if (!pImpl->frozen.exchange(true)) {
        LOG_DEBUG("ToolRegistry frozen with {} tools", pImpl->tools.size());
    }
}

bool ToolRegistry::IsFrozen() const { return pImpl->frozen; }

size_t ToolRegistry::Size() const {
    std::lock_guard<std::mutex> lock(pImpl->registerMutex);
    return pImpl->tools.size();
}

} // namespace toolhost
