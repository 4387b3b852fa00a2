//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Classification of raw JSON-RPC messages for transports
//========================================================================================================

#pragma once

#include <memory>
#include <string>

namespace toolhost {

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a JSON-RPC message by its top-level members without invoking handlers.
    // Request: method + id. Notification: method, no id. Response: id + result|error.
    virtual MessageKind classify(const std::string& json) = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

const char* toString(IJsonRpcMessageRouter::MessageKind kind);

} // namespace toolhost
