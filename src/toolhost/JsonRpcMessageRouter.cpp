//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default JSON-RPC message classifier
//========================================================================================================

#include <string>

#include "logging/Logger.h"
#include "toolhost/JsonRpcMessageRouter.h"
#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

namespace {
class DefaultJsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const std::string& json) override {
        JSONValue doc;
        try {
            doc = parseJSONValue(json);
        } catch (const std::exception& e) {
            LOG_WARN("Unparseable JSON-RPC message: {}", e.what());
            return MessageKind::Unknown;
        }
        if (!doc.isObject()) {
            return MessageKind::Unknown;
        }
        const JSONValue* method = doc.find("method");
        const bool hasId = doc.find("id") != nullptr;
        if (method != nullptr && method->isString()) {
            return hasId ? MessageKind::Request : MessageKind::Notification;
        }
        if (hasId && (doc.find("result") != nullptr || doc.find("error") != nullptr)) {
            return MessageKind::Response;
        }
        return MessageKind::Unknown;
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<DefaultJsonRpcMessageRouter>();
}

const char* toString(IJsonRpcMessageRouter::MessageKind kind) {
    switch (kind) {
        case IJsonRpcMessageRouter::MessageKind::Request: return "request";
        case IJsonRpcMessageRouter::MessageKind::Response: return "response";
        case IJsonRpcMessageRouter::MessageKind::Notification: return "notification";
        case IJsonRpcMessageRouter::MessageKind::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace toolhost
