//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Tool failure taxonomy, handler exceptions and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace errors {

// Closed set of invocation failure kinds.
enum class ErrorKind {
    UnknownTool,
    ValidationError,
    ExecutionError,
    RequestTooLarge,
    AccessDenied
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownTool: return "UnknownTool";
        case ErrorKind::ValidationError: return "ValidationError";
        case ErrorKind::ExecutionError: return "ExecutionError";
        case ErrorKind::RequestTooLarge: return "RequestTooLarge";
        case ErrorKind::AccessDenied: return "AccessDenied";
    }
    return "ExecutionError";
}

inline std::optional<ErrorKind> parseErrorKind(const std::string& s) {
    if (s == "UnknownTool") return ErrorKind::UnknownTool;
    if (s == "ValidationError") return ErrorKind::ValidationError;
    if (s == "ExecutionError") return ErrorKind::ExecutionError;
    if (s == "RequestTooLarge") return ErrorKind::RequestTooLarge;
    if (s == "AccessDenied") return ErrorKind::AccessDenied;
    return std::nullopt;
}

// Map a failure kind to the JSON-RPC error code written on the wire.
//
// Args:
//   kind: Failure kind.
//
// Returns:
//   JSON-RPC error code.
inline int codeForKind(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownTool: return JSONRPCErrorCodes::ToolNotFound;
        case ErrorKind::ValidationError: return JSONRPCErrorCodes::InvalidParams;
        case ErrorKind::ExecutionError: return JSONRPCErrorCodes::ToolExecutionFailed;
        case ErrorKind::RequestTooLarge: return JSONRPCErrorCodes::RequestTooLarge;
        case ErrorKind::AccessDenied: return JSONRPCErrorCodes::AccessDenied;
    }
    return JSONRPCErrorCodes::ToolExecutionFailed;
}

//==========================================================================================================
// ToolError
// Purpose: Exception a tool handler throws to fail with a specific kind (e.g. AccessDenied). Any other
//          exception escaping a handler is reported as ExecutionError.
//==========================================================================================================
class ToolError : public std::runtime_error {
public:
    ToolError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

//==========================================================================================================
// DuplicateNameError
// Purpose: Thrown by ToolRegistry::Register when a tool name is already taken.
//==========================================================================================================
class DuplicateNameError : public std::logic_error {
public:
    explicit DuplicateNameError(const std::string& name)
        : std::logic_error("Tool already registered: " + name), name_(name) {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

// Typed JSON-RPC error representation.
struct Error {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    std::optional<ErrorKind> kind;
};

// Build the wire error for an invocation failure; data carries { kind }.
//
// Args:
//   kind: Failure kind.
//   message: Human-readable description.
//
// Returns:
//   Error with code mapped from kind.
inline Error makeToolFailure(ErrorKind kind, const std::string& message) {
    JSONValue::Object data;
    setField(data, "kind", JSONValue(toString(kind)));
    Error e;
    e.code = codeForKind(kind);
    e.message = message;
    e.data = JSONValue(std::move(data));
    e.kind = kind;
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to Error.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<Error> populated when shape is valid; kind is read from data.kind when present.
inline std::optional<Error> errorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = errVal.find("code");
    const JSONValue* message = errVal.find("message");
    if (code == nullptr || message == nullptr) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(code->value) || !message->isString()) {
        return std::nullopt;
    }
    Error e;
    e.code = static_cast<int>(std::get<int64_t>(code->value));
    e.message = std::get<std::string>(message->value);
    if (const JSONValue* data = errVal.find("data")) {
        e.data = *data;
        e.kind = parseErrorKind(getStringOr(*data, "kind", ""));
    }
    return e;
}

// Extract Error from a JSONRPCResponse if it carries an error.
//
// Args:
//   response: JSONRPCResponse that may contain an error object.
//
// Returns:
//   std::optional<Error> when response.IsError() and shape is valid.
inline std::optional<Error> errorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return errorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed Error.
inline JSONValue makeErrorValue(const Error& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from Error and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const Error& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace toolhost
