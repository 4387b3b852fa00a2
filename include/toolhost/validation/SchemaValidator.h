//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.h
// Purpose: Structural validation of tool arguments against a JSON-Schema-like input schema
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace validation {

//------------------------------ Schema shape checks ------------------------------
// Checks that a schema is usable for registration: an object schema whose "required" entries
// all name declared properties.
//
// Args:
//   schema: Input schema of a tool.
//
// Returns:
//   std::nullopt when well-formed; otherwise a description of the problem.
std::optional<std::string> checkSchemaShape(const JSONValue& schema);

//------------------------------ Argument validation ------------------------------
// Validates arguments against a schema. Supported per-property keywords: type (string, integer,
// number, boolean, object, array, null), enum, minimum, maximum, minLength, maxLength.
// Object-level keywords: required, additionalProperties (false rejects undeclared fields).
//
// Args:
//   schema: Input schema of a tool.
//   arguments: Caller supplied arguments.
//
// Returns:
//   std::nullopt when valid; otherwise a message naming the offending field.
std::optional<std::string> validateArguments(const JSONValue& schema, const JSONValue& arguments);

// Returns a copy of arguments with declared defaults filled in for absent optional properties.
JSONValue applyDefaults(const JSONValue& schema, const JSONValue& arguments);

} // namespace validation
} // namespace toolhost
