//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.cpp
// Purpose: Structural validation of tool arguments against a JSON-Schema-like input schema
//==========================================================================================================

#include <cmath>
#include <unordered_set>

#include <fmt/core.h>

#include "toolhost/validation/SchemaValidator.h"

namespace toolhost {
namespace validation {

namespace {

const JSONValue::Object* asObject(const JSONValue* v) {
    if (v == nullptr) return nullptr;
    return std::get_if<JSONValue::Object>(&v->value);
}

const JSONValue::Array* asArray(const JSONValue* v) {
    if (v == nullptr) return nullptr;
    return std::get_if<JSONValue::Array>(&v->value);
}

const char* typeName(const JSONValue& v) {
    switch (v.value.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "number";
        case 4: return "string";
        case 5: return "array";
        case 6: return "object";
    }
    return "unknown";
}

bool matchesType(const JSONValue& v, const std::string& type) {
    if (type == "string") return v.isString();
    if (type == "number") return v.isNumber();
    if (type == "integer") {
        if (std::holds_alternative<int64_t>(v.value)) return true;
        if (const auto* d = std::get_if<double>(&v.value)) {
            return std::isfinite(*d) && std::floor(*d) == *d;
        }
        return false;
    }
    if (type == "boolean") return std::holds_alternative<bool>(v.value);
    if (type == "object") return v.isObject();
    if (type == "array") return v.isArray();
    if (type == "null") return std::holds_alternative<std::nullptr_t>(v.value);
    // Unknown type keywords do not constrain.
    return true;
}

double toDouble(const JSONValue& v) {
    if (const auto* i = std::get_if<int64_t>(&v.value)) return static_cast<double>(*i);
    return std::get<double>(v.value);
}

bool jsonEquals(const JSONValue& a, const JSONValue& b) {
    if (a.isNumber() && b.isNumber()) {
        return toDouble(a) == toDouble(b);
    }
    return serializeJSONValue(a) == serializeJSONValue(b);
}

// Number of Unicode code points in a UTF-8 string.
std::size_t utf8Length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::optional<std::string> checkProperty(const std::string& field, const JSONValue& propSchema, const JSONValue& value) {
    if (const JSONValue* type = propSchema.find("type")) {
        if (type->isString()) {
            const auto& t = std::get<std::string>(type->value);
            if (!matchesType(value, t)) {
                return fmt::format("Invalid type for field '{}': expected {}, got {}", field, t, typeName(value));
            }
        } else if (const auto* alternatives = asArray(type)) {
            bool any = false;
            for (const auto& alt : *alternatives) {
                if (alt && alt->isString() && matchesType(value, std::get<std::string>(alt->value))) {
                    any = true;
                    break;
                }
            }
            if (!any) {
                return fmt::format("Invalid type for field '{}': got {}", field, typeName(value));
            }
        }
    }

    if (const auto* options = asArray(propSchema.find("enum"))) {
        bool found = false;
        for (const auto& opt : *options) {
            if (opt && jsonEquals(*opt, value)) {
                found = true;
                break;
            }
        }
        if (!found) {
            std::string allowed;
            for (const auto& opt : *options) {
                if (!opt) continue;
                if (!allowed.empty()) allowed += ", ";
                allowed += serializeJSONValue(*opt);
            }
            return fmt::format("Invalid value for field '{}': must be one of [{}]", field, allowed);
        }
    }

    if (value.isNumber()) {
        const double n = toDouble(value);
        if (auto min = getNumber(propSchema, "minimum"); min && n < *min) {
            return fmt::format("Field '{}' is below minimum {}", field, *min);
        }
        if (auto max = getNumber(propSchema, "maximum"); max && n > *max) {
            return fmt::format("Field '{}' exceeds maximum {}", field, *max);
        }
    }

    if (value.isString()) {
        const std::size_t len = utf8Length(std::get<std::string>(value.value));
        if (auto minLen = getNumber(propSchema, "minLength"); minLen && static_cast<double>(len) < *minLen) {
            return fmt::format("Field '{}' is shorter than minLength {}", field, static_cast<int64_t>(*minLen));
        }
        if (auto maxLen = getNumber(propSchema, "maxLength"); maxLen && static_cast<double>(len) > *maxLen) {
            return fmt::format("Field '{}' exceeds maxLength {}", field, static_cast<int64_t>(*maxLen));
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> checkSchemaShape(const JSONValue& schema) {
    if (!schema.isObject()) {
        return std::string("input schema must be an object");
    }
    const auto* props = asObject(schema.find("properties"));
    if (schema.find("properties") != nullptr && props == nullptr) {
        return std::string("'properties' must be an object");
    }
    if (const JSONValue* req = schema.find("required")) {
        const auto* names = asArray(req);
        if (names == nullptr) {
            return std::string("'required' must be an array");
        }
        for (const auto& n : *names) {
            if (!n || !n->isString()) {
                return std::string("'required' entries must be strings");
            }
            const auto& name = std::get<std::string>(n->value);
            if (props == nullptr || props->find(name) == props->end()) {
                return fmt::format("required field '{}' is not declared in properties", name);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> validateArguments(const JSONValue& schema, const JSONValue& arguments) {
    if (!arguments.isObject()) {
        return fmt::format("Arguments must be an object, got {}", typeName(arguments));
    }
    const auto& args = std::get<JSONValue::Object>(arguments.value);
    const auto* props = asObject(schema.find("properties"));

    if (const auto* req = asArray(schema.find("required"))) {
        for (const auto& n : *req) {
            if (!n || !n->isString()) continue;
            const auto& name = std::get<std::string>(n->value);
            if (args.find(name) == args.end()) {
                return fmt::format("Missing required field: {}", name);
            }
        }
    }

    bool additionalAllowed = true;
    if (const JSONValue* ap = schema.find("additionalProperties")) {
        if (const auto* b = std::get_if<bool>(&ap->value)) {
            additionalAllowed = *b;
        }
    }

    for (const auto& [name, value] : args) {
        const JSONValue* propSchema = nullptr;
        if (props != nullptr) {
            auto it = props->find(name);
            if (it != props->end() && it->second) {
                propSchema = it->second.get();
            }
        }
        if (propSchema == nullptr) {
            if (!additionalAllowed) {
                return fmt::format("Unexpected field: {}", name);
            }
            continue;
        }
        if (!value) continue;
        if (auto err = checkProperty(name, *propSchema, *value)) {
            return err;
        }
    }
    return std::nullopt;
}

JSONValue applyDefaults(const JSONValue& schema, const JSONValue& arguments) {
    if (!arguments.isObject()) {
        return arguments;
    }
    JSONValue::Object out = std::get<JSONValue::Object>(arguments.value);
    if (const auto* props = asObject(schema.find("properties"))) {
        for (const auto& [name, propSchema] : *props) {
            if (!propSchema || out.find(name) != out.end()) continue;
            if (const JSONValue* def = propSchema->find("default")) {
                out[name] = std::make_shared<JSONValue>(*def);
            }
        }
    }
    return JSONValue(std::move(out));
}

} // namespace validation
} // namespace toolhost
