//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaBuilder.h
// Purpose: Fluent construction of object input schemas for tool specs
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace tools {

//==========================================================================================================
// SchemaBuilder
// Purpose: Builds { type: "object", properties, required?, additionalProperties? }. Keyword setters
//          (withEnum, withDefault, ...) apply to the most recently added property.
// Example:
//   SchemaBuilder().property("message", "string", "Message to echo back").required({"message"}).build();
//==========================================================================================================
class SchemaBuilder {
public:
    SchemaBuilder& property(const std::string& name, const std::string& type, const std::string& description) {
        JSONValue::Object prop;
        setField(prop, "type", JSONValue(type));
        if (!description.empty()) {
            setField(prop, "description", JSONValue(description));
        }
        props_.emplace_back(name, std::move(prop));
        return *this;
    }

    SchemaBuilder& withEnum(const std::vector<std::string>& values) {
        JSONValue::Array arr;
        for (const auto& v : values) {
            arr.push_back(std::make_shared<JSONValue>(v));
        }
        return set("enum", JSONValue(std::move(arr)));
    }

    SchemaBuilder& withDefault(JSONValue value) { return set("default", std::move(value)); }
    SchemaBuilder& withMinLength(int64_t n) { return set("minLength", JSONValue(n)); }
    SchemaBuilder& withMaxLength(int64_t n) { return set("maxLength", JSONValue(n)); }
    SchemaBuilder& withMinimum(double v) { return set("minimum", JSONValue(v)); }
    SchemaBuilder& withMaximum(double v) { return set("maximum", JSONValue(v)); }

    SchemaBuilder& required(const std::vector<std::string>& names) {
        required_.insert(required_.end(), names.begin(), names.end());
        return *this;
    }

    SchemaBuilder& noAdditionalProperties() {
        closed_ = true;
        return *this;
    }

    JSONValue build() const {
        JSONValue::Object properties;
        for (const auto& [name, prop] : props_) {
            setField(properties, name, JSONValue(prop));
        }
        JSONValue::Object schema;
        setField(schema, "type", JSONValue("object"));
        setField(schema, "properties", JSONValue(std::move(properties)));
        if (!required_.empty()) {
            JSONValue::Array req;
            for (const auto& r : required_) {
                req.push_back(std::make_shared<JSONValue>(r));
            }
            setField(schema, "required", JSONValue(std::move(req)));
        }
        if (closed_) {
            setField(schema, "additionalProperties", JSONValue(false));
        }
        return JSONValue(std::move(schema));
    }

private:
    SchemaBuilder& set(const std::string& key, JSONValue value) {
        if (!props_.empty()) {
            setField(props_.back().second, key, std::move(value));
        }
        return *this;
    }

    std::vector<std::pair<std::string, JSONValue::Object>> props_;
    std::vector<std::string> required_;
    bool closed_{false};
};

} // namespace tools
} // namespace toolhost
