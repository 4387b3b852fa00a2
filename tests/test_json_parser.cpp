//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_parser.cpp
// Purpose: JSON value parsing/serialization and JSON-RPC message (de)serialization tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>

#include "toolhost/JSONRPCTypes.h"

using namespace toolhost;

TEST(JSONParser, ParsesScalarsWithIntegerDoubleDistinction) {
    EXPECT_TRUE(std::holds_alternative<int64_t>(parseJSONValue("42").value));
    EXPECT_TRUE(std::holds_alternative<double>(parseJSONValue("4.5").value));
    EXPECT_TRUE(std::holds_alternative<double>(parseJSONValue("1e3").value));
    EXPECT_TRUE(std::holds_alternative<bool>(parseJSONValue("true").value));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(parseJSONValue("null").value));
    EXPECT_EQ(std::get<int64_t>(parseJSONValue("-7").value), -7);
}

TEST(JSONParser, IntegerOverflowDegradesToDouble) {
    JSONValue v = parseJSONValue("123456789012345678901234567890");
    EXPECT_TRUE(std::holds_alternative<double>(v.value));
}

TEST(JSONParser, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = parseJSONValue("\"a\\n\\\"b\\u00e9\\ud83d\\ude00\"");
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(std::get<std::string>(v.value), "a\n\"b\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(JSONParser, NestedObjectLookup) {
    JSONValue v = parseJSONValue(R"({"outer":{"inner":[1,2,{"k":"v"}]}})");
    const JSONValue* outer = v.find("outer");
    ASSERT_NE(outer, nullptr);
    const JSONValue* inner = outer->find("inner");
    ASSERT_NE(inner, nullptr);
    ASSERT_TRUE(inner->isArray());
    const auto& arr = std::get<JSONValue::Array>(inner->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_EQ(getStringOr(*arr[2], "k", ""), "v");
    EXPECT_EQ(v.find("missing"), nullptr);
}

TEST(JSONParser, RejectsMalformedInput) {
    EXPECT_THROW(parseJSONValue("{"), std::runtime_error);
    EXPECT_THROW(parseJSONValue("{\"a\":1,}"), std::runtime_error);
    EXPECT_THROW(parseJSONValue("[1 2]"), std::runtime_error);
    EXPECT_THROW(parseJSONValue("{} trailing"), std::runtime_error);
    EXPECT_THROW(parseJSONValue(""), std::runtime_error);
    EXPECT_THROW(parseJSONValue(std::string(200, '[') + std::string(200, ']')), std::runtime_error);
}

TEST(JSONParser, CompactSerializationEscapesControlCharacters) {
    JSONValue::Object obj;
    setField(obj, "s", JSONValue("line\nbreak\x01"));
    EXPECT_EQ(serializeJSONValue(JSONValue(obj)), "{\"s\":\"line\\nbreak\\u0001\"}");
}

TEST(JSONParser, PrettySerializationSortsKeys) {
    JSONValue::Object obj;
    setField(obj, "zeta", JSONValue(static_cast<int64_t>(1)));
    setField(obj, "alpha", JSONValue(true));
    const std::string out = serializeJSONValuePretty(JSONValue(obj));
    EXPECT_EQ(out, "{\n  \"alpha\": true,\n  \"zeta\": 1\n}");
}

TEST(JSONParser, NonFiniteDoublesSerializeAsNull) {
    EXPECT_EQ(serializeJSONValue(JSONValue(std::numeric_limits<double>::infinity())), "null");
}

TEST(JSONParser, ObjectHelpersFallBackOnTypeMismatch) {
    JSONValue v = parseJSONValue(R"({"s":"x","b":true,"n":3,"d":2.5})");
    EXPECT_EQ(getStringOr(v, "n", "fallback"), "fallback");
    EXPECT_TRUE(getBoolOr(v, "b", false));
    EXPECT_FALSE(getBoolOr(v, "s", false));
    EXPECT_DOUBLE_EQ(getNumber(v, "n").value(), 3.0);
    EXPECT_DOUBLE_EQ(getNumber(v, "d").value(), 2.5);
    EXPECT_FALSE(getNumber(v, "s").has_value());
}

TEST(JSONRPCMessages, RequestRoundTripKeepsIdType) {
    JSONRPCRequest req(static_cast<int64_t>(5), "tools/call", parseJSONValue(R"({"name":"echo"})"));
    JSONRPCRequest parsed;
    ASSERT_TRUE(parsed.Deserialize(req.Serialize()));
    ASSERT_TRUE(std::holds_alternative<int64_t>(parsed.id));
    EXPECT_EQ(std::get<int64_t>(parsed.id), 5);
    EXPECT_EQ(parsed.method, "tools/call");
    ASSERT_TRUE(parsed.params.has_value());
    EXPECT_EQ(getStringOr(*parsed.params, "name", ""), "echo");
}

TEST(JSONRPCMessages, RequestWithoutMethodFailsToDeserialize) {
    JSONRPCRequest parsed;
    EXPECT_FALSE(parsed.Deserialize(R"({"jsonrpc":"2.0","id":1})"));
    EXPECT_FALSE(parsed.Deserialize("not json"));
}

TEST(JSONRPCMessages, ErrorResponseShape) {
    auto resp = CreateErrorResponse(std::string("abc"), JSONRPCErrorCodes::MethodNotFound, "Method not found");
    JSONValue doc = parseJSONValue(resp->Serialize());
    EXPECT_EQ(getStringOr(doc, "jsonrpc", ""), "2.0");
    EXPECT_EQ(getStringOr(doc, "id", ""), "abc");
    const JSONValue* err = doc.find("error");
    ASSERT_NE(err, nullptr);
    EXPECT_DOUBLE_EQ(getNumber(*err, "code").value(), -32601.0);
    EXPECT_EQ(doc.find("result"), nullptr);
}

TEST(JSONRPCMessages, IdToStringForms) {
    EXPECT_EQ(idToString(JSONRPCId(std::string("x"))), "x");
    EXPECT_EQ(idToString(JSONRPCId(static_cast<int64_t>(9))), "9");
    EXPECT_EQ(idToString(JSONRPCId(nullptr)), "null");
}
