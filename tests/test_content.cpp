//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content.cpp
// Purpose: Wire mapping of tool result content items
//==========================================================================================================

#include <gtest/gtest.h>

#include "toolhost/Content.h"

using namespace toolhost;

TEST(Content, TextItemShape) {
    JSONValue v = toJSON(makeText("hello"));
    EXPECT_EQ(getStringOr(v, "type", ""), "text");
    EXPECT_EQ(getStringOr(v, "text", ""), "hello");
}

TEST(Content, BlobIsBase64OnTheWire) {
    const std::string raw("\x00\x01\xFFhi", 5);
    JSONValue v = toJSON(makeBlob(raw, "application/x-test"));
    EXPECT_EQ(getStringOr(v, "type", ""), "blob");
    EXPECT_EQ(getStringOr(v, "data", ""), "AAH/aGk=");
    EXPECT_EQ(getStringOr(v, "mimeType", ""), "application/x-test");

    auto back = contentFromJSON(v);
    ASSERT_TRUE(back.has_value());
    const auto* blob = std::get_if<BlobContent>(&back.value());
    ASSERT_NE(blob, nullptr);
    EXPECT_EQ(blob->data, raw);
}

TEST(Content, InvalidBase64IsRejected) {
    EXPECT_FALSE(contentFromJSON(parseJSONValue(R"({"type":"blob","data":"@@@@"})")).has_value());
}

TEST(Content, ResourceReferenceOptionalFields) {
    JSONValue v = toJSON(makeResourceRef("file:///tmp/a.txt", std::string("text/plain")));
    const JSONValue* res = v.find("resource");
    ASSERT_NE(res, nullptr);
    EXPECT_EQ(getStringOr(*res, "uri", ""), "file:///tmp/a.txt");
    EXPECT_EQ(getStringOr(*res, "mimeType", ""), "text/plain");
    EXPECT_EQ(res->find("text"), nullptr);
}

TEST(Content, UnknownTypeIsRejected) {
    EXPECT_FALSE(contentFromJSON(parseJSONValue(R"({"type":"image","data":""})")).has_value());
    EXPECT_FALSE(contentFromJSON(parseJSONValue(R"({"type":"text"})")).has_value());
}

TEST(Content, CollectTextSkipsNonText) {
    std::vector<ContentItem> items{makeText("a"), makeBlob("x", "application/octet-stream"), makeText("b")};
    EXPECT_EQ(collectText(items), (std::vector<std::string>{"a", "b"}));
}
