//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.h
// Purpose: Content items carried in tool results (text, binary blob, resource reference)
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

struct TextContent {
    std::string text;
};

// Raw bytes; base64-encoded on the wire.
struct BlobContent {
    std::string data;
    std::string mimeType{"application/octet-stream"};
};

struct ResourceContent {
    std::string uri;
    std::optional<std::string> mimeType;
    std::optional<std::string> text;
};

using ContentItem = std::variant<TextContent, BlobContent, ResourceContent>;

//------------------------------ Builders ------------------------------
inline ContentItem makeText(std::string text) {
    return TextContent{std::move(text)};
}

inline ContentItem makeBlob(std::string data, std::string mimeType) {
    return BlobContent{std::move(data), std::move(mimeType)};
}

inline ContentItem makeResourceRef(std::string uri, std::optional<std::string> mimeType = std::nullopt,
                                   std::optional<std::string> text = std::nullopt) {
    return ResourceContent{std::move(uri), std::move(mimeType), std::move(text)};
}

//------------------------------ Wire mapping ------------------------------
// { "type": "text", "text" } | { "type": "blob", "data", "mimeType" } | { "type": "resource", "resource": {...} }
JSONValue toJSON(const ContentItem& item);

// Inverse of toJSON; std::nullopt for unknown types or malformed objects.
std::optional<ContentItem> contentFromJSON(const JSONValue& v);

//------------------------------ Inspectors ------------------------------
inline const std::string* getText(const ContentItem& item) {
    const auto* t = std::get_if<TextContent>(&item);
    return t ? &t->text : nullptr;
}

inline std::vector<std::string> collectText(const std::vector<ContentItem>& items) {
    std::vector<std::string> out;
    for (const auto& item : items) {
        if (const auto* t = getText(item)) {
            out.push_back(*t);
        }
    }
    return out;
}

} // namespace toolhost
