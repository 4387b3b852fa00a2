//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.cpp
// Purpose: JSON mapping for content items; blobs use Beast's base64 codec
//==========================================================================================================

#include <algorithm>

#include <boost/beast/core/detail/base64.hpp>

#include "toolhost/Content.h"

namespace toolhost {

namespace {
namespace base64 = boost::beast::detail::base64;

std::string encodeBase64(const std::string& raw) {
    std::string out(base64::encoded_size(raw.size()), '\0');
    out.resize(base64::encode(out.data(), raw.data(), raw.size()));
    return out;
}

std::optional<std::string> decodeBase64(const std::string& encoded) {
    std::string out(base64::decoded_size(encoded.size()), '\0');
    auto [written, read] = base64::decode(out.data(), encoded.data(), encoded.size());
    const std::size_t padding = encoded.size() - std::min(encoded.size(), encoded.find_last_not_of('=') + 1);
    if (read + padding != encoded.size()) {
        return std::nullopt;
    }
    out.resize(written);
    return out;
}
} // namespace

JSONValue toJSON(const ContentItem& item) {
    JSONValue::Object obj;
    std::visit([&obj](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, TextContent>) {
            setField(obj, "type", JSONValue("text"));
            setField(obj, "text", JSONValue(c.text));
        } else if constexpr (std::is_same_v<T, BlobContent>) {
            setField(obj, "type", JSONValue("blob"));
            setField(obj, "data", JSONValue(encodeBase64(c.data)));
            setField(obj, "mimeType", JSONValue(c.mimeType));
        } else {
            JSONValue::Object res;
            setField(res, "uri", JSONValue(c.uri));
            if (c.mimeType.has_value()) {
                setField(res, "mimeType", JSONValue(c.mimeType.value()));
            }
            if (c.text.has_value()) {
                setField(res, "text", JSONValue(c.text.value()));
            }
            setField(obj, "type", JSONValue("resource"));
            setField(obj, "resource", JSONValue(std::move(res)));
        }
    }, item);
    return JSONValue(std::move(obj));
}

std::optional<ContentItem> contentFromJSON(const JSONValue& v) {
    const std::string type = getStringOr(v, "type", "");
    if (type == "text") {
        const JSONValue* text = v.find("text");
        if (text == nullptr || !text->isString()) {
            return std::nullopt;
        }
        return makeText(std::get<std::string>(text->value));
    }
    if (type == "blob") {
        auto raw = decodeBase64(getStringOr(v, "data", ""));
        if (!raw.has_value()) {
            return std::nullopt;
        }
        return makeBlob(std::move(raw.value()), getStringOr(v, "mimeType", "application/octet-stream"));
    }
    if (type == "resource") {
        const JSONValue* res = v.find("resource");
        if (res == nullptr || res->find("uri") == nullptr) {
            return std::nullopt;
        }
        ResourceContent rc;
        rc.uri = getStringOr(*res, "uri", "");
        if (const JSONValue* m = res->find("mimeType"); m != nullptr && m->isString()) {
            rc.mimeType = std::get<std::string>(m->value);
        }
        if (const JSONValue* t = res->find("text"); t != nullptr && t->isString()) {
            rc.text = std::get<std::string>(t->value);
        }
        return ContentItem{std::move(rc)};
    }
    return std::nullopt;
}

} // namespace toolhost
