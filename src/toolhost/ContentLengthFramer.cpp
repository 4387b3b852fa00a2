//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length header framer used by the stdio transport
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolhost/ContentFramer.h"

namespace toolhost {

namespace {
constexpr const char* HeaderTerminator = "\r\n\r\n";
constexpr std::size_t HeaderTerminatorSize = 4;

std::string trim(const std::string& s) {
    auto first = std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); });
    auto last = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base();
    return (first < last) ? std::string(first, last) : std::string();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame = "Content-Length: " + std::to_string(payload.size()) + HeaderTerminator;
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::size_t headerEnd = buffer.find(HeaderTerminator);
        if (headerEnd == std::string::npos) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t bodyStart = headerEnd + HeaderTerminatorSize;

        std::optional<std::size_t> contentLength;
        std::size_t pos = 0;
        while (pos < headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            const std::string line = buffer.substr(pos, eol - pos);
            pos = eol + 2;
            const auto colon = line.find(':');
            if (colon == std::string::npos || lower(line.substr(0, colon)) != "content-length") {
                continue;
            }
            const std::string value = trim(line.substr(colon + 1));
            if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
                LOG_WARN("Invalid Content-Length header: '{}'", value);
                return { DecodeStatus::InvalidHeader, std::nullopt, bodyStart };
            }
            if (value.size() > 19) {
                LOG_WARN("Content-Length {} exceeds limits (max={})", value, maxContentLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, bodyStart };
            }
            const unsigned long long v64 = std::stoull(value);
            if (v64 > std::numeric_limits<std::size_t>::max() - bodyStart) {
                LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, bodyStart };
            }
            if (v64 > maxContentLength) {
                LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, bodyStart, static_cast<std::size_t>(v64) };
            }
            contentLength = static_cast<std::size_t>(v64);
        }

        if (!contentLength.has_value()) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, bodyStart };
        }
        const std::size_t frameTotal = bodyStart + contentLength.value();
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        return { DecodeStatus::Ok, buffer.substr(bodyStart, contentLength.value()), frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status != DecodeStatus::Ok) {
            return std::nullopt;
        }
        buffer.erase(0, r.bytesConsumed);
        return r.payload;
    }

private:
    std::size_t maxContentLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

} // namespace toolhost
