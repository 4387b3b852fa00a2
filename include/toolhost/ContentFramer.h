//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Message framing interface for byte-stream transports (Content-Length framing)
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace toolhost {

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes the caller should drop (full frame, or bad header block)
        std::optional<std::size_t> declaredLength; // BodyTooLarge only: body size the header announced, if representable
    };

    // Wraps a payload into a complete frame.
    virtual std::string encode(const std::string& payload) = 0;

    // Extracts the first complete frame and erases it from the buffer. Malformed input leaves the
    // buffer untouched; use tryDecodeEx to learn how much to discard.
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;

    // Inspects the buffer without modifying it.
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 1024 * 1024);

} // namespace toolhost
