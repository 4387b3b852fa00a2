//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Concrete stdio-based transport (Content-Length framed JSON-RPC)
//==========================================================================================================
#pragma once

#include "toolhost/Transport.h"
#include <memory>
#include <cstddef>

namespace toolhost {

//==========================================================================================================
// StdioTransport
// Purpose: Server-side JSON-RPC transport over a pair of file descriptors (stdin/stdout by default).
//          A reader thread waits on epoll for input or a close wakeup; a writer thread drains a bounded
//          queue of encoded frames.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    StdioTransport();

    //==========================================================================================================
    // Creates a transport over caller-owned descriptors (pipes in tests). The descriptors are not closed.
    // Args:
    //   inFd: Descriptor frames are read from.
    //   outFd: Descriptor frames are written to.
    //==========================================================================================================
    StdioTransport(int inFd, int outFd);
    virtual ~StdioTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the reader/writer loops.
    // Returns:
    //   Future that completes when loops are running; carries an exception if setup failed.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the reader, flushes already queued frames and joins both loops.
    // Returns:
    //   Future that completes when closed.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;
    std::future<void> SendResponse(std::unique_ptr<JSONRPCResponse> response) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetMaxContentLength
    // Purpose: Largest accepted frame body. A larger body is skipped and answered with a RequestTooLarge
    //          error (null id); only a Content-Length that cannot be represented ends the session.
    //==========================================================================================================
    void SetMaxContentLength(std::size_t maxBytes);

    //==========================================================================================================
    // SetWriteQueueMaxBytes
    // Purpose: Backpressure clamp for pending write buffers.
    // Args:
    //   maxBytes: Maximum allowed bytes in write queue before emitting an error and closing.
    //==========================================================================================================
    void SetWriteQueueMaxBytes(std::size_t maxBytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Factory for creating stdio transports.
// Config keys ("key=value;key=value"):
//   max_content_length: Frame body cap in bytes (default 1 MiB).
//   write_queue_max_bytes: Write queue cap in bytes (default 2 MiB).
//==========================================================================================================
class StdioTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace toolhost
