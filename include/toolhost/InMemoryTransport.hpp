//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory transport for tests and embedding
//==========================================================================================================
#pragma once

#include "toolhost/Transport.h"
#include <memory>
#include <utility>

namespace toolhost {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process transport pair used for tests and embedding. One side is handed to a SessionLoop;
//          the other acts as the caller and issues requests with SendRequest.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    virtual ~InMemoryTransport();

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two paired transports wired to each other in-memory.
    // Returns:
    //   pair(server,client) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes this side, fails its pending requests and reports closure to the peer's error handler.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;
    std::future<void> SendResponse(std::unique_ptr<JSONRPCResponse> response) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    ////////////////////////////////////////// Caller side //////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request to the paired transport and returns a future for its response.
    // Args:
    //   request: Request to send; an id is generated when the caller left it null or empty.
    // Returns:
    //   Future resolving to the response, or to an InternalError response when either side closes first.
    //==========================================================================================================
    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(std::unique_ptr<JSONRPCRequest> request);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

class InMemoryTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace toolhost
