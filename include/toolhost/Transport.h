//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces - COM-style abstraction over a duplex message channel
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>

namespace toolhost {

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;

//==========================================================================================================
// ITransport
// Purpose: Server side of one session channel. Inbound requests are pushed to the request handler as
//          they are decoded; responses are written back asynchronously with SendResponse, in any order.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loop (the session handshake from the server's point of view).
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport is running; carries an exception on failure.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport and releases resources. Idempotent.
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is currently connected.
    // Args:
    //   (none)
    // Returns:
    //   true if connected; false otherwise.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    // Args:
    //   (none)
    // Returns:
    //   A string identifying the current session.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Queues a JSON-RPC response for delivery to the peer. Safe to call from any thread.
    // Args:
    //   response: Response carrying the id of the request it answers.
    // Returns:
    //   Future completing when the response has been handed to the channel. Responses sent after the
    //   transport closed are dropped and the future still completes.
    //==========================================================================================================
    virtual std::future<void> SendResponse(std::unique_ptr<JSONRPCResponse> response) = 0;

    /////////////////////////////////////////// Request handling ///////////////////////////////////////////
    //==========================================================================================================
    // Registers the inbound request handler. The transport calls it from its reader thread, in arrival
    // order, and never waits for a response; the handler must return promptly.
    // Args:
    //   handler: Callback taking ownership of the decoded request.
    // Returns:
    //   (none)
    //==========================================================================================================
    using RequestHandler = std::function<void(std::unique_ptr<JSONRPCRequest>)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    /////////////////////////////////////////// Error handling ///////////////////////////////////////////
    //==========================================================================================================
    // Registers an error handler. Invoked when the channel closes (EOF, peer closed) or faults; after
    // this call no further requests are delivered.
    // Args:
    //   handler: Callback with error string.
    // Returns:
    //   (none)
    //==========================================================================================================
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// Transport factory interface
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: Transport-specific configuration string ("key=value;key=value").
    // Returns:
    //   A unique_ptr to a newly created ITransport.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

} // namespace toolhost
