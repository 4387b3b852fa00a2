//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionLoop.h
// Purpose: Protocol state machine: accepts requests from a transport, runs tool calls concurrently and
//          drains gracefully on shutdown
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <stop_token>

#include "toolhost/MetricsCollector.h"
#include "toolhost/Protocol.h"
#include "toolhost/Transport.h"

namespace toolhost {

class ToolRegistry;

//==========================================================================================================
// SessionOptions
// Purpose: Per-session tunables.
// Fields:
//   serverInfo: Identity reported by initialize.
//   maxRequestSize: Largest accepted serialized tools/call arguments, in bytes.
//   gracePeriod: Time in-flight calls get to finish once draining starts.
//   workerThreads: Size of the invocation worker pool.
//==========================================================================================================
struct SessionOptions {
    Implementation serverInfo{"production-mcp-server", "1.0.0"};
    std::size_t maxRequestSize{1024 * 1024};
    std::chrono::milliseconds gracePeriod{5000};
    std::size_t workerThreads{4};
};

//==========================================================================================================
// SessionLoop
// Purpose: Serves one session. States move Starting -> Serving -> Draining -> Stopped and never back.
//          tools/list, initialize and ping are answered on the accept thread; tools/call is posted to a
//          worker pool so a slow tool never blocks discovery or other calls. Responses are correlated by
//          request id and may be written out of order.
//==========================================================================================================
class SessionLoop {
public:
    SessionLoop(ToolRegistry& registry, MetricsCollector& metrics, SessionOptions options);
    ~SessionLoop();

    SessionLoop(const SessionLoop&) = delete;
    SessionLoop& operator=(const SessionLoop&) = delete;

    //==========================================================================================================
    // Freezes the registry, wires and starts the transport, then enters Serving.
    // Args:
    //   transport: Channel owned by the session from now on.
    // Returns:
    //   Future that completes when serving; carries an exception if the transport failed to start or the
    //   session was already started.
    //==========================================================================================================
    std::future<void> Start(std::unique_ptr<ITransport> transport);

    //==========================================================================================================
    // Runs the accept loop on its own thread until the shutdown token fires or the transport closes, then
    // drains in-flight calls for up to the grace period, closes the transport and stops.
    // Args:
    //   shutdown: One-shot shutdown event (see ShutdownCoordinator::GetToken).
    // Returns:
    //   Future resolving to the final metrics snapshot once the session is Stopped.
    //==========================================================================================================
    std::future<MetricsSnapshot> Run(std::stop_token shutdown);

    ServerState GetState() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
