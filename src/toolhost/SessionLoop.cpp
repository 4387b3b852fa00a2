//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionLoop.cpp
// Purpose: Protocol state machine: accepts requests from a transport, runs tool calls concurrently and
//          drains gracefully on shutdown
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"
#include "toolhost/Dispatcher.h"
#include "toolhost/SessionLoop.h"
#include "toolhost/ToolRegistry.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {

template <typename T>
std::future<T> failedFuture(const std::string& message) {
    std::promise<T> promise;
    promise.set_exception(std::make_exception_ptr(std::runtime_error(message)));
    return promise.get_future();
}

JSONValue specToJSON(const ToolSpec& spec) {
    JSONValue::Object obj;
    setField(obj, "name", JSONValue(spec.name));
    setField(obj, "description", JSONValue(spec.description));
    setField(obj, "inputSchema", spec.inputSchema);
    return JSONValue(std::move(obj));
}

std::unique_ptr<JSONRPCResponse> toResponse(const JSONRPCId& id, const InvocationResult& result) {
    if (const auto* failure = result.asFailure()) {
        return errors::makeErrorResponse(id, errors::makeToolFailure(failure->kind, failure->message));
    }
    JSONValue::Array content;
    for (const auto& item : result.asSuccess()->content) {
        content.push_back(std::make_shared<JSONValue>(toJSON(item)));
    }
    JSONValue::Object obj;
    setField(obj, "content", JSONValue(std::move(content)));
    setField(obj, "isError", JSONValue(false));
    return std::make_unique<JSONRPCResponse>(id, JSONValue(std::move(obj)));
}

} // namespace

class SessionLoop::Impl {
public:
    // One tools/call between dispatch and response.
    struct Call {
        std::stop_source stop;
        bool abandoned{false};
        bool completing{false};
    };

    ToolRegistry& registry;
    MetricsCollector& metrics;
    SessionOptions options;
    Dispatcher dispatcher;
    std::atomic<ServerState> state{ServerState::Starting};
    std::atomic<bool> started{false};
    std::atomic<bool> running{false};

    // Guards inbox, transportClosed, closeReason and inFlight.
    std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<std::unique_ptr<JSONRPCRequest>> inbox;
    bool transportClosed{false};
    std::string closeReason;
    std::unordered_map<std::string, std::shared_ptr<Call>> inFlight;

    std::unique_ptr<boost::asio::thread_pool> pool;
    std::jthread acceptThread;
    // Declared last so its I/O threads stop before the state they call back into is destroyed.
    std::unique_ptr<ITransport> transport;

    Impl(ToolRegistry& reg, MetricsCollector& m, SessionOptions opts)
        : registry(reg), metrics(m), options(std::move(opts)), dispatcher(reg, &m) {
        if (options.workerThreads == 0) {
            options.workerThreads = 1;
        }
        pool = std::make_unique<boost::asio::thread_pool>(options.workerThreads);
    }

    ~Impl() {
        if (acceptThread.joinable()) {
            // Destroyed while still serving: end the accept loop as if the channel closed.
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (!transportClosed) {
                    transportClosed = true;
                    closeReason = "session destroyed";
                }
            }
            cv.notify_all();
            acceptThread.join();
        }
        // Abandoned handlers that ignore their stop token keep the pool busy until they return.
        pool->join();
        if (transport && state.load() != ServerState::Stopped) {
            try {
                transport->Close().get();
            } catch (const std::exception& e) {
                LOG_ERROR("Error closing transport: {}", e.what());
            }
        }
    }

    /////////////////////////////////////////// Transport callbacks ///////////////////////////////////////////
    void onRequest(std::unique_ptr<JSONRPCRequest> request) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            const ServerState s = state.load();
            if ((s == ServerState::Starting || s == ServerState::Serving) && !transportClosed) {
                inbox.push_back(std::move(request));
                cv.notify_all();
                return;
            }
        }
        refuse(*request);
    }

    void onTransportError(const std::string& error) {
        LOG_INFO("Transport closed: {}", error);
        {
            std::lock_guard<std::mutex> lock(mutex);
            transportClosed = true;
            closeReason = error;
        }
        cv.notify_all();
    }

    void send(std::unique_ptr<JSONRPCResponse> response) {
        try {
            transport->SendResponse(std::move(response)).get();
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to send response: {}", e.what());
        }
    }

    void refuse(const JSONRPCRequest& request) {
        LOG_DEBUG("Refusing '{}' (id={}) while {}", request.method, idToString(request.id), toString(state.load()));
        send(CreateErrorResponse(request.id, JSONRPCErrorCodes::ServerShuttingDown, "Server is shutting down"));
    }

    /////////////////////////////////////////// Accept loop ///////////////////////////////////////////
    void acceptLoop(std::stop_token shutdown, std::promise<MetricsSnapshot> done) {
        std::string reason;
        for (;;) {
            std::unique_ptr<JSONRPCRequest> request;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, shutdown, [this]() { return !inbox.empty() || transportClosed; });
                if (shutdown.stop_requested()) {
                    reason = "shutdown requested";
                    break;
                }
                if (inbox.empty()) {
                    reason = closeReason;
                    break;
                }
                request = std::move(inbox.front());
                inbox.pop_front();
            }
            handleRequest(std::move(request));
        }
        done.set_value(drain(reason));
    }

    void handleRequest(std::unique_ptr<JSONRPCRequest> request) {
        const std::string& method = request->method;
        if (method == Methods::CallTool) {
            handleCallTool(std::move(request));
            return;
        }
        if (method == Methods::ListTools) {
            LOG_DEBUG("Handling tools/list request");
            JSONValue::Array tools;
            for (const auto& spec : registry.GetAllSpecs()) {
                tools.push_back(std::make_shared<JSONValue>(specToJSON(spec)));
            }
            JSONValue::Object result;
            setField(result, "tools", JSONValue(std::move(tools)));
            send(std::make_unique<JSONRPCResponse>(request->id, JSONValue(std::move(result))));
            return;
        }
        if (method == Methods::Initialize) {
            LOG_INFO("Handling initialize request");
            JSONValue::Object serverInfo;
            setField(serverInfo, "name", JSONValue(options.serverInfo.name));
            setField(serverInfo, "version", JSONValue(options.serverInfo.version));
            JSONValue::Object toolsCap;
            setField(toolsCap, "listChanged", JSONValue(false));
            JSONValue::Object capabilities;
            setField(capabilities, "tools", JSONValue(std::move(toolsCap)));
            JSONValue::Object result;
            setField(result, "protocolVersion", JSONValue(PROTOCOL_VERSION));
            setField(result, "serverInfo", JSONValue(std::move(serverInfo)));
            setField(result, "capabilities", JSONValue(std::move(capabilities)));
            send(std::make_unique<JSONRPCResponse>(request->id, JSONValue(std::move(result))));
            return;
        }
        if (method == Methods::Ping) {
            send(std::make_unique<JSONRPCResponse>(request->id, JSONValue(JSONValue::Object{})));
            return;
        }
        LOG_WARN("Method not found: {}", method);
        send(CreateErrorResponse(request->id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + method));
    }

    void handleCallTool(std::unique_ptr<JSONRPCRequest> request) {
        const JSONValue* nameVal = request->params ? request->params->find("name") : nullptr;
        if (nameVal == nullptr || !nameVal->isString()) {
            send(CreateErrorResponse(request->id, JSONRPCErrorCodes::InvalidParams, "tools/call requires a string 'name'"));
            return;
        }
        std::string name = std::get<std::string>(nameVal->value);
        JSONValue arguments{JSONValue::Object{}};
        if (const JSONValue* args = request->params->find("arguments")) {
            arguments = *args;
        }

        const std::size_t size = serializeJSONValue(arguments).size();
        if (size > options.maxRequestSize) {
            LOG_WARN("Rejecting call to '{}': arguments are {} bytes (max {})", name, size, options.maxRequestSize);
            send(errors::makeErrorResponse(request->id, errors::makeToolFailure(
                errors::ErrorKind::RequestTooLarge,
                "Request too large: " + std::to_string(size) + " bytes exceeds limit of " + std::to_string(options.maxRequestSize))));
            return;
        }

        const std::string key = idToString(request->id);
        auto call = std::make_shared<Call>();
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!inFlight.emplace(key, call).second) {
                send(CreateErrorResponse(request->id, JSONRPCErrorCodes::InvalidRequest, "Duplicate in-flight request id: " + key));
                return;
            }
        }
        LOG_DEBUG("Dispatching tools/call '{}' (id={})", name, key);
        boost::asio::post(*pool, [this, call, key, id = request->id, name = std::move(name), arguments = std::move(arguments)]() {
            // Completion is claimed before metrics are recorded, so a call drain() abandons is never
            // counted as successful and a claimed call is always delivered.
            InvocationResult result = dispatcher.Invoke(name, arguments, call->stop.get_token(), [this, &call]() {
                std::lock_guard<std::mutex> lock(mutex);
                if (call->abandoned) {
                    return false;
                }
                call->completing = true;
                return true;
            });
            if (!call->completing) {
                LOG_DEBUG("Discarding late result of abandoned call '{}' (id={})", name, key);
                return;
            }
            send(toResponse(id, result));
            {
                std::lock_guard<std::mutex> lock(mutex);
                inFlight.erase(key);
            }
            cv.notify_all();
        });
    }

    /////////////////////////////////////////// Draining ///////////////////////////////////////////
    MetricsSnapshot drain(const std::string& reason) {
        state = ServerState::Draining;
        LOG_INFO("Draining session ({})", reason);

        std::deque<std::unique_ptr<JSONRPCRequest>> queued;
        {
            std::lock_guard<std::mutex> lock(mutex);
            queued.swap(inbox);
        }
        for (const auto& request : queued) {
            refuse(*request);
        }

        {
            std::unique_lock<std::mutex> lock(mutex);
            if (!cv.wait_for(lock, options.gracePeriod, [this]() { return inFlight.empty(); })) {
                std::size_t abandoned = 0;
                for (auto it = inFlight.begin(); it != inFlight.end();) {
                    if (it->second->completing) {
                        ++it;
                        continue;
                    }
                    it->second->abandoned = true;
                    it->second->stop.request_stop();
                    it = inFlight.erase(it);
                    ++abandoned;
                }
                LOG_WARN("Grace period expired; abandoned {} in-flight call(s)", abandoned);
            }
            // Calls already writing their response finish delivering it.
            cv.wait(lock, [this]() { return inFlight.empty(); });
        }

        state = ServerState::Stopped;
        try {
            transport->Close().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Error closing transport: {}", e.what());
        }
        MetricsSnapshot snapshot = metrics.Snapshot();
        LOG_INFO("Session stopped. Final metrics: {}", serializeJSONValue(snapshot.ToDetailedJSON()));
        return snapshot;
    }
};

SessionLoop::SessionLoop(ToolRegistry& registry, MetricsCollector& metrics, SessionOptions options)
    : pImpl(std::make_unique<Impl>(registry, metrics, std::move(options))) {
    FUNC_SCOPE();
}

SessionLoop::~SessionLoop() { FUNC_SCOPE(); }

std::future<void> SessionLoop::Start(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    if (!transport) {
        return failedFuture<void>("SessionLoop::Start: null transport");
    }
    if (pImpl->started.exchange(true)) {
        return failedFuture<void>("SessionLoop already started");
    }
    pImpl->registry.Freeze();
    pImpl->transport = std::move(transport);
    pImpl->transport->SetRequestHandler([impl = pImpl.get()](std::unique_ptr<JSONRPCRequest> request) {
        impl->onRequest(std::move(request));
    });
    pImpl->transport->SetErrorHandler([impl = pImpl.get()](const std::string& error) {
        impl->onTransportError(error);
    });

    std::promise<void> promise;
    try {
        pImpl->transport->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Transport failed to start: {}", e.what());
        promise.set_exception(std::current_exception());
        return promise.get_future();
    }
    pImpl->state = ServerState::Serving;
    LOG_INFO("Serving {} tools on session {}", pImpl->registry.Size(), pImpl->transport->GetSessionId());
    promise.set_value();
    return promise.get_future();
}

std::future<MetricsSnapshot> SessionLoop::Run(std::stop_token shutdown) {
    FUNC_SCOPE();
    if (pImpl->state.load() != ServerState::Serving) {
        return failedFuture<MetricsSnapshot>("SessionLoop::Run requires a started session");
    }
    if (pImpl->running.exchange(true)) {
        return failedFuture<MetricsSnapshot>("SessionLoop already running");
    }
    std::promise<MetricsSnapshot> done;
    auto future = done.get_future();
    pImpl->acceptThread = std::jthread([impl = pImpl.get(), shutdown, done = std::move(done)]() mutable {
        impl->acceptLoop(shutdown, std::move(done));
    });
    return future;
}

ServerState SessionLoop::GetState() const {
    return pImpl->state.load();
}

} // namespace toolhost
