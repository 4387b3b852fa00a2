//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/InMemoryTransport.hpp"
#include "toolhost/JsonRpcMessageRouter.h"

namespace toolhost {

namespace {
std::future<void> readyFuture() {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}
} // namespace

class InMemoryTransport::Impl {
public:
    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
    std::string sessionId;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;
    InMemoryTransport::Impl* peer = nullptr;
    std::mutex peerMutex;
    // std::nullopt marks the point where the peer closed; messages queued before it are still delivered
    std::deque<std::optional<std::string>> messageQueue;
    std::mutex queueMutex;
    std::condition_variable_any queueCondition;
    std::jthread processingThread;
    std::atomic<unsigned int> requestCounter{0u};
    std::mutex requestMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    std::unique_ptr<IJsonRpcMessageRouter> router = MakeDefaultJsonRpcMessageRouter();

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    ~Impl() {
        connected = false;
        if (processingThread.joinable()) {
            processingThread.request_stop();
            processingThread.join();
        }
        std::lock_guard<std::mutex> lock(peerMutex);
        if (peer != nullptr) {
            peer->detachPeer();
            peer = nullptr;
        }
    }

    void detachPeer() {
        std::lock_guard<std::mutex> lock(peerMutex);
        peer = nullptr;
    }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            while (!st.stop_requested()) {
                std::optional<std::string> message;
                {
                    std::unique_lock<std::mutex> lock(queueMutex);
                    if (!queueCondition.wait(lock, st, [this]() { return !messageQueue.empty(); })) {
                        break;
                    }
                    message = std::move(messageQueue.front());
                    messageQueue.pop_front();
                }
                if (!message.has_value()) {
                    onPeerClosed();
                } else if (connected) {
                    processMessage(message.value());
                }
            }
        });
    }

    void processMessage(const std::string& message) {
        LOG_DEBUG("Processing in-memory message: {}", message);
        const auto kind = router->classify(message);
        if (kind == IJsonRpcMessageRouter::MessageKind::Response) {
            JSONRPCResponse response;
            if (response.Deserialize(message)) {
                resolvePending(std::make_unique<JSONRPCResponse>(std::move(response)));
            }
            return;
        }
        if (kind == IJsonRpcMessageRouter::MessageKind::Request) {
            auto request = std::make_unique<JSONRPCRequest>();
            if (!request->Deserialize(message)) {
                return;
            }
            if (!requestHandler) {
                LOG_WARN("InMemoryTransport: no request handler; rejecting '{}'", request->method);
                sendToPeer(CreateErrorResponse(request->id, JSONRPCErrorCodes::MethodNotFound, "No request handler")->Serialize());
                return;
            }
            requestHandler(std::move(request));
            return;
        }
        LOG_DEBUG("InMemoryTransport: ignoring {} message", toString(kind));
    }

    void resolvePending(std::unique_ptr<JSONRPCResponse> response) {
        const std::string key = idToString(response->id);
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(key);
        if (it == pendingRequests.end()) {
            LOG_WARN("InMemoryTransport: response for unknown request id {}", key);
            return;
        }
        it->second.set_value(std::move(response));
        pendingRequests.erase(it);
    }

    void failPending(const std::string& reason) {
        std::lock_guard<std::mutex> lock(requestMutex);
        for (auto& [key, prom] : pendingRequests) {
            auto resp = CreateErrorResponse(key, JSONRPCErrorCodes::InternalError, reason);
            prom.set_value(std::move(resp));
        }
        pendingRequests.clear();
    }

    void enqueueMessage(std::optional<std::string> message) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            messageQueue.push_back(std::move(message));
        }
        queueCondition.notify_one();
    }

    bool sendToPeer(std::string message) {
        std::lock_guard<std::mutex> lock(peerMutex);
        if (!connected || peer == nullptr || !peer->connected.load()) {
            LOG_DEBUG("InMemoryTransport: peer not connected; dropping message");
            return false;
        }
        peer->enqueueMessage(std::move(message));
        return true;
    }

    // Runs on the processing thread once everything the peer sent before closing has been delivered.
    void onPeerClosed() {
        if (!connected.exchange(false)) {
            return;
        }
        failPending("Peer closed");
        if (errorHandler) {
            errorHandler("InMemoryTransport: peer closed");
        }
    }

    std::string generateRequestId() { return "mem-req-" + std::to_string(++requestCounter); }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }
InMemoryTransport::~InMemoryTransport() { FUNC_SCOPE(); }

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto server = std::make_unique<InMemoryTransport>();
    auto client = std::make_unique<InMemoryTransport>();
    server->pImpl->peer = client->pImpl.get();
    client->pImpl->peer = server->pImpl.get();
    return std::make_pair(std::move(server), std::move(client));
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    LOG_DEBUG("Starting InMemoryTransport {}", pImpl->sessionId);
    if (pImpl->closed) {
        std::promise<void> failed;
        failed.set_exception(std::make_exception_ptr(std::runtime_error("InMemoryTransport already closed")));
        return failed.get_future();
    }
    if (!pImpl->connected.exchange(true)) {
        pImpl->startProcessing();
    }
    return readyFuture();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->closed.exchange(true)) {
        return readyFuture();
    }
    LOG_DEBUG("Closing InMemoryTransport {}", pImpl->sessionId);
    pImpl->connected = false;
    pImpl->failPending("Transport closed");
    {
        std::lock_guard<std::mutex> lock(pImpl->peerMutex);
        if (pImpl->peer != nullptr) {
            pImpl->peer->enqueueMessage(std::nullopt);
        }
    }
    return readyFuture();
}

bool InMemoryTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->connected; }
std::string InMemoryTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

std::future<void> InMemoryTransport::SendResponse(std::unique_ptr<JSONRPCResponse> response) {
    FUNC_SCOPE();
    if (!pImpl->sendToPeer(response->Serialize())) {
        LOG_DEBUG("InMemoryTransport: response {} dropped (not connected)", idToString(response->id));
    }
    return readyFuture();
}

std::future<std::unique_ptr<JSONRPCResponse>> InMemoryTransport::SendRequest(std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    bool callerSetId = false;
    if (const auto* s = std::get_if<std::string>(&request->id)) {
        callerSetId = !s->empty();
    } else if (std::holds_alternative<int64_t>(request->id)) {
        callerSetId = true;
    }
    if (!callerSetId) {
        request->id = pImpl->generateRequestId();
    }
    const std::string key = idToString(request->id);

    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pImpl->pendingRequests[key] = std::move(promise);
    }
    if (!pImpl->sendToPeer(request->Serialize())) {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        auto it = pImpl->pendingRequests.find(key);
        if (it != pImpl->pendingRequests.end()) {
            it->second.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::InternalError, "Peer not connected"));
            pImpl->pendingRequests.erase(it);
        }
    }
    return future;
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->errorHandler = std::move(handler);
}

void InMemoryTransport::SetRequestHandler(RequestHandler handler) {
    FUNC_SCOPE();
    pImpl->requestHandler = std::move(handler);
}

std::unique_ptr<ITransport> InMemoryTransportFactory::CreateTransport(const std::string& /*config*/) {
    return std::make_unique<InMemoryTransport>();
}

} // namespace toolhost
