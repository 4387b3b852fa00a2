//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio-based transport implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "toolhost/ContentFramer.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/JsonRpcMessageRouter.h"
#include "toolhost/StdioTransport.hpp"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {
std::future<void> readyFuture() {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}
} // namespace

class StdioTransport::Impl {
public:
    int inFd{STDIN_FILENO};
    int outFd{STDOUT_FILENO};
    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
    std::atomic<bool> faultReported{false};
    std::string sessionId;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;
    std::jthread readerThread;
    std::jthread writerThread;
    int wakeEventFd{-1};

    std::size_t maxContentLength{1024 * 1024};
    std::size_t skipRemaining{0}; // reader thread only
    std::unique_ptr<IContentFramer> framer;
    std::unique_ptr<IJsonRpcMessageRouter> router = MakeDefaultJsonRpcMessageRouter();

    // Write queue/backpressure
    std::mutex writeMutex; // protects writeQueue and queuedBytes
    std::condition_variable_any cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};
    std::size_t writeQueueMaxBytes{2 * 1024 * 1024}; // 2 MiB default cap

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        stopThreads();
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    // Reports a fault or EOF once; the session owner decides what happens next.
    void reportFault(const std::string& message) {
        connected = false;
        if (faultReported.exchange(true)) {
            return;
        }
        if (errorHandler) {
            errorHandler(message);
        }
    }

    void wakeReader() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            break;
        }
    }

    void stopThreads() {
        const auto self = std::this_thread::get_id();
        if (readerThread.joinable()) {
            readerThread.request_stop();
            wakeReader();
            if (readerThread.get_id() != self) {
                readerThread.join();
            } else {
                readerThread.detach();
            }
        }
        if (writerThread.joinable()) {
            writerThread.request_stop();
            cvWrite.notify_all();
            if (writerThread.get_id() != self) {
                writerThread.join();
            } else {
                writerThread.detach();
            }
        }
    }

    bool enqueueFrame(const std::string& payload) {
        std::string frame = framer->encode(payload);
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (queuedBytes + frame.size() > writeQueueMaxBytes) {
                LOG_ERROR("StdioTransport: write queue overflow (queued={} add={} max={})", queuedBytes, frame.size(), writeQueueMaxBytes);
            } else {
                queuedBytes += frame.size();
                writeQueue.emplace_back(std::move(frame));
                cvWrite.notify_one();
                return true;
            }
        }
        reportFault("StdioTransport: write queue overflow");
        wakeReader();
        return false;
    }

    void startReader() {
        readerThread = std::jthread([this](std::stop_token st) {
            const int ep = ::epoll_create1(EPOLL_CLOEXEC);
            if (ep < 0) {
                LOG_ERROR("StdioTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
                reportFault("StdioTransport: epoll setup failed");
                return;
            }
            epoll_event evIn{};
            evIn.events = EPOLLIN | EPOLLRDHUP;
            evIn.data.fd = inFd;
            if (::epoll_ctl(ep, EPOLL_CTL_ADD, inFd, &evIn) != 0) {
                LOG_ERROR("StdioTransport: cannot poll input fd {} (errno={} msg={})", inFd, errno, ::strerror(errno));
                ::close(ep);
                reportFault("StdioTransport: input not pollable");
                return;
            }
            if (wakeEventFd >= 0) {
                epoll_event evWake{};
                evWake.events = EPOLLIN;
                evWake.data.fd = wakeEventFd;
                (void)::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake);
            }

            std::string buffer;
            std::vector<char> tmp(4096);
            bool done = false;
            while (!done && !st.stop_requested()) {
                epoll_event events[2];
                int rc = ::epoll_wait(ep, events, 2, -1);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    LOG_ERROR("StdioTransport: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                    reportFault("StdioTransport: epoll_wait failed");
                    break;
                }
                for (int i = 0; i < rc && !done; ++i) {
                    const auto& ev = events[i];
                    if (ev.data.fd != inFd) {
                        uint64_t v = 0;
                        (void)::read(wakeEventFd, &v, sizeof(v));
                        done = true;
                        break;
                    }
                    if ((ev.events & EPOLLIN) == 0 && (ev.events & (EPOLLERR | EPOLLHUP | EPOLLRDHUP)) != 0) {
                        LOG_INFO("StdioTransport: input closed (epoll flags={})", static_cast<unsigned int>(ev.events));
                        reportFault("StdioTransport: stdin closed");
                        done = true;
                        break;
                    }
                    ssize_t n = ::read(inFd, tmp.data(), tmp.size());
                    if (n > 0) {
                        buffer.append(tmp.data(), static_cast<std::size_t>(n));
                        done = !drainFrames(buffer);
                    } else if (n == 0) {
                        LOG_INFO("StdioTransport: EOF on stdin");
                        reportFault("StdioTransport: EOF on stdin");
                        done = true;
                    } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                        LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                        reportFault("StdioTransport: read error");
                        done = true;
                    }
                }
            }
            ::close(ep);
        });
    }

    // Returns false when framing is lost and reading must stop.
    bool drainFrames(std::string& buffer) {
        for (;;) {
            if (skipRemaining > 0 && !skipOversizedBody(buffer)) {
                return true;
            }
            auto res = framer->tryDecodeEx(buffer);
            switch (res.status) {
                case IContentFramer::DecodeStatus::Incomplete:
                    return true;
                case IContentFramer::DecodeStatus::Ok:
                    buffer.erase(0, res.bytesConsumed);
                    processMessage(res.payload.value());
                    break;
                case IContentFramer::DecodeStatus::InvalidHeader:
                    LOG_WARN("StdioTransport: invalid frame header (dropping {} bytes)", res.bytesConsumed);
                    buffer.erase(0, res.bytesConsumed);
                    break;
                case IContentFramer::DecodeStatus::BodyTooLarge:
                    if (!res.declaredLength) {
                        LOG_WARN("StdioTransport: Content-Length is not representable");
                        reportFault("StdioTransport: body too large");
                        return false;
                    }
                    // Skip the body and keep the channel: the peer learns why its request was dropped.
                    LOG_WARN("StdioTransport: skipping {} byte body (max {})", *res.declaredLength, maxContentLength);
                    buffer.erase(0, res.bytesConsumed);
                    skipRemaining = *res.declaredLength;
                    enqueueFrame(errors::makeErrorResponse(nullptr, errors::makeToolFailure(
                        errors::ErrorKind::RequestTooLarge,
                        "Request too large: " + std::to_string(*res.declaredLength) + " bytes exceeds limit of " +
                            std::to_string(maxContentLength)))->Serialize());
                    break;
            }
        }
    }

    // Drops body bytes of a rejected frame; returns false while more are still expected.
    bool skipOversizedBody(std::string& buffer) {
        const std::size_t n = std::min(skipRemaining, buffer.size());
        buffer.erase(0, n);
        skipRemaining -= n;
        return skipRemaining == 0;
    }

    void startWriter() {
        writerThread = std::jthread([this](std::stop_token st) {
            for (;;) {
                std::string frame;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait(lk, st, [this]{ return !writeQueue.empty(); });
                    if (writeQueue.empty()) {
                        // Stop requested and everything queued has been written.
                        break;
                    }
                    frame = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }
                const bool ok = writeAll(frame);
                {
                    std::lock_guard<std::mutex> lk(writeMutex);
                    queuedBytes = queuedBytes >= frame.size() ? queuedBytes - frame.size() : 0;
                }
                if (!ok) {
                    reportFault("StdioTransport: write error");
                    wakeReader();
                    break;
                }
            }
        });
    }

    bool writeAll(const std::string& frame) {
        std::size_t total = 0;
        while (total < frame.size()) {
            ssize_t w = ::write(outFd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
            } else if (w < 0 && errno == EINTR) {
                continue;
            } else if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            } else {
                LOG_ERROR("StdioTransport: write error (errno={} msg={})", errno, ::strerror(errno));
                return false;
            }
        }
        return true;
    }

    void processMessage(const std::string& message) {
        LOG_DEBUG("Received message: {}", message);
        switch (router->classify(message)) {
            case IJsonRpcMessageRouter::MessageKind::Request: {
                auto request = std::make_unique<JSONRPCRequest>();
                if (!request->Deserialize(message)) {
                    enqueueFrame(CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid request")->Serialize());
                    return;
                }
                if (!requestHandler) {
                    enqueueFrame(CreateErrorResponse(request->id, JSONRPCErrorCodes::MethodNotFound, "No request handler")->Serialize());
                    return;
                }
                requestHandler(std::move(request));
                return;
            }
            case IJsonRpcMessageRouter::MessageKind::Notification:
                LOG_DEBUG("StdioTransport: ignoring notification");
                return;
            case IJsonRpcMessageRouter::MessageKind::Response:
                LOG_WARN("StdioTransport: unexpected response from peer ignored");
                return;
            case IJsonRpcMessageRouter::MessageKind::Unknown:
                enqueueFrame(CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error")->Serialize());
                return;
        }
    }
};

StdioTransport::StdioTransport() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }

StdioTransport::StdioTransport(int inFd, int outFd) : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
    pImpl->inFd = inFd;
    pImpl->outFd = outFd;
}

StdioTransport::~StdioTransport() { FUNC_SCOPE(); }

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting StdioTransport {}", pImpl->sessionId);
    if (pImpl->closed) {
        std::promise<void> failed;
        failed.set_exception(std::make_exception_ptr(std::runtime_error("StdioTransport already closed")));
        return failed.get_future();
    }
    if (pImpl->wakeEventFd < 0) {
        std::promise<void> failed;
        failed.set_exception(std::make_exception_ptr(std::runtime_error("StdioTransport: eventfd unavailable")));
        return failed.get_future();
    }
    if (!pImpl->connected.exchange(true)) {
        pImpl->framer = MakeContentLengthFramer(pImpl->maxContentLength);
        pImpl->startWriter();
        pImpl->startReader();
    }
    return readyFuture();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->closed.exchange(true)) {
        return readyFuture();
    }
    LOG_INFO("Closing StdioTransport {}", pImpl->sessionId);
    pImpl->connected = false;
    pImpl->stopThreads();
    return readyFuture();
}

bool StdioTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->connected; }
std::string StdioTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

std::future<void> StdioTransport::SendResponse(std::unique_ptr<JSONRPCResponse> response) {
    FUNC_SCOPE();
    if (pImpl->closed || !pImpl->framer) {
        LOG_DEBUG("StdioTransport: response {} dropped (closed)", idToString(response->id));
        return readyFuture();
    }
    std::string serialized = response->Serialize();
    LOG_DEBUG("Sending framed response ({} bytes)", serialized.size());
    (void)pImpl->enqueueFrame(serialized);
    return readyFuture();
}

void StdioTransport::SetRequestHandler(RequestHandler handler) { FUNC_SCOPE(); pImpl->requestHandler = std::move(handler); }
void StdioTransport::SetErrorHandler(ErrorHandler handler) { FUNC_SCOPE(); pImpl->errorHandler = std::move(handler); }

void StdioTransport::SetMaxContentLength(std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0) { maxBytes = 1; }
    pImpl->maxContentLength = maxBytes;
}

void StdioTransport::SetWriteQueueMaxBytes(std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0) { maxBytes = 1; }
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    pImpl->writeQueueMaxBytes = maxBytes;
}

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const std::string& config) {
    auto t = std::make_unique<StdioTransport>();
    auto parseSize = [](const std::string& s, std::size_t& out) -> bool {
        const char* end = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(s.data(), end, out);
        return ec == std::errc() && ptr == end;
    };
    std::string token;
    for (std::size_t i = 0; i < config.size();) {
        // Skip separators and spaces
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("StdioTransportFactory: ignoring malformed option '{}'", token);
            continue;
        }
        auto key = token.substr(0, eq);
        auto val = token.substr(eq + 1);
        std::size_t v = 0;
        if (!parseSize(val, v)) {
            LOG_WARN("StdioTransportFactory: invalid value for {}: '{}'", key, val);
        } else if (key == "max_content_length") {
            t->SetMaxContentLength(v);
        } else if (key == "write_queue_max_bytes") {
            t->SetWriteQueueMaxBytes(v);
        } else {
            LOG_WARN("StdioTransportFactory: unknown option '{}'", key);
        }
    }
    return t;
}

} // namespace toolhost
