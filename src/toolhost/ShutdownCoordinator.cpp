//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ShutdownCoordinator.cpp
// Purpose: Turns SIGINT/SIGTERM into a one-shot shutdown event shared with the session loop
//==========================================================================================================

#include <csignal>
#include <mutex>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "toolhost/ShutdownCoordinator.hpp"

namespace toolhost {

namespace net = boost::asio;

class ShutdownCoordinator::Impl {
public:
    net::io_context ioc;
    net::executor_work_guard<net::io_context::executor_type> work{net::make_work_guard(ioc)};
    net::signal_set signals{ioc, SIGINT, SIGTERM};
    std::stop_source source;
    // Serializes the check-and-fire so exactly one caller observes the transition.
    std::mutex fireMutex;
    std::thread ioThread;

    Impl() {
        arm();
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("ShutdownCoordinator: signal loop failed: {}", e.what());
            }
        });
    }

    ~Impl() {
        boost::system::error_code ec;
        signals.cancel(ec);
        work.reset();
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    void arm() {
        signals.async_wait([this](const boost::system::error_code& ec, int signo) {
            if (ec) {
                // operation_aborted on cancel during teardown
                return;
            }
            if (fire()) {
                LOG_INFO("Received signal {}, initiating graceful shutdown", signo);
            } else {
                LOG_WARN("Received signal {} while already shutting down; ignoring", signo);
            }
            arm();
        });
    }

    bool fire() {
        std::lock_guard<std::mutex> lock(fireMutex);
        if (source.stop_requested()) {
            return false;
        }
        return source.request_stop();
    }
};

ShutdownCoordinator::ShutdownCoordinator() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }
ShutdownCoordinator::~ShutdownCoordinator() { FUNC_SCOPE(); }

bool ShutdownCoordinator::Trigger(const std::string& reason) {
    FUNC_SCOPE();
    const bool fired = pImpl->fire();
    if (fired) {
        LOG_INFO("Shutdown requested: {}", reason);
    } else {
        LOG_DEBUG("Shutdown already requested; ignoring '{}'", reason);
    }
    return fired;
}

std::stop_token ShutdownCoordinator::GetToken() const {
    return pImpl->source.get_token();
}

bool ShutdownCoordinator::IsTriggered() const {
    return pImpl->source.stop_requested();
}

} // namespace toolhost
