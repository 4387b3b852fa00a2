//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ShutdownCoordinator.hpp
// Purpose: Turns SIGINT/SIGTERM into a one-shot shutdown event shared with the session loop
//==========================================================================================================
#pragma once

#include <memory>
#include <stop_token>
#include <string>

namespace toolhost {

//==========================================================================================================
// ShutdownCoordinator
// Purpose: Owns a Boost.Asio io_context thread waiting on a signal_set for SIGINT and SIGTERM. The first
//          signal (or Trigger call) fires the shutdown event; later ones are logged and ignored, so a
//          second Ctrl+C during draining does not kill the process.
//==========================================================================================================
class ShutdownCoordinator {
public:
    ShutdownCoordinator();
    ~ShutdownCoordinator();

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    //==========================================================================================================
    // Fires the shutdown event programmatically.
    // Args:
    //   reason: Logged with the event.
    // Returns:
    //   true when this call fired the event; false when it had already fired.
    //==========================================================================================================
    bool Trigger(const std::string& reason);

    //==========================================================================================================
    // Token observed by the session accept step.
    //==========================================================================================================
    std::stop_token GetToken() const;

    bool IsTriggered() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost
