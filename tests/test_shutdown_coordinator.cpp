//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_shutdown_coordinator.cpp
// Purpose: Signals and explicit triggers fire the shutdown event exactly once
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>
#include <vector>

#include "toolhost/ShutdownCoordinator.hpp"

using namespace toolhost;
using namespace std::chrono_literals;

namespace {

bool waitTriggered(const ShutdownCoordinator& coordinator) {
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!coordinator.IsTriggered()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

TEST(ShutdownCoordinator, TriggerFiresOnce) {
    ShutdownCoordinator coordinator;
    auto token = coordinator.GetToken();
    EXPECT_FALSE(token.stop_requested());
    EXPECT_TRUE(coordinator.Trigger("test"));
    EXPECT_TRUE(token.stop_requested());
    EXPECT_FALSE(coordinator.Trigger("again"));
    EXPECT_TRUE(coordinator.IsTriggered());
}

TEST(ShutdownCoordinator, ConcurrentTriggersHaveOneWinner) {
    ShutdownCoordinator coordinator;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (coordinator.Trigger("race")) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(winners.load(), 1);
}

TEST(ShutdownCoordinator, SigintFiresEvent) {
    ShutdownCoordinator coordinator;
    std::atomic<bool> callbackRan{false};
    std::stop_callback onStop(coordinator.GetToken(), [&callbackRan]() { callbackRan = true; });

    ASSERT_EQ(std::raise(SIGINT), 0);
    ASSERT_TRUE(waitTriggered(coordinator));
    EXPECT_TRUE(callbackRan.load());

    // A second signal while shutting down is ignored, not fatal
    ASSERT_EQ(std::raise(SIGTERM), 0);
    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(coordinator.IsTriggered());
    EXPECT_FALSE(coordinator.Trigger("after signal"));
}
