//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MetricsCollector.h
// Purpose: Process-wide invocation counters and rolling latency statistics
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

//==========================================================================================================
// MetricsSnapshot
// Purpose: Consistent copy of the collector state.
// Fields:
//   requestsTotal: Number of recorded invocations; always successful + failed.
//   perToolCount: Invocations per tool name.
//   rollingLatencies: Most recent latencies in seconds, oldest first (at most MetricsCollector::kMaxLatencySamples).
//   averageLatency: Mean of rollingLatencies in seconds (0 when empty).
//   startTime: Wall-clock time the collector was created.
//   uptime: now - startTime at snapshot time.
//==========================================================================================================
struct MetricsSnapshot {
    uint64_t requestsTotal{0};
    uint64_t requestsSuccessful{0};
    uint64_t requestsFailed{0};
    std::map<std::string, uint64_t> perToolCount;
    std::deque<double> rollingLatencies;
    double averageLatency{0.0};
    std::chrono::system_clock::time_point startTime{};
    std::chrono::duration<double> uptime{0.0};

    // Percentage of successful invocations: successful / max(1, total) * 100.
    double SuccessRate() const;

    // { requests_total, success_rate, average_response_time_ms, uptime_seconds }
    JSONValue ToSummaryJSON() const;

    // Every counter, per-tool counts, latency sample count and ISO-8601 start time.
    JSONValue ToDetailedJSON() const;
};

//==========================================================================================================
// MetricsCollector
// Purpose: Mutex-guarded accounting shared by all invocation workers.
//==========================================================================================================
class MetricsCollector {
public:
    static constexpr size_t kMaxLatencySamples = 1000;
    // per_tool_count key used for calls naming an unregistered tool.
    static constexpr const char* kUnknownToolBucket = "<unknown>";

    MetricsCollector();
    ~MetricsCollector();

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    //==========================================================================================================
    // Records one finished invocation.
    // Args:
    //   success: Whether the invocation produced a Success result.
    //   elapsed: Wall time spent in the invocation.
    //   tool: Tool name, or kUnknownToolBucket when the name is not registered.
    // Returns:
    //   (none)
    //==========================================================================================================
    void Record(bool success, std::chrono::duration<double> elapsed, const std::string& tool);

    MetricsSnapshot Snapshot() const;

    double SuccessRate() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// ISO-8601 local time with microseconds, e.g. 2025-01-01T12:00:00.000000
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

} // namespace toolhost
