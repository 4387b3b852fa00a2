//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MetricsCollector.cpp
// Purpose: Process-wide invocation counters and rolling latency statistics
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <ctime>
#include <mutex>
#include <numeric>

#include <fmt/core.h>

#include "logging/Logger.h"
#include "toolhost/MetricsCollector.h"

namespace toolhost {

namespace {
JSONValue num(uint64_t v) { return JSONValue(static_cast<int64_t>(v)); }

// Rounds to the given number of decimals.
double roundTo(double v, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(v * scale) / scale;
}
} // namespace

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() % 1000000;
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return fmt::format("{}.{:06d}", buf, static_cast<long long>(micros < 0 ? micros + 1000000 : micros));
}

double MetricsSnapshot::SuccessRate() const {
    return static_cast<double>(requestsSuccessful) / static_cast<double>(std::max<uint64_t>(1, requestsTotal)) * 100.0;
}

JSONValue MetricsSnapshot::ToSummaryJSON() const {
    JSONValue::Object obj;
    setField(obj, "requests_total", num(requestsTotal));
    setField(obj, "success_rate", JSONValue(roundTo(SuccessRate(), 2)));
    setField(obj, "average_response_time_ms", JSONValue(roundTo(averageLatency * 1000.0, 2)));
    setField(obj, "uptime_seconds", JSONValue(roundTo(uptime.count(), 2)));
    return JSONValue(std::move(obj));
}

JSONValue MetricsSnapshot::ToDetailedJSON() const {
    JSONValue::Object perTool;
    for (const auto& [name, count] : perToolCount) {
        setField(perTool, name, num(count));
    }
    JSONValue::Object obj;
    setField(obj, "requests_total", num(requestsTotal));
    setField(obj, "requests_successful", num(requestsSuccessful));
    setField(obj, "requests_failed", num(requestsFailed));
    setField(obj, "success_rate", JSONValue(roundTo(SuccessRate(), 2)));
    setField(obj, "average_response_time_ms", JSONValue(roundTo(averageLatency * 1000.0, 2)));
    setField(obj, "tool_usage", JSONValue(std::move(perTool)));
    setField(obj, "latency_samples", JSONValue(static_cast<int64_t>(rollingLatencies.size())));
    setField(obj, "uptime_seconds", JSONValue(roundTo(uptime.count(), 2)));
    setField(obj, "start_time", JSONValue(formatTimestamp(startTime)));
    return JSONValue(std::move(obj));
}

class MetricsCollector::Impl {
public:
    mutable std::mutex mutex;
    MetricsSnapshot state;
    double latencySum{0.0};
    std::chrono::steady_clock::time_point startSteady{std::chrono::steady_clock::now()};
};

MetricsCollector::MetricsCollector() : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
    pImpl->state.startTime = std::chrono::system_clock::now();
}

MetricsCollector::~MetricsCollector() { FUNC_SCOPE(); }

void MetricsCollector::Record(bool success, std::chrono::duration<double> elapsed, const std::string& tool) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto& s = pImpl->state;
    ++s.requestsTotal;
    if (success) {
        ++s.requestsSuccessful;
    } else {
        ++s.requestsFailed;
    }
    ++s.perToolCount[tool];

    const double seconds = std::max(0.0, elapsed.count());
    s.rollingLatencies.push_back(seconds);
    pImpl->latencySum += seconds;
    if (s.rollingLatencies.size() > kMaxLatencySamples) {
        pImpl->latencySum -= s.rollingLatencies.front();
        s.rollingLatencies.pop_front();
    }
    // Periodic resum bounds floating-point drift in the running total.
    if (s.requestsTotal % kMaxLatencySamples == 0) {
        pImpl->latencySum = std::accumulate(s.rollingLatencies.begin(), s.rollingLatencies.end(), 0.0);
    }
    s.averageLatency = s.rollingLatencies.empty() ? 0.0
                                                  : pImpl->latencySum / static_cast<double>(s.rollingLatencies.size());
}

MetricsSnapshot MetricsCollector::Snapshot() const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    MetricsSnapshot copy = pImpl->state;
    copy.uptime = std::chrono::steady_clock::now() - pImpl->startSteady;
    return copy;
}

double MetricsCollector::SuccessRate() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->state.SuccessRate();
}

} // namespace toolhost
