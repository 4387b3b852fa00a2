//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltinTools.h
// Purpose: Registration of the built-in tool set (core, operational and file management tools)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "toolhost/Config.h"

namespace toolhost {

class ToolRegistry;
class MetricsCollector;

namespace security {
class PathGuard;
}

namespace tools {

///////////////////////////////////////// Core tools ///////////////////////////////////////////
// echo {message}: "Echo: <message>"
void RegisterEcho(ToolRegistry& registry);

// calculate {operation: add|subtract|multiply|divide, a, b}: "Result: <a> <operation> <b> = <result>"
void RegisterCalculate(ToolRegistry& registry);

// system_info {}: platform, cpu, memory and disk figures as JSON
void RegisterSystemInfo(ToolRegistry& registry);

// process_data {data, operation: analyze|transform|validate}
void RegisterProcessData(ToolRegistry& registry);

///////////////////////////////////////// Operational tools ///////////////////////////////////////////
// health_check {}: status, timestamp, uptime, version and request figures
void RegisterHealthCheck(ToolRegistry& registry, const MetricsCollector& metrics, const std::string& version);

// get_metrics {detailed = false}: summary or full metrics snapshot
void RegisterGetMetrics(ToolRegistry& registry, const MetricsCollector& metrics);

///////////////////////////////////////// File tools ///////////////////////////////////////////
// read_file, write_file, list_directory, search_files, get_file_info, create_directory. Every tool
// checks its path(s) with the guard first and fails with AccessDenied otherwise.
void RegisterFileTools(ToolRegistry& registry, std::shared_ptr<const security::PathGuard> guard);

//==========================================================================================================
// Registers the tools of a profile. Operational tools are skipped when metrics is null (metrics
// disabled); system_info is registered once even when several profiles include it.
// Args:
//   registry: Target registry (not yet frozen).
//   profile: Tool set to expose.
//   metrics: Collector backing health_check/get_metrics, or nullptr.
//   version: Version reported by health_check.
//   guard: Allow-list used by the file tools.
//==========================================================================================================
void RegisterProfileTools(ToolRegistry& registry, ToolProfile profile, const MetricsCollector* metrics,
                          const std::string& version, std::shared_ptr<const security::PathGuard> guard);

} // namespace tools
} // namespace toolhost
