//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server configuration layered from defaults, TOOLHOST_* environment variables and --key=value
//          command-line options
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/SessionLoop.h"

namespace toolhost {

// Tool sets the server binary can expose.
enum class ToolProfile {
    Simple,     // echo, calculate, system_info
    Files,      // file management tools
    Production, // health_check, get_metrics, process_data, system_info
    All
};

const char* toString(ToolProfile profile);
std::optional<ToolProfile> parseToolProfile(const std::string& s);

//==========================================================================================================
// ServerConfig
// Purpose: Everything the server binary needs to assemble a session.
// Environment (overrides defaults):
//   TOOLHOST_NAME, TOOLHOST_VERSION, TOOLHOST_LOG_LEVEL, TOOLHOST_LOG_FILE, TOOLHOST_MAX_REQUEST_SIZE,
//   TOOLHOST_GRACE_PERIOD_MS, TOOLHOST_WORKER_THREADS, TOOLHOST_ENABLE_METRICS,
//   TOOLHOST_ALLOWED_ROOTS (':'-separated), TOOLHOST_PROFILE, TOOLHOST_TRANSPORT, TOOLHOST_STDIO_CONFIG
// Command line (overrides environment):
//   --name= --server-version= --log-level= --log-file= --max-request-size= --grace-period-ms=
//   --workers= --enable-metrics= --allowed-roots= --profile= --transport= --stdiocfg=
//==========================================================================================================
struct ServerConfig {
    std::string name{"production-mcp-server"};
    std::string version{"1.0.0"};
    std::string logLevel{"INFO"};
    std::string logFile;
    std::size_t maxRequestSize{1024 * 1024};
    std::chrono::milliseconds gracePeriod{5000};
    std::size_t workerThreads{4};
    bool enableMetrics{true};
    std::vector<std::string> allowedRoots;
    ToolProfile profile{ToolProfile::All};
    std::string transport{"stdio"};
    std::string transportConfig;

    // Defaults, then environment. Throws std::invalid_argument on malformed values.
    static ServerConfig FromEnvironment();

    // Applies --key=value options on top of this config. Throws std::invalid_argument on malformed
    // values or unknown options.
    void ApplyArgs(int argc, const char* const* argv);

    SessionOptions ToSessionOptions() const;

    // Frame room allowed on top of maxRequestSize for the JSON-RPC envelope around the arguments.
    static constexpr std::size_t kEnvelopeAllowance = 64 * 1024;

    // Transport options for the factory: a max_content_length derived from maxRequestSize, so oversized
    // arguments reach the session's size check, followed by transportConfig (which may override it).
    std::string ToTransportConfig() const;

    // One-line summary for the startup log.
    std::string Describe() const;
};

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--transport")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
std::optional<std::string> getArgValue(int argc, const char* const* argv, const std::string& key);

bool hasFlag(int argc, const char* const* argv, const std::string& flag);

} // namespace toolhost
