//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Tool server binary: configuration, tool profile registration, stdio session and graceful
//          shutdown on SIGINT/SIGTERM
//==========================================================================================================

#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "logging/Logger.h"
#include "toolhost/Config.h"
#include "toolhost/MetricsCollector.h"
#include "toolhost/SessionLoop.h"
#include "toolhost/ShutdownCoordinator.hpp"
#include "toolhost/StdioTransport.hpp"
#include "toolhost/ToolRegistry.h"
#include "toolhost/security/PathGuard.h"
#include "toolhost/tools/BuiltinTools.h"
#include "toolhost/version.h"

using namespace toolhost;

static void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [--key=value ...]\n"
              << "  --name=<server name>            (TOOLHOST_NAME)\n"
              << "  --server-version=<version>      (TOOLHOST_VERSION)\n"
              << "  --log-level=DEBUG|INFO|WARN|ERROR (TOOLHOST_LOG_LEVEL)\n"
              << "  --log-file=<path>               (TOOLHOST_LOG_FILE)\n"
              << "  --max-request-size=<bytes>      (TOOLHOST_MAX_REQUEST_SIZE)\n"
              << "  --grace-period-ms=<ms>          (TOOLHOST_GRACE_PERIOD_MS)\n"
              << "  --workers=<n>                   (TOOLHOST_WORKER_THREADS)\n"
              << "  --enable-metrics=true|false     (TOOLHOST_ENABLE_METRICS)\n"
              << "  --allowed-roots=<dir:dir:...>   (TOOLHOST_ALLOWED_ROOTS)\n"
              << "  --profile=simple|files|production|all (TOOLHOST_PROFILE)\n"
              << "  --transport=stdio               (TOOLHOST_TRANSPORT)\n"
              << "  --stdiocfg=<k=v;...>            (TOOLHOST_STDIO_CONFIG)\n"
              << "  --version, --help\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argv[0]);
        return 0;
    }
    if (hasFlag(argc, argv, "--version")) {
        std::cout << "toolhost " << getVersionString() << std::endl;
        return 0;
    }

    // stdout carries protocol frames from here on
    Logger::setStdioMode(true);

    ServerConfig cfg;
    try {
        cfg = ServerConfig::FromEnvironment();
        cfg.ApplyArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        return 2;
    }

    Logger::setLogLevelFromString(cfg.logLevel);
    if (!cfg.logFile.empty()) {
        Logger::setLogFile(cfg.logFile);
    }
    LOG_INFO("Starting {} {} ({})", cfg.name, cfg.version, cfg.Describe());

    try {
        auto guard = std::make_shared<const security::PathGuard>(cfg.allowedRoots);
        MetricsCollector metrics;
        ToolRegistry registry;
        tools::RegisterProfileTools(registry, cfg.profile, cfg.enableMetrics ? &metrics : nullptr, cfg.version, guard);

        ShutdownCoordinator shutdown;
        StdioTransportFactory factory;
        auto transport = factory.CreateTransport(cfg.ToTransportConfig());

        SessionLoop session(registry, metrics, cfg.ToSessionOptions());
        session.Start(std::move(transport)).get();
        LOG_INFO("Serving {} tools over {}", registry.Size(), cfg.transport);

        MetricsSnapshot summary = session.Run(shutdown.GetToken()).get();
        LOG_INFO("Server stopped after {:.2f}s: {} requests ({} ok, {} failed)", summary.uptime.count(),
                 summary.requestsTotal, summary.requestsSuccessful, summary.requestsFailed);
    } catch (const std::exception& e) {
        LOG_ERROR("Server error: {}", e.what());
        return 1;
    }
    return 0;
}
