//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Server configuration layered from defaults, TOOLHOST_* environment variables and --key=value
//          command-line options
//==========================================================================================================

#include <cctype>
#include <charconv>
#include <limits>
#include <stdexcept>

#include <fmt/core.h>

#include "env/EnvVars.h"
#include "toolhost/Config.h"
#include "toolhost/security/PathGuard.h"

namespace toolhost {

namespace {

std::size_t parseSize(const std::string& key, const std::string& value) {
    std::size_t out = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, out);
    if (value.empty() || ec != std::errc() || ptr != end) {
        throw std::invalid_argument(fmt::format("Invalid value for {}: '{}'", key, value));
    }
    return out;
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "1" || value == "true" || value == "TRUE" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "FALSE" || value == "no" || value == "off") return false;
    throw std::invalid_argument(fmt::format("Invalid boolean for {}: '{}'", key, value));
}

std::string parseLogLevel(const std::string& key, const std::string& value) {
    static const char* const kLevels[] = {"DEBUG", "INFO", "WARN", "WARNING", "ERROR", "FATAL", "CRITICAL"};
    std::string upper;
    for (char c : value) upper.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    for (const char* level : kLevels) {
        if (upper == level) {
            return upper;
        }
    }
    throw std::invalid_argument(fmt::format("Invalid log level for {}: '{}'", key, value));
}

std::vector<std::string> splitRoots(const std::string& value) {
    std::vector<std::string> roots;
    std::size_t start = 0;
    while (start <= value.size()) {
        std::size_t sep = value.find(':', start);
        std::string item = (sep == std::string::npos) ? value.substr(start) : value.substr(start, sep - start);
        if (!item.empty()) { roots.push_back(item); }
        if (sep == std::string::npos) { break; }
        start = sep + 1;
    }
    return roots;
}

// Applies one named setting; shared by the environment and command-line layers.
void applySetting(ServerConfig& cfg, const std::string& setting, const std::string& source, const std::string& value) {
    if (setting == "name") {
        cfg.name = value;
    } else if (setting == "version") {
        cfg.version = value;
    } else if (setting == "log_level") {
        cfg.logLevel = parseLogLevel(source, value);
    } else if (setting == "log_file") {
        cfg.logFile = value;
    } else if (setting == "max_request_size") {
        cfg.maxRequestSize = parseSize(source, value);
        if (cfg.maxRequestSize == 0) {
            throw std::invalid_argument(fmt::format("{} must be positive", source));
        }
    } else if (setting == "grace_period_ms") {
        cfg.gracePeriod = std::chrono::milliseconds(parseSize(source, value));
    } else if (setting == "worker_threads") {
        cfg.workerThreads = parseSize(source, value);
        if (cfg.workerThreads == 0) {
            throw std::invalid_argument(fmt::format("{} must be at least 1", source));
        }
    } else if (setting == "enable_metrics") {
        cfg.enableMetrics = parseBool(source, value);
    } else if (setting == "allowed_roots") {
        cfg.allowedRoots = splitRoots(value);
    } else if (setting == "profile") {
        auto profile = parseToolProfile(value);
        if (!profile) {
            throw std::invalid_argument(fmt::format("Unknown profile for {}: '{}'", source, value));
        }
        cfg.profile = *profile;
    } else if (setting == "transport") {
        if (value != "stdio") {
            throw std::invalid_argument(fmt::format("Unsupported transport for {}: '{}'", source, value));
        }
        cfg.transport = value;
    } else if (setting == "transport_config") {
        cfg.transportConfig = value;
    }
}

struct SettingName {
    const char* setting;
    const char* env;
    const char* arg;
};

constexpr SettingName kSettings[] = {
    {"name", "TOOLHOST_NAME", "--name"},
    {"version", "TOOLHOST_VERSION", "--server-version"},
    {"log_level", "TOOLHOST_LOG_LEVEL", "--log-level"},
    {"log_file", "TOOLHOST_LOG_FILE", "--log-file"},
    {"max_request_size", "TOOLHOST_MAX_REQUEST_SIZE", "--max-request-size"},
    {"grace_period_ms", "TOOLHOST_GRACE_PERIOD_MS", "--grace-period-ms"},
    {"worker_threads", "TOOLHOST_WORKER_THREADS", "--workers"},
    {"enable_metrics", "TOOLHOST_ENABLE_METRICS", "--enable-metrics"},
    {"allowed_roots", "TOOLHOST_ALLOWED_ROOTS", "--allowed-roots"},
    {"profile", "TOOLHOST_PROFILE", "--profile"},
    {"transport", "TOOLHOST_TRANSPORT", "--transport"},
    {"transport_config", "TOOLHOST_STDIO_CONFIG", "--stdiocfg"},
};

} // namespace

const char* toString(ToolProfile profile) {
    switch (profile) {
        case ToolProfile::Simple: return "simple";
        case ToolProfile::Files: return "files";
        case ToolProfile::Production: return "production";
        case ToolProfile::All: return "all";
    }
    return "all";
}

std::optional<ToolProfile> parseToolProfile(const std::string& s) {
    if (s == "simple") return ToolProfile::Simple;
    if (s == "files") return ToolProfile::Files;
    if (s == "production") return ToolProfile::Production;
    if (s == "all") return ToolProfile::All;
    return std::nullopt;
}

ServerConfig ServerConfig::FromEnvironment() {
    ServerConfig cfg;
    for (const auto& s : kSettings) {
        const std::string value = GetEnvOrDefault(s.env, "");
        if (!value.empty()) {
            applySetting(cfg, s.setting, s.env, value);
        }
    }
    if (cfg.allowedRoots.empty()) {
        cfg.allowedRoots = security::DefaultAllowedRoots();
    }
    return cfg;
}

void ServerConfig::ApplyArgs(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        const std::string a = argv[i];
        const std::size_t eq = a.find('=');
        const std::string key = a.substr(0, eq);
        const SettingName* match = nullptr;
        for (const auto& s : kSettings) {
            if (key == s.arg) {
                match = &s;
                break;
            }
        }
        if (match == nullptr) {
            if (key == "--help" || key == "-h" || key == "--version") {
                continue;
            }
            throw std::invalid_argument(fmt::format("Unknown option: {}", a));
        }
        if (eq == std::string::npos) {
            throw std::invalid_argument(fmt::format("Option {} requires a value ({}=<value>)", key, key));
        }
        applySetting(*this, match->setting, key, a.substr(eq + 1));
    }
}

SessionOptions ServerConfig::ToSessionOptions() const {
    SessionOptions opts;
    opts.serverInfo = Implementation{name, version};
    opts.maxRequestSize = maxRequestSize;
    opts.gracePeriod = gracePeriod;
    opts.workerThreads = workerThreads;
    return opts;
}

std::string ServerConfig::ToTransportConfig() const {
    const std::size_t limit = maxRequestSize > std::numeric_limits<std::size_t>::max() - kEnvelopeAllowance
                                  ? std::numeric_limits<std::size_t>::max()
                                  : maxRequestSize + kEnvelopeAllowance;
    std::string out = fmt::format("max_content_length={}", limit);
    if (!transportConfig.empty()) {
        out += ";" + transportConfig;
    }
    return out;
}

std::string ServerConfig::Describe() const {
    std::string roots;
    for (const auto& r : allowedRoots) {
        if (!roots.empty()) roots += ":";
        roots += r;
    }
    return fmt::format("name={} version={} log_level={} max_request_size={} grace_period_ms={} workers={} "
                       "metrics={} profile={} transport={} allowed_roots={}",
                       name, version, logLevel, maxRequestSize, gracePeriod.count(), workerThreads,
                       enableMetrics, toString(profile), transport, roots);
}

std::optional<std::string> getArgValue(int argc, const char* const* argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

bool hasFlag(int argc, const char* const* argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

} // namespace toolhost
