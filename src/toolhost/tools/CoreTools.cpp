//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CoreTools.cpp
// Purpose: Core and operational built-in tools (echo, calculate, system_info, process_data,
//          health_check, get_metrics)
//==========================================================================================================

#include <sys/statvfs.h>
#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <thread>

#include <fmt/core.h>

#include "logging/Logger.h"
#include "toolhost/MetricsCollector.h"
#include "toolhost/ToolRegistry.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/security/PathGuard.h"
#include "toolhost/tools/BuiltinTools.h"
#include "toolhost/tools/SchemaBuilder.h"

namespace toolhost {
namespace tools {

using errors::ErrorKind;
using errors::ToolError;

namespace {

constexpr std::size_t kMaxProcessDataLength = 10000;
constexpr std::size_t kPreviewLength = 100;

double roundTo(double v, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(v * scale) / scale;
}

// Integral doubles keep a trailing ".0" so "7 / 2" and "6 / 2" read alike.
std::string formatNumber(double v) {
    if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 1e16) {
        return fmt::format("{:.1f}", v);
    }
    return fmt::format("{}", v);
}

std::string formatNumber(const JSONValue& v) {
    if (const auto* i = std::get_if<int64_t>(&v.value)) {
        return fmt::format("{}", *i);
    }
    return formatNumber(std::get<double>(v.value));
}

double asDouble(const JSONValue& v) {
    if (const auto* i = std::get_if<int64_t>(&v.value)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(v.value);
}

const JSONValue& requireArg(const JSONValue& args, const std::string& key) {
    const JSONValue* v = args.find(key);
    if (v == nullptr) {
        throw ToolError(ErrorKind::ValidationError, "Missing required field: " + key);
    }
    return *v;
}

// Splits UTF-8 text into code points so length and truncation count characters, not bytes.
std::vector<std::string> codePoints(const std::string& s) {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < s.size();) {
        std::size_t len = 1;
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        out.push_back(s.substr(i, len));
        i += len;
    }
    return out;
}

std::string preview(const std::vector<std::string>& cps) {
    std::string out;
    const std::size_t n = std::min(cps.size(), kPreviewLength);
    for (std::size_t i = 0; i < n; ++i) out += cps[i];
    if (cps.size() > kPreviewLength) out += "...";
    return out;
}

std::string toUpperAscii(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) return std::string();
    const auto last = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(first, last - first + 1);
}

ToolOutput titledJSON(const std::string& title, const JSONValue& body) {
    return {makeText(title + ":\n" + serializeJSONValuePretty(body))};
}

} // namespace

///////////////////////////////////////// echo ///////////////////////////////////////////
void RegisterEcho(ToolRegistry& registry) {
    ToolSpec spec{"echo", "Echo back the input message",
                  SchemaBuilder().property("message", "string", "Message to echo back").required({"message"}).build()};
    registry.Register(std::move(spec), [](const JSONValue& args, std::stop_token) -> ToolOutput {
        return {makeText("Echo: " + getStringOr(args, "message", ""))};
    });
}

///////////////////////////////////////// calculate ///////////////////////////////////////////
void RegisterCalculate(ToolRegistry& registry) {
    ToolSpec spec{"calculate", "Perform basic mathematical calculations",
                  SchemaBuilder()
                      .property("operation", "string", "Mathematical operation to perform")
                      .withEnum({"add", "subtract", "multiply", "divide"})
                      .property("a", "number", "First number")
                      .property("b", "number", "Second number")
                      .required({"operation", "a", "b"})
                      .build()};
    registry.Register(std::move(spec), [](const JSONValue& args, std::stop_token) -> ToolOutput {
        const std::string op = getStringOr(args, "operation", "");
        const JSONValue& a = requireArg(args, "a");
        const JSONValue& b = requireArg(args, "b");

        std::string result;
        const auto* ia = std::get_if<int64_t>(&a.value);
        const auto* ib = std::get_if<int64_t>(&b.value);
        int64_t exact = 0;
        if (op == "divide") {
            if (asDouble(b) == 0.0) {
                throw ToolError(ErrorKind::ExecutionError, "Division by zero");
            }
            result = formatNumber(asDouble(a) / asDouble(b));
        } else if (ia != nullptr && ib != nullptr && op == "add" && !__builtin_add_overflow(*ia, *ib, &exact)) {
            result = fmt::format("{}", exact);
        } else if (ia != nullptr && ib != nullptr && op == "subtract" && !__builtin_sub_overflow(*ia, *ib, &exact)) {
            result = fmt::format("{}", exact);
        } else if (ia != nullptr && ib != nullptr && op == "multiply" && !__builtin_mul_overflow(*ia, *ib, &exact)) {
            result = fmt::format("{}", exact);
        } else if (op == "add") {
            result = formatNumber(asDouble(a) + asDouble(b));
        } else if (op == "subtract") {
            result = formatNumber(asDouble(a) - asDouble(b));
        } else if (op == "multiply") {
            result = formatNumber(asDouble(a) * asDouble(b));
        } else {
            throw ToolError(ErrorKind::ExecutionError, "Unknown operation '" + op + "'");
        }
        return {makeText(fmt::format("Result: {} {} {} = {}", formatNumber(a), op, formatNumber(b), result))};
    });
}

///////////////////////////////////////// system_info ///////////////////////////////////////////
void RegisterSystemInfo(ToolRegistry& registry) {
    ToolSpec spec{"system_info", "Get system information and status", SchemaBuilder().noAdditionalProperties().build()};
    registry.Register(std::move(spec), [](const JSONValue&, std::stop_token) -> ToolOutput {
        constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;
        JSONValue::Object info;

        struct utsname uts{};
        if (::uname(&uts) == 0) {
            setField(info, "platform", JSONValue(fmt::format("{}-{}-{}", uts.sysname, uts.release, uts.machine)));
            setField(info, "architecture", JSONValue(uts.machine));
            setField(info, "hostname", JSONValue(uts.nodename));
        } else {
            LOG_WARN("system_info: uname failed (errno={})", errno);
        }
        setField(info, "cpu_count", JSONValue(static_cast<int64_t>(std::thread::hardware_concurrency())));

        struct sysinfo si{};
        if (::sysinfo(&si) == 0) {
            const double unit = static_cast<double>(si.mem_unit);
            setField(info, "memory_total_gb", JSONValue(roundTo(static_cast<double>(si.totalram) * unit / kGiB, 2)));
            setField(info, "memory_available_gb",
                     JSONValue(roundTo(static_cast<double>(si.freeram + si.bufferram) * unit / kGiB, 2)));
        } else {
            LOG_WARN("system_info: sysinfo failed (errno={})", errno);
        }

        struct statvfs vfs{};
        if (::statvfs("/", &vfs) == 0) {
            setField(info, "disk_usage_gb",
                     JSONValue(roundTo(static_cast<double>(vfs.f_blocks) * static_cast<double>(vfs.f_frsize) / kGiB, 2)));
        }
        setField(info, "process_id", JSONValue(static_cast<int64_t>(::getpid())));
        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        setField(info, "current_directory", JSONValue(ec ? std::string("unknown") : cwd.string()));
        return titledJSON("System Information", JSONValue(std::move(info)));
    });
}

///////////////////////////////////////// process_data ///////////////////////////////////////////
void RegisterProcessData(ToolRegistry& registry) {
    ToolSpec spec{"process_data", "Process data with validation and error handling",
                  SchemaBuilder()
                      .property("data", "string", "Data to process")
                      .withMaxLength(static_cast<int64_t>(kMaxProcessDataLength))
                      .property("operation", "string", "Operation to perform")
                      .withEnum({"analyze", "transform", "validate"})
                      .required({"data", "operation"})
                      .build()};
    registry.Register(std::move(spec), [](const JSONValue& args, std::stop_token) -> ToolOutput {
        const std::string data = getStringOr(args, "data", "");
        const std::string op = getStringOr(args, "operation", "");
        if (data.empty()) {
            throw ToolError(ErrorKind::ExecutionError, "Data parameter is required");
        }
        const auto cps = codePoints(data);
        if (cps.size() > kMaxProcessDataLength) {
            throw ToolError(ErrorKind::ExecutionError, "Data size too large (max 10KB)");
        }

        JSONValue::Object result;
        setField(result, "operation", JSONValue(op));
        if (op == "analyze") {
            int64_t words = 0;
            bool inWord = false;
            bool digits = false;
            bool upper = false;
            for (unsigned char c : data) {
                const bool space = std::isspace(c) != 0;
                if (!space && !inWord) ++words;
                inWord = !space;
                digits = digits || std::isdigit(c) != 0;
                upper = upper || std::isupper(c) != 0;
            }
            setField(result, "data_length", JSONValue(static_cast<int64_t>(cps.size())));
            setField(result, "word_count", JSONValue(words));
            setField(result, "contains_numbers", JSONValue(digits));
            setField(result, "contains_uppercase", JSONValue(upper));
        } else if (op == "transform") {
            setField(result, "original", JSONValue(preview(cps)));
            setField(result, "transformed", JSONValue(preview(codePoints(toUpperAscii(data)))));
            setField(result, "length_change", JSONValue(static_cast<int64_t>(0)));
        } else if (op == "validate") {
            const bool valid = !trim(data).empty();
            JSONValue::Array problems;
            if (!valid) {
                problems.push_back(std::make_shared<JSONValue>("Empty or whitespace-only data"));
            }
            setField(result, "is_valid", JSONValue(valid));
            setField(result, "validation_errors", JSONValue(std::move(problems)));
            setField(result, "data_type", JSONValue("string"));
            setField(result, "encoding", JSONValue("utf-8"));
        } else {
            throw ToolError(ErrorKind::ExecutionError, "Unknown operation: " + op);
        }
        return titledJSON("Data Processing Result", JSONValue(std::move(result)));
    });
}

///////////////////////////////////////// health_check ///////////////////////////////////////////
void RegisterHealthCheck(ToolRegistry& registry, const MetricsCollector& metrics, const std::string& version) {
    ToolSpec spec{"health_check", "Check server health and status", SchemaBuilder().noAdditionalProperties().build()};
    registry.Register(std::move(spec), [&metrics, version](const JSONValue&, std::stop_token) -> ToolOutput {
        const MetricsSnapshot snap = metrics.Snapshot();
        JSONValue::Object health;
        setField(health, "status", JSONValue("healthy"));
        setField(health, "timestamp", JSONValue(formatTimestamp(std::chrono::system_clock::now())));
        setField(health, "uptime_seconds", JSONValue(roundTo(snap.uptime.count(), 2)));
        setField(health, "version", JSONValue(version));
        setField(health, "requests_processed", JSONValue(static_cast<int64_t>(snap.requestsTotal)));
        setField(health, "success_rate", JSONValue(roundTo(snap.SuccessRate(), 2)));
        return titledJSON("Health Check", JSONValue(std::move(health)));
    });
}

///////////////////////////////////////// get_metrics ///////////////////////////////////////////
void RegisterGetMetrics(ToolRegistry& registry, const MetricsCollector& metrics) {
    ToolSpec spec{"get_metrics", "Get server performance metrics",
                  SchemaBuilder()
                      .property("detailed", "boolean", "Include detailed metrics")
                      .withDefault(JSONValue(false))
                      .build()};
    registry.Register(std::move(spec), [&metrics](const JSONValue& args, std::stop_token) -> ToolOutput {
        const MetricsSnapshot snap = metrics.Snapshot();
        const bool detailed = getBoolOr(args, "detailed", false);
        return titledJSON("Server Metrics", detailed ? snap.ToDetailedJSON() : snap.ToSummaryJSON());
    });
}

///////////////////////////////////////// Profiles ///////////////////////////////////////////
void RegisterProfileTools(ToolRegistry& registry, ToolProfile profile, const MetricsCollector* metrics,
                          const std::string& version, std::shared_ptr<const security::PathGuard> guard) {
    const bool simple = profile == ToolProfile::Simple || profile == ToolProfile::All;
    const bool production = profile == ToolProfile::Production || profile == ToolProfile::All;
    const bool files = profile == ToolProfile::Files || profile == ToolProfile::All;

    if (simple) {
        RegisterEcho(registry);
        RegisterCalculate(registry);
    }
    if (simple || production) {
        RegisterSystemInfo(registry);
    }
    if (production) {
        if (metrics != nullptr) {
            RegisterHealthCheck(registry, *metrics, version);
            RegisterGetMetrics(registry, *metrics);
        } else {
            LOG_INFO("Metrics disabled; health_check and get_metrics not registered");
        }
        RegisterProcessData(registry);
    }
    if (files) {
        RegisterFileTools(registry, std::move(guard));
    }
    LOG_INFO("Registered {} tools for profile '{}'", registry.Size(), toString(profile));
}

} // namespace tools
} // namespace toolhost
